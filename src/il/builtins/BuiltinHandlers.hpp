//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/builtins/BuiltinHandlers.hpp
// Purpose: Handler template bridging boxed interpreter arguments to typed
//          native builtin calls.
// Key invariants: Instantiations match the BuiltinHandler signature.
// Ownership/Lifetime: Instantiated at compile time; no state.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

namespace il::builtins
{

/// @brief Adapter that invokes a native builtin from a boxed argument array.
/// @details args[I] is reinterpreted as a pointer to the I-th declared
///          parameter type.  Non-void results (scalars or lane structs) are
///          stored through @p result.
template <auto Fn, typename Ret, typename... Args> struct DirectHandler
{
    static void invoke(void **args, void *result)
    {
        call(args, result, std::index_sequence_for<Args...>{});
    }

  private:
    template <std::size_t... I> static void call(void **args, void *result, std::index_sequence<I...>)
    {
        if constexpr (std::is_void_v<Ret>)
        {
            Fn(*reinterpret_cast<Args *>(args[I])...);
        }
        else
        {
            Ret value = Fn(*reinterpret_cast<Args *>(args[I])...);
            *reinterpret_cast<Ret *>(result) = value;
        }
    }
};

} // namespace il::builtins
