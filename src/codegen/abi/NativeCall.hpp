//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/abi/NativeCall.hpp
// Purpose: Calls a natively compiled function by address following a
//          ReturnPlan, the way generated code would.
// Key invariants: Only the running host's plan can be invoked; arguments are
//                 0 to 4 values of a single scalar type (i32 or f32).
// Ownership/Lifetime: The caller owns @p out, which must hold
//                     plan.types.size() * plan.elementSize bytes.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/abi/ReturnAbi.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace qshade::codegen::abi
{

/// @brief Largest argument count invokeNative accepts (one vec4).
inline constexpr std::size_t kMaxNativeArgs = 4;

/// @brief One scalar argument for invokeNative.
struct NativeArg
{
    il::core::Type type{il::core::Type::Kind::I32};
    union
    {
        int32_t i32;
        float f32;
    };

    static NativeArg fromI32(int32_t v)
    {
        NativeArg a;
        a.type = il::core::Type(il::core::Type::Kind::I32);
        a.i32 = v;
        return a;
    }

    static NativeArg fromF32(float v)
    {
        NativeArg a;
        a.type = il::core::Type(il::core::Type::Kind::F32);
        a.f32 = v;
        return a;
    }
};

/// @brief Invoke @p fn with @p args and scatter its return values into @p out.
/// @details Value i is written at out + plan.bufferOffset(i).  Register plans
///          read the return registers through a same-sized aggregate return;
///          struct-return plans pass @p out as the hidden buffer argument.
/// @return Error when the plan cannot be honoured from C++ on this host.
il::support::Expected<void> invokeNative(const void *fn,
                                         const ReturnPlan &plan,
                                         const TargetInfo &target,
                                         const std::vector<NativeArg> &args,
                                         void *out);

} // namespace qshade::codegen::abi
