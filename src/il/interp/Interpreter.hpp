//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/interp/Interpreter.hpp
// Purpose: Reference interpreter executing IL of either numeric domain.
// Key invariants: Integer slots hold values sign-extended from their type's
//                 width (i1 holds 0 or 1).  f32 values are held as the double
//                 nearest the f32 result of each operation.  Stack slots are
//                 host memory owned by the active frame.
// Ownership/Lifetime: Borrows the module and registry; both must outlive the
//                     interpreter.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/builtins/BuiltinRegistry.hpp"
#include "il/core/Module.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace il::interp
{

/// @brief Runtime slot capable of holding one IL value.
/// @invariant Only one member is valid based on the value's type.
union Slot
{
    int64_t i64;
    double f64;
    void *ptr;

    static Slot fromInt(int64_t v)
    {
        Slot s;
        s.i64 = v;
        return s;
    }

    static Slot fromFloat(double v)
    {
        Slot s;
        s.f64 = v;
        return s;
    }

    static Slot fromPtr(void *p)
    {
        Slot s;
        s.ptr = p;
        return s;
    }
};

static_assert(sizeof(Slot) == 8, "Slot must stay 8 bytes");
static_assert(std::is_trivially_copyable_v<Slot>, "Slot must be trivially copyable");

class Interpreter
{
  public:
    /// @param registry Source of native bindings for extern calls; may be null
    ///        when the module calls no externs.
    explicit Interpreter(const il::core::Module &module, const il::builtins::BuiltinRegistry *registry = nullptr);

    /// @brief Execute function @p name with @p args.
    /// @return One slot per return value, or a diagnostic describing the trap.
    il::support::Expected<std::vector<Slot>> call(const std::string &name, const std::vector<Slot> &args);

    /// @brief Abort execution after @p steps instructions (0 disables the limit).
    void setStepLimit(uint64_t steps)
    {
        stepLimit_ = steps;
    }

    /// @brief Instructions executed by the last call().
    uint64_t steps() const
    {
        return steps_;
    }

  private:
    struct FunctionInfo
    {
        std::vector<il::core::Type> types; ///< Indexed by temporary id.
        std::unordered_map<std::string, size_t> blocks;
    };

    const FunctionInfo &infoFor(const il::core::Function &fn);

    il::support::Expected<std::vector<Slot>> run(const il::core::Function &fn,
                                                 const std::vector<Slot> &args,
                                                 unsigned depth);

    il::support::Expected<std::vector<Slot>> callExtern(const il::core::Extern &ext,
                                                        const std::vector<Slot> &args);

    const il::core::Module &module_;
    const il::builtins::BuiltinRegistry *registry_;
    std::unordered_map<const il::core::Function *, FunctionInfo> infos_;
    uint64_t stepLimit_ = 50'000'000;
    uint64_t steps_ = 0;
};

} // namespace il::interp
