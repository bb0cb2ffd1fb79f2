//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/abi/ReturnAbi.hpp
// Purpose: Decides how a callee's return values travel on a target and emits
//          the matching IL call sequence.
// Key invariants: A plan either lists one register location per return value
//                 or describes a caller-owned buffer holding value i at byte
//                 offset i * elementSize.  The decision matches what the
//                 target's C compiler does for a struct of the same lanes.
// Ownership/Lifetime: Plans are values; emission appends to a caller-owned
//                     function through an IRBuilder.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/abi/Target.hpp"
#include "il/core/Signature.hpp"
#include "il/core/Value.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <vector>

namespace il::build
{
class IRBuilder;
}

namespace il::core
{
struct Function;
}

namespace qshade::codegen::abi
{

enum class ReturnMethod
{
    Registers,
    StructReturn
};

/// @brief Where one return value lives when returned in registers.
/// @details Lanes narrower than a register are packed: value i of a 3 x i32
///          return on x86-64 sits in rax at offset 0 and 4 and in rdx at 0.
struct ReturnLocation
{
    RegClass regClass{RegClass::Integer};
    unsigned regIndex{0};
    unsigned byteOffset{0};
};

struct ReturnPlan
{
    ReturnMethod method{ReturnMethod::Registers};
    std::vector<il::core::Type> types;
    std::vector<ReturnLocation> locations; ///< Registers only; one per value.
    unsigned elementSize{0};
    unsigned bufferSize{0};  ///< StructReturn only: count * elementSize.
    unsigned bufferAlign{0}; ///< StructReturn only: elementSize.
    bool sretInRegister{false};

    [[nodiscard]] bool usesStructReturn() const
    {
        return method == ReturnMethod::StructReturn;
    }

    /// @brief Byte offset of value @p index inside the return buffer.
    [[nodiscard]] unsigned bufferOffset(size_t index) const
    {
        return static_cast<unsigned>(index) * elementSize;
    }
};

/// @brief Classify @p returnTypes for @p target.
/// @details Multiple returns must share one element type; mixed lists are
///          rejected.  A single return value always travels in a register.
il::support::Expected<ReturnPlan> classifyReturns(const std::vector<il::core::Type> &returnTypes,
                                                  const TargetInfo &target);

/// @brief Signature a caller must use for @p sig on @p target.
/// @details When the plan is StructReturn, a ptr parameter with purpose
///          StructReturn is inserted first and the returns are cleared.
il::support::Expected<il::core::Signature> legalizeSignature(const il::core::Signature &sig,
                                                             const TargetInfo &target);

/// @brief Emit a call of @p callee returning the values described by @p plan.
/// @details The StructReturn path reserves a stack slot in @p fn, passes its
///          address ahead of @p args, calls and loads each value back.  The
///          register path issues one call with one result per value.
///          When @p resultIds is non-empty, value i is defined with id
///          resultIds[i] instead of a fresh temporary.
/// @return The call's return values in order.
std::vector<il::core::Value> emitMultiReturnCall(il::build::IRBuilder &builder,
                                                 il::core::Function &fn,
                                                 const std::string &callee,
                                                 const ReturnPlan &plan,
                                                 std::vector<il::core::Value> args,
                                                 const std::vector<unsigned> &resultIds = {});

/// @brief Render @p plan as one line, e.g. "registers rax+0 rax+4 rdx+0".
std::string describe(const ReturnPlan &plan, const TargetInfo &target);

} // namespace qshade::codegen::abi
