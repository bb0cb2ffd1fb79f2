//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/fixed/FixedPointTransform.hpp
// Purpose: Rewrites float-domain IL into Q16.16 fixed-point IL.
// Key invariants: f32 and f64 values become i32; integer, boolean and pointer
//                 values are untouched.  Dispatch goes through a converter
//                 table indexed by opcode category; a category without a
//                 converter fails with UnsupportedInstruction.
// Ownership/Lifetime: Borrows the builtin registry and target description,
//                     which must outlive the transform.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/abi/Target.hpp"
#include "il/builtins/BuiltinRegistry.hpp"
#include "il/core/OpcodeInfo.hpp"
#include "il/fixed/FixedPoint.hpp"
#include "il/transform/FunctionTransform.hpp"

#include <array>

namespace il::transform
{

class FixedPointTransform final : public FunctionTransform
{
  public:
    using Converter = TransformResult<void> (*)(FixedPointTransform &, TransformContext &, const il::core::Instr &);

    FixedPointTransform(const il::builtins::BuiltinRegistry &registry,
                        const qshade::codegen::abi::TargetInfo &target,
                        il::fixed::FixedPointFormat format = il::fixed::FixedPointFormat::Fixed16x16);

    [[nodiscard]] const char *name() const override
    {
        return "fixed32";
    }

    [[nodiscard]] il::core::Type mapType(il::core::Type type) const override;

    [[nodiscard]] il::core::Value mapImmediate(const il::core::Value &value) const override;

    TransformResult<void> beginModule(TransformSession &session) override;

    TransformResult<void> transformInstr(TransformContext &ctx, const il::core::Instr &in) override;

    const il::builtins::BuiltinRegistry &registry() const
    {
        return registry_;
    }

    const qshade::codegen::abi::TargetInfo &target() const
    {
        return target_;
    }

    il::fixed::FixedPointFormat format() const
    {
        return format_;
    }

    /// @brief Converter registered for @p category, or nullptr.
    static Converter converterFor(il::core::OpcodeCategory category);

  private:
    const il::builtins::BuiltinRegistry &registry_;
    const qshade::codegen::abi::TargetInfo &target_;
    il::fixed::FixedPointFormat format_;
};

} // namespace il::transform
