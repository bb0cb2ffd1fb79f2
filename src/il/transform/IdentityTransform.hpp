//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/IdentityTransform.hpp
// Purpose: Transform that copies every instruction unchanged.
// Key invariants: The printed output is identical to the printed input.
// Ownership/Lifetime: Stateless.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/transform/FunctionTransform.hpp"

namespace il::transform
{

/// @brief Structural reference for the rewrite driver.
/// @details Exercises block mapping, stack-slot copying and operand mapping
///          without changing any type or value.
class IdentityTransform final : public FunctionTransform
{
  public:
    [[nodiscard]] const char *name() const override
    {
        return "identity";
    }

    [[nodiscard]] il::core::Type mapType(il::core::Type type) const override
    {
        return type;
    }

    [[nodiscard]] il::core::Value mapImmediate(const il::core::Value &value) const override
    {
        return value;
    }

    TransformResult<void> beginModule(TransformSession &session) override;

    TransformResult<void> transformInstr(TransformContext &ctx, const il::core::Instr &in) override;
};

} // namespace il::transform
