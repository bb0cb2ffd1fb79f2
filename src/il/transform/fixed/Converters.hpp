//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/fixed/Converters.hpp
// Purpose: Per-category instruction converters of the fixed-point transform.
// Key invariants: Each converter checks the operand layout it relies on and
//                 reports InstructionShapeMismatch instead of guessing.
//                 Source result ids are defined again in the output.
// Ownership/Lifetime: Stateless free functions.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/transform/TransformContext.hpp"
#include "il/transform/fixed/FixedPointTransform.hpp"

#include <string>

namespace il::transform::lowering
{

TransformResult<void> convertConstant(FixedPointTransform &t, TransformContext &ctx, const il::core::Instr &in);
TransformResult<void> convertFloatArith(FixedPointTransform &t, TransformContext &ctx, const il::core::Instr &in);
TransformResult<void> convertFloatCompare(FixedPointTransform &t, TransformContext &ctx, const il::core::Instr &in);
TransformResult<void> convertPassthrough(FixedPointTransform &t, TransformContext &ctx, const il::core::Instr &in);
TransformResult<void> convertConversion(FixedPointTransform &t, TransformContext &ctx, const il::core::Instr &in);
TransformResult<void> convertMemory(FixedPointTransform &t, TransformContext &ctx, const il::core::Instr &in);
TransformResult<void> convertCall(FixedPointTransform &t, TransformContext &ctx, const il::core::Instr &in);
TransformResult<void> convertControl(FixedPointTransform &t, TransformContext &ctx, const il::core::Instr &in);

/// @brief Fail unless @p in has exactly @p operands operands and @p results results.
TransformResult<void> expectShape(const TransformContext &ctx,
                                  const il::core::Instr &in,
                                  size_t operands,
                                  size_t results);

} // namespace il::transform::lowering
