//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/TransformDriver.hpp
// Purpose: Generic function and module rewrite loops shared by every
//          FunctionTransform.
// Key invariants: Output block order, labels, parameter arity and stack-slot
//                 layout mirror the input.  Failure is atomic: no partially
//                 rewritten function is ever returned.
// Ownership/Lifetime: Returned functions and modules are owned by the caller.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Module.hpp"
#include "il/transform/FunctionTransform.hpp"
#include "il/transform/TransformContext.hpp"

#include <ostream>

namespace il::transform
{

/// @brief Rewrite @p source through @p transform.
/// @details Creates every block first (parameters re-typed through the
///          transform), copies stack slots one for one, then visits blocks
///          and instructions in order.  Stops at the first error.
TransformResult<il::core::Function> transformFunctionBody(TransformSession &session,
                                                          FunctionTransform &transform,
                                                          const il::core::Function &source,
                                                          il::core::Signature newSig);

/// @brief Append @p in unchanged apart from operand, label and slot mapping.
TransformResult<void> copyInstruction(TransformContext &ctx, const il::core::Instr &in);

/// @brief Rewrite every function of @p source.
/// @param trace Optional sink for per-function progress lines.
TransformResult<il::core::Module> transformModule(const il::core::Module &source,
                                                  FunctionTransform &transform,
                                                  std::ostream *trace = nullptr);

} // namespace il::transform
