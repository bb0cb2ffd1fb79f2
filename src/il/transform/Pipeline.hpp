//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/Pipeline.hpp
// Purpose: Module-level entry point that checks the builtin registry,
//          rewrites every function to fixed point and verifies the result.
// Key invariants: An invalid registry aborts before any function is touched.
//                 On failure no module is returned.
// Ownership/Lifetime: The returned module is owned by the caller; the input
//                     module and registry are only read.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/builtins/BuiltinRegistry.hpp"
#include "il/core/Module.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"

namespace il::transform
{

/// @brief Lower @p module to Q16.16 for the target named in @p options.
/// @details Registry and transform errors are returned as diagnostics carrying
///          their E-FX code; verifier failures are returned as reported by
///          the verifier.
il::support::Expected<il::core::Module> runFixedPointPipeline(const il::core::Module &module,
                                                              const il::support::Options &options,
                                                              const TransformResult<il::builtins::BuiltinRegistry> &registry);

/// @brief Same as above using defaultBuiltinRegistry().
il::support::Expected<il::core::Module> runFixedPointPipeline(const il::core::Module &module,
                                                              const il::support::Options &options);

} // namespace il::transform
