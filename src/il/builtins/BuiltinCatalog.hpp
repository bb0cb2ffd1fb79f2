//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/builtins/BuiltinCatalog.hpp
// Purpose: Exposes the native builtin catalog and the default registry built
//          from it.
// Key invariants: The default registry is validated exactly once.
// Ownership/Lifetime: Function-local statics with program lifetime.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/builtins/BuiltinRegistry.hpp"

#include <vector>

namespace il::builtins
{

/// @brief Declarations for every row of Builtins.def.
/// @details Prototypes that fail to parse are reported through the returned
///          diagnostic instead of being dropped.
il::support::Expected<std::vector<BuiltinImplDecl>> builtinCatalog();

/// @brief Registry over builtinCatalog(), constructed and validated on first use.
/// @details The result is shared and read-only; an invalid catalog yields the
///          same error on every call.
const il::transform::TransformResult<BuiltinRegistry> &defaultBuiltinRegistry();

} // namespace il::builtins
