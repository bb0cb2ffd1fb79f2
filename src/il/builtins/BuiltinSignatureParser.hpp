//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/builtins/BuiltinSignatureParser.hpp
// Purpose: Parses shader-style builtin prototypes such as
//          "vec3 lpfx_hue2rgb(float hue)" used by the builtin catalog.
// Key invariants: Unknown type or qualifier tokens are reported, never guessed.
// Ownership/Lifetime: Stateless free functions operating on string views.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/builtins/BuiltinRegistry.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace il::builtins
{

/// @brief Trim ASCII whitespace from both ends of the provided view.
std::string_view trim(std::string_view text);

/// @brief Split a comma separated parameter list into trimmed tokens.
std::vector<std::string_view> splitParamList(std::string_view text);

/// @brief Map a type token ("float", "vec3", ...) to its GlslType.
std::optional<GlslType> parseGlslType(std::string_view token);

/// @brief Parse "ret name([qualifier] type [pname], ...)".
il::support::Expected<LogicalSignature> parseBuiltinPrototype(std::string_view text);

} // namespace il::builtins
