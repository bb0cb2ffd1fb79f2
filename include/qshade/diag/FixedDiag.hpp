//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/qshade/diag/FixedDiag.hpp
// Purpose: Diagnostic descriptors for the fixed-point lowering pipeline.
// Key invariants: Enum values and codes are stable; do not reorder.
// Ownership/Lifetime: All returned string_views point to static storage.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <initializer_list>
#include <string>
#include <string_view>

namespace qshade::diag
{

/// @brief Enumeration of every failure the lowering pipeline reports.
enum class FixedDiag
{
    UnsupportedInstruction,   ///< Opcode category has no fixed-point converter.
    InstructionShapeMismatch, ///< Operand layout violates a converter precondition.
    MissingBuiltinVariant,    ///< Variant-dependent builtin lacks its Float or FixedPoint member.
    DuplicateBuiltinVariant,  ///< Two implementations claim the same signature and variant.
    BuiltinSignatureMismatch, ///< Float and FixedPoint members disagree on shape.
    UnknownBuiltinFunction    ///< Call site references an unregistered function.
};

/// @brief A key/value pair used for placeholder substitution in messages.
struct Replacement
{
    std::string_view key;   ///< Placeholder name (without braces).
    std::string_view value; ///< Replacement text to substitute.
};

/// @brief Static metadata record for a single diagnostic.
struct FixedDiagInfo
{
    std::string_view id;            ///< Unique identifier string.
    std::string_view code;          ///< Stable code such as "E-FX001".
    il::support::Severity severity; ///< Severity level.
    std::string_view format;        ///< Message template with {placeholders}.
};

/// @brief Retrieve the full metadata record for @p diag.
[[nodiscard]] const FixedDiagInfo &getInfo(FixedDiag diag);

[[nodiscard]] std::string_view getId(FixedDiag diag);

[[nodiscard]] std::string_view getCode(FixedDiag diag);

/// @brief Expand the format string of @p diag.
/// @details Unknown placeholders are left verbatim.
[[nodiscard]] std::string formatMessage(FixedDiag diag, std::initializer_list<Replacement> replacements = {});

} // namespace qshade::diag
