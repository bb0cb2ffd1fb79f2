//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/TransformError.hpp
// Purpose: Structured error value returned by numeric-domain transforms and
//          by builtin registry validation.
// Key invariants: message is fully rendered at construction.
// Ownership/Lifetime: Value type.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "qshade/diag/FixedDiag.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <vector>

namespace il::core
{
struct Instr;
}

namespace il::transform
{

/// @brief Failure of a transform or of registry validation.
/// @details Function-scoped errors name the function and the offending
///          instruction; registry errors name the builtin and list the
///          variants, signatures or declaration sites involved in @c subjects.
struct TransformError
{
    qshade::diag::FixedDiag kind;
    std::string function;              ///< Function being rewritten; empty for registry errors.
    std::string instruction;           ///< Offending instruction as IL text.
    std::string builtin;               ///< Builtin or callee name, when relevant.
    std::vector<std::string> subjects; ///< Variants, signatures or sites involved.
    std::string message;               ///< Rendered human-readable text.
    il::support::SourceLoc loc;        ///< Location of the offending instruction.

    /// @brief Stable code such as "E-FX001".
    [[nodiscard]] std::string code() const;

    /// @brief Render as a diagnostic for the developer-facing layer.
    [[nodiscard]] il::support::Diag toDiag() const;
};

/// @brief Result alias used across the transform layer.
template <class T> using TransformResult = il::support::Expected<T, TransformError>;

TransformError unsupportedInstruction(const std::string &function, const il::core::Instr &in);

TransformError shapeMismatch(const std::string &function, const il::core::Instr &in, const std::string &detail);

TransformError unknownBuiltin(const std::string &function, const il::core::Instr &in);

/// @param missing Variant that is absent ("FixedPoint" or "Float").
/// @param found Variants that were declared.
TransformError missingBuiltinVariant(const std::string &builtin,
                                     const std::string &missing,
                                     const std::vector<std::string> &found);

/// @param firstSite, secondSite Declaration sites of the two conflicting members.
TransformError duplicateBuiltinVariant(const std::string &builtin,
                                       const std::string &variant,
                                       const std::string &firstSite,
                                       const std::string &secondSite);

/// @param floatSig, fixedSig Full signatures of both members.
TransformError builtinSignatureMismatch(const std::string &builtin,
                                        const std::string &floatSig,
                                        const std::string &fixedSig);

} // namespace il::transform
