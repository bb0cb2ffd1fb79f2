//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/OpcodeInfo.hpp
// Purpose: Declares metadata describing IL opcode shapes and numeric categories.
// Key invariants: Table entries cover every Opcode enumerator exactly once.
// Ownership/Lifetime: Metadata is static storage duration and read-only.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Opcode.hpp"

#include <cstdint>
#include <limits>
#include <vector>

namespace il::core
{

/// @brief Sentinel value representing variadic operand arity.
inline constexpr uint8_t kVariadicOperandCount = std::numeric_limits<uint8_t>::max();

/// @brief Result arity expectation for an opcode.
enum class ResultArity : uint8_t
{
    None,    ///< Instruction never produces a result.
    One,     ///< Instruction must produce exactly one result.
    Variadic ///< Result count comes from the callee signature.
};

/// @brief Numeric-domain category of an opcode.
/// @details The closed set of categories keys the converter table of a
///          numeric-domain transform.
enum class OpcodeCategory : uint8_t
{
    Constant,       ///< Immediate materialisation.
    Integer,        ///< Integer arithmetic, compares and width changes.
    Boolean,        ///< i1 plumbing and select.
    FloatArith,     ///< Floating-point arithmetic.
    FloatCompare,   ///< Floating-point comparison producing i1.
    Conversion,     ///< Casts between the integer and float domains.
    Memory,         ///< Stack addressing, loads and stores.
    Call,           ///< Direct calls.
    Control,        ///< Block terminators.
    FloatRemainder, ///< fmod-style remainder; no fixed-point lowering exists.
    Count
};

/// @brief Number of opcode categories.
inline constexpr size_t kNumOpcodeCategories = static_cast<size_t>(OpcodeCategory::Count);

/// @brief Static description of an opcode shape and behaviour.
struct OpcodeInfo
{
    const char *name;          ///< Canonical mnemonic.
    OpcodeCategory category;   ///< Numeric-domain category.
    ResultArity resultArity;   ///< Expected result arity.
    uint8_t numOperandsMin;    ///< Minimum operand count.
    uint8_t numOperandsMax;    ///< Maximum operand count or kVariadicOperandCount.
    bool hasSideEffects;       ///< Instruction mutates state or control flow.
    bool isTerminator;         ///< Instruction ends a basic block.
};

/// @brief Retrieve the metadata describing @p op.
const OpcodeInfo &getOpcodeInfo(Opcode op);

/// @brief Determine whether an operand count represents variadic arity.
inline bool isVariadicOperandCount(uint8_t value)
{
    return value == kVariadicOperandCount;
}

/// @brief Enumerate every opcode in declaration order.
std::vector<Opcode> all_opcodes();

/// @brief Lowercase spelling of @p category for diagnostics and traces.
const char *toString(OpcodeCategory category);

} // namespace il::core
