//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/fixed/FixedLowering.hpp
// Purpose: Emits inline IL sequences computing the Q16.16 operations of
//          il/fixed/FixedPoint.hpp.
// Key invariants: Every sequence is branch-free and produces the same bits as
//                 the matching il::fixed function for every input.  The last
//                 instruction of a sequence defines @p resultId.
// Ownership/Lifetime: Borrows the builder; emits at its insertion point.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/build/IRBuilder.hpp"
#include "il/core/Opcode.hpp"
#include "il/core/Value.hpp"

#include <optional>
#include <vector>

namespace il::transform::lowering
{

class FixedEmitter
{
  public:
    explicit FixedEmitter(il::build::IRBuilder &builder) : builder_(builder) {}

    il::core::Value add(il::core::Value a, il::core::Value b, unsigned resultId);
    il::core::Value sub(il::core::Value a, il::core::Value b, unsigned resultId);
    il::core::Value neg(il::core::Value a, unsigned resultId);
    il::core::Value abs(il::core::Value a, unsigned resultId);
    il::core::Value min(il::core::Value a, il::core::Value b, unsigned resultId);
    il::core::Value max(il::core::Value a, il::core::Value b, unsigned resultId);

    /// @brief (sext64(a) * sext64(b)) >> 16, truncated.
    il::core::Value mul(il::core::Value a, il::core::Value b, unsigned resultId);

    /// @brief Reciprocal division with saturating division by zero.
    il::core::Value div(il::core::Value a, il::core::Value b, unsigned resultId);

    /// @brief Six unrolled Newton steps; non-positive input yields 0.
    il::core::Value sqrt(il::core::Value x, unsigned resultId);

    /// @brief Integer of type @p from to Q16.16.
    il::core::Value fromInt(il::core::Value v, il::core::Type from, unsigned resultId);

    /// @brief Q16.16 to integer of type @p to, rounding toward negative infinity.
    il::core::Value toInt(il::core::Value v, il::core::Type to, unsigned resultId);

    /// @brief Signed integer comparison equivalent to float compare @p op.
    il::core::Value compare(il::core::Opcode op, il::core::Value a, il::core::Value b, unsigned resultId);

    /// @brief Integer compare opcode implementing float compare @p op.
    static std::optional<il::core::Opcode> compareOpcodeFor(il::core::Opcode op);

  private:
    il::core::Value emit(il::core::Opcode op, il::core::Type type, std::vector<il::core::Value> operands);
    il::core::Value finish(il::core::Opcode op,
                           il::core::Type type,
                           std::vector<il::core::Value> operands,
                           unsigned resultId);

    il::build::IRBuilder &builder_;
};

} // namespace il::transform::lowering
