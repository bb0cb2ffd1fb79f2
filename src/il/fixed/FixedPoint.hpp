//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/fixed/FixedPoint.hpp
// Purpose: Q16.16 numeric domain: format descriptors, saturating conversions
//          and the approximate multiply/divide/sqrt algorithms that every
//          lowered instruction sequence reproduces bit for bit.
// Key invariants: Results equal those of the IL emitted by the fixed-point
//                 transform for the same inputs.
// Ownership/Lifetime: Stateless free functions.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Type.hpp"

#include <cstdint>
#include <limits>

namespace il::fixed
{

/// @brief Fixed-point encodings known to the compiler.
enum class FixedPointFormat
{
    Fixed16x16, ///< i32 with 16 fractional bits.
    Fixed32x32  ///< Reserved wide encoding; no operation accepts it yet.
};

inline constexpr int kFractionalBits = 16;
inline constexpr int32_t kScale = 1 << kFractionalBits;
inline constexpr int32_t kMaxFixed = std::numeric_limits<int32_t>::max();
inline constexpr int32_t kMinFixed = std::numeric_limits<int32_t>::min();
inline constexpr int32_t kOne = kScale;

/// @brief Numerator of the reciprocal trick: 1.0 scaled by 2^31.
inline constexpr uint32_t kReciprocalNumerator = 0x80000000u;

/// @brief Newton-Raphson iterations performed by sqrt.
inline constexpr int kSqrtIterations = 6;

/// @brief Right shift applied to the scaled input to form the first sqrt guess.
inline constexpr int kSqrtGuessShift = 9;

/// @brief Largest float that still encodes without saturating (~32767.99998).
inline constexpr double kMaxRepresentable = static_cast<double>(kMaxFixed) / kScale;

/// @brief Smallest representable value (-32768.0).
inline constexpr double kMinRepresentable = static_cast<double>(kMinFixed) / kScale;

/// @brief True when the compiler can lower to @p format.
bool isSupported(FixedPointFormat format);

/// @brief IL storage type of one value in @p format.
il::core::Type storageType(FixedPointFormat format);

/// @brief Lowercase spelling ("fixed16x16").
const char *toString(FixedPointFormat format);

/// @brief Encode @p x, saturating outside the representable range.
/// @details In-range values round to nearest with ties away from zero; NaN encodes as 0.
int32_t toFixed(double x);

/// @brief Decode a Q16.16 value.
float toFloat(int32_t v);

/// @brief Integer to Q16.16 (left shift by 16, wrapping).
int32_t fromInt(int32_t v);

/// @brief Q16.16 to integer by arithmetic right shift; rounds toward negative infinity.
int32_t toInt(int32_t v);

int32_t add(int32_t a, int32_t b);
int32_t sub(int32_t a, int32_t b);
int32_t neg(int32_t a);
int32_t abs(int32_t a);
int32_t min(int32_t a, int32_t b);
int32_t max(int32_t a, int32_t b);

/// @brief Widening multiply: (sext64(a) * sext64(b)) >> 16, narrowed to 32 bits.
int32_t mul(int32_t a, int32_t b);

/// @brief 1.0 / @p divisor scaled by 2^31 using 32-bit unsigned division.
/// @pre divisor != 0
uint32_t reciprocal(uint32_t divisor);

/// @brief Reciprocal division with the sign applied from a ^ b.
/// @details Division by zero yields 0 for a zero dividend and otherwise the
///          saturated bound carrying the dividend's sign.
int32_t div(int32_t a, int32_t b);

/// @brief Newton-Raphson square root on the pre-scaled input.
/// @details Returns 0 for non-positive input.  Accuracy degrades for inputs
///          above ~5000 because early guesses exceed 32 bits.
int32_t sqrt(int32_t x);

} // namespace il::fixed
