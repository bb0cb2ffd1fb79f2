//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Value struct, which represents operands and constants
// in IL instructions. Values are tagged unions that hold an SSA temporary, an
// integer or floating-point literal, or the null pointer.
//
// Supported Value Kinds:
// - Temp: SSA temporary reference (%0, %1, etc.)
// - ConstInt: Integer literal (i1 through i64)
// - ConstFloat: Floating-point literal (stored as double, typed by the user)
// - NullPtr: Null pointer constant
//
// Temporaries carry no type of their own; the defining instruction result or
// block parameter records it.  Factory methods construct Values with the
// appropriate kind and payload.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace il::core
{

/// @brief Tagged value used as operands in IL.
struct Value
{
    /// @brief Enumerates the different value forms.
    enum class Kind
    {
        Temp,
        ConstInt,
        ConstFloat,
        NullPtr
    };
    /// Discriminant selecting which payload is active.
    Kind kind;
    /// Integer payload used when kind == Kind::ConstInt.
    long long i64{0};
    /// Floating-point payload used when kind == Kind::ConstFloat.
    double f64{0.0};
    /// Temporary identifier used when kind == Kind::Temp.
    unsigned id{0};

    /// @brief Flag set when the integer literal represents an i1 boolean.
    /// @invariant Only meaningful when kind == Kind::ConstInt.
    bool isBool{false};

    /// @brief Construct a temporary value.
    static Value temp(unsigned t);

    /// @brief Construct an integer constant value.
    static Value constInt(long long v);

    /// @brief Construct a boolean constant value.
    static Value constBool(bool v);

    /// @brief Construct a floating-point constant value.
    static Value constFloat(double v);

    /// @brief Construct a null pointer value.
    static Value null();

    [[nodiscard]] bool isTemp() const
    {
        return kind == Kind::Temp;
    }

    [[nodiscard]] bool isConst() const
    {
        return kind == Kind::ConstInt || kind == Kind::ConstFloat || kind == Kind::NullPtr;
    }
};

/// @brief Structural equality: same kind and same active payload.
bool operator==(const Value &a, const Value &b);

inline bool operator!=(const Value &a, const Value &b)
{
    return !(a == b);
}

/// @brief Render @p v as it appears in IL text.
/// @details Float literals always carry a decimal point or exponent so they
///          never read back as integers.
std::string toString(const Value &v);

} // namespace il::core
