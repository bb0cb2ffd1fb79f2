//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Type.hpp
// Purpose: Declares IL type representation.
// Key invariants: Kind field determines payload.
// Ownership/Lifetime: Types are lightweight values.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <string>

namespace il::core
{

/// @brief Simple type wrapper for IL primitive types.
struct Type
{
    /// @brief Enumerates primitive IL types.
    enum class Kind
    {
        Void,
        I1,
        I8,
        I16,
        I32,
        I64,
        F32,
        F64,
        Ptr
    };
    Kind kind; ///< Discriminator specifying the active kind

    /// @brief Construct a type of kind @p k.
    explicit Type(Kind k = Kind::Void);

    /// @brief Convert type to string representation.
    /// @return Lowercase type mnemonic.
    std::string toString() const;

    /// @brief True for f32 and f64.
    [[nodiscard]] bool isFloat() const
    {
        return kind == Kind::F32 || kind == Kind::F64;
    }

    /// @brief True for i1 through i64.
    [[nodiscard]] bool isInteger() const
    {
        return kind == Kind::I1 || kind == Kind::I8 || kind == Kind::I16 || kind == Kind::I32 ||
               kind == Kind::I64;
    }

    bool operator==(const Type &other) const
    {
        return kind == other.kind;
    }

    bool operator!=(const Type &other) const
    {
        return kind != other.kind;
    }
};

/// @brief Convert kind @p k to its mnemonic string.
std::string kindToString(Type::Kind k);

/// @brief Storage size of a value of type @p t in bytes.
/// @details i1 occupies one byte in memory; pointers use the host pointer width.
size_t sizeInBytes(Type t);

} // namespace il::core
