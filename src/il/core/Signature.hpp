//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Signature.hpp
// Purpose: Declares ABI-annotated function signatures.
// Key invariants: At most one StructReturn parameter, and only when the
//                 return list is empty.
// Ownership/Lifetime: Value type.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Type.hpp"

#include <string>
#include <vector>

namespace il::core
{

/// @brief ABI role of a signature parameter.
enum class ArgumentPurpose
{
    Normal,      ///< Ordinary value argument.
    StructReturn ///< Caller-allocated buffer the callee writes its results through.
};

/// @brief Typed signature slot with its ABI role.
struct AbiParam
{
    Type type;
    ArgumentPurpose purpose = ArgumentPurpose::Normal;

    AbiParam() = default;

    explicit AbiParam(Type t, ArgumentPurpose p = ArgumentPurpose::Normal) : type(t), purpose(p) {}

    bool operator==(const AbiParam &other) const
    {
        return type == other.type && purpose == other.purpose;
    }

    bool operator!=(const AbiParam &other) const
    {
        return !(*this == other);
    }
};

/// @brief Ordered parameters and ordered returns of a callable.
struct Signature
{
    std::vector<AbiParam> params;
    std::vector<AbiParam> returns;

    /// @brief Index of the StructReturn parameter, or -1 when absent.
    [[nodiscard]] int structReturnIndex() const;

    /// @brief Types of the Normal-purpose parameters in order.
    [[nodiscard]] std::vector<Type> normalParamTypes() const;

    /// @brief Types of the returns in order.
    [[nodiscard]] std::vector<Type> returnTypes() const;

    /// @brief True when any parameter or return is f32 or f64.
    [[nodiscard]] bool mentionsFloat() const;

    bool operator==(const Signature &other) const
    {
        return params == other.params && returns == other.returns;
    }

    bool operator!=(const Signature &other) const
    {
        return !(*this == other);
    }
};

/// @brief Render as "(i32, sret ptr) -> (f32, f32)".
std::string toString(const Signature &sig);

/// @brief Build a signature whose params and returns are all Normal-purpose.
Signature makeSignature(const std::vector<Type> &params, const std::vector<Type> &returns);

} // namespace il::core
