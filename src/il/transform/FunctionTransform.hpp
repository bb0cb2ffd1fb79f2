//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/FunctionTransform.hpp
// Purpose: Interface of a semantic-domain rewrite driven by
//          transformFunctionBody.
// Key invariants: A transform never mutates its input; it emits a fresh
//                 function through the context's builder.
// Ownership/Lifetime: Transforms are owned by the caller and outlive every
//                     session they are used with.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Instr.hpp"
#include "il/core/Signature.hpp"
#include "il/transform/TransformError.hpp"

namespace il::transform
{

class TransformContext;
struct TransformSession;

class FunctionTransform
{
  public:
    virtual ~FunctionTransform() = default;

    /// @brief Short name used in trace output.
    [[nodiscard]] virtual const char *name() const = 0;

    /// @brief Type of a value after the rewrite.
    [[nodiscard]] virtual il::core::Type mapType(il::core::Type type) const = 0;

    /// @brief Rewrite a float immediate operand.
    [[nodiscard]] virtual il::core::Value mapImmediate(const il::core::Value &value) const = 0;

    /// @brief Signature of a rewritten function; maps every slot through mapType.
    [[nodiscard]] virtual il::core::Signature mapSignature(const il::core::Signature &sig) const;

    /// @brief Hook run once per module before any function is rewritten.
    /// @details Typically copies the externs the rewritten module keeps.
    virtual TransformResult<void> beginModule(TransformSession &session) = 0;

    /// @brief Emit the rewrite of @p in at the context's insertion point.
    virtual TransformResult<void> transformInstr(TransformContext &ctx, const il::core::Instr &in) = 0;
};

} // namespace il::transform
