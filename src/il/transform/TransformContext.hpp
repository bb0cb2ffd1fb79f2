//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/TransformContext.hpp
// Purpose: Per-module session and per-function bookkeeping for a rewrite.
// Key invariants: The value map is append-only.  Every block is mapped before
//                 the first instruction is visited.  Operands are read only
//                 through mapOperand.
// Ownership/Lifetime: A context borrows the session, transform and both
//                     functions; it lives for one function rewrite.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/abi/ReturnAbi.hpp"
#include "il/build/IRBuilder.hpp"
#include "il/core/Function.hpp"
#include "il/core/Module.hpp"
#include "il/transform/FunctionTransform.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace il::transform
{

/// @brief State shared by every function rewrite of one module.
struct TransformSession
{
    TransformSession(const il::core::Module &source, il::core::Module &target)
        : source(source), target(target), builder(target)
    {
    }

    const il::core::Module &source;
    il::core::Module &target;
    il::build::IRBuilder builder;

    /// Rewritten signature of every function in @c source, declared up front
    /// so calls between functions resolve regardless of order.
    std::unordered_map<std::string, il::core::Signature> functionSigs;

    /// Optional trace sink.
    std::ostream *trace = nullptr;
};

/// @brief Where a rewritten call goes and how its results come back.
struct CallTarget
{
    std::string symbol;
    il::core::Signature signature; ///< Signature of @c symbol as declared in the output.
    qshade::codegen::abi::ReturnPlan plan;
};

class TransformContext
{
  public:
    TransformContext(TransformSession &session,
                     const FunctionTransform &transform,
                     const il::core::Function &source,
                     il::core::Function &target);

    /// @brief Mapped value of @p v, or @p v itself when untouched.
    /// @details Float immediates go through the transform's immediate mapper.
    [[nodiscard]] il::core::Value mapOperand(const il::core::Value &v) const;

    [[nodiscard]] std::vector<il::core::Value> mapOperands(const std::vector<il::core::Value> &values) const;

    /// @brief Record the replacement of source temporary @p oldId.
    /// @details The first mapping wins.  transformFunctionBody rejects a
    ///          second definition of an id before any converter sees it.
    void mapValue(unsigned oldId, il::core::Value value);

    /// @brief True once @p oldId has been defined in the rewrite.
    [[nodiscard]] bool isMapped(unsigned oldId) const;

    void mapBlock(const std::string &oldLabel, const std::string &newLabel);

    /// @brief Label of the rewritten block, or nullptr for unknown labels.
    [[nodiscard]] const std::string *blockFor(const std::string &oldLabel) const;

    void mapStackSlot(unsigned oldSlot, unsigned newSlot);

    [[nodiscard]] std::optional<unsigned> stackSlotFor(unsigned oldSlot) const;

    [[nodiscard]] const CallTarget *cachedCallTarget(const std::string &callee) const;

    const CallTarget &cacheCallTarget(const std::string &callee, CallTarget target);

    /// @brief Type of @p v in the source function; nullopt for untyped immediates.
    [[nodiscard]] std::optional<il::core::Type> sourceTypeOf(const il::core::Value &v) const;

    [[nodiscard]] il::core::Type mapType(il::core::Type type) const
    {
        return transform_.mapType(type);
    }

    /// @brief Emit @p op defining source result @p resultIndex of @p old under
    ///        its original id, and record the mapping.
    il::core::Value define(const il::core::Instr &old,
                           size_t resultIndex,
                           il::core::Opcode op,
                           il::core::Type type,
                           std::vector<il::core::Value> operands);

    il::build::IRBuilder &builder()
    {
        return session_.builder;
    }

    TransformSession &session()
    {
        return session_;
    }

    const il::core::Function &source() const
    {
        return source_;
    }

    il::core::Function &target()
    {
        return target_;
    }

  private:
    TransformSession &session_;
    const FunctionTransform &transform_;
    const il::core::Function &source_;
    il::core::Function &target_;

    std::unordered_map<unsigned, il::core::Value> valueMap_;
    std::unordered_map<std::string, std::string> blockMap_;
    std::unordered_map<unsigned, unsigned> stackSlotMap_;
    std::unordered_map<std::string, CallTarget> callTargets_;
    std::unordered_map<unsigned, il::core::Type> sourceTypes_;
};

} // namespace il::transform
