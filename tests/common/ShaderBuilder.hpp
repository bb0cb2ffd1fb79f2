// File: tests/common/ShaderBuilder.hpp
// Purpose: Build small float-domain IL modules for transform and ABI tests.
// Key invariants: One function is under construction at a time; the builder
//                 inserts into the most recently started function's entry
//                 block until setInsertPoint() says otherwise.
// Ownership/Lifetime: Owns the module under construction.
// Links: src/il/build/IRBuilder.hpp

#pragma once

#include "il/build/IRBuilder.hpp"
#include "il/core/Module.hpp"
#include "il/interp/Interpreter.hpp"

#include <string>
#include <vector>

namespace qshade::tests
{

inline const il::core::Type kF32{il::core::Type::Kind::F32};
inline const il::core::Type kF64{il::core::Type::Kind::F64};
inline const il::core::Type kI1{il::core::Type::Kind::I1};
inline const il::core::Type kI32{il::core::Type::Kind::I32};
inline const il::core::Type kI64{il::core::Type::Kind::I64};
inline const il::core::Type kPtr{il::core::Type::Kind::Ptr};

/// @brief Helper that constructs IL fragments through IRBuilder.
class ShaderBuilder
{
  public:
    ShaderBuilder() : builder_(module_) {}

    ShaderBuilder(const ShaderBuilder &) = delete;
    ShaderBuilder &operator=(const ShaderBuilder &) = delete;

    /// @brief Start function @p name and position at its "entry" block.
    il::core::Function &begin(const std::string &name,
                              const std::vector<il::core::Type> &params,
                              const std::vector<il::core::Type> &returns);

    /// @brief Entry-block parameter @p idx of the current function.
    [[nodiscard]] il::core::Value param(unsigned idx) const;

    /// @brief Append a block to the current function; returns its index.
    size_t addBlock(const std::string &label, const std::vector<il::core::Type> &params = {});

    /// @brief Continue emitting into block @p idx of the current function.
    void setInsertPoint(size_t idx);

    /// @brief Parameter @p param of block @p block in the current function.
    [[nodiscard]] il::core::Value blockParam(size_t block, unsigned param) const;

    void declareExtern(const std::string &name,
                       const std::vector<il::core::Type> &params,
                       const std::vector<il::core::Type> &returns);

    il::build::IRBuilder &ir()
    {
        return builder_;
    }

    il::core::Function &function()
    {
        return module_.functions.at(current_);
    }

    il::core::Module &module()
    {
        return module_;
    }

  private:
    il::core::Module module_;
    il::build::IRBuilder builder_;
    size_t current_ = 0;
};

inline il::interp::Slot f32(double v)
{
    return il::interp::Slot::fromFloat(static_cast<float>(v));
}

/// @brief Q16.16 slot for @p v.
il::interp::Slot q32(double v);

/// @brief Real value of a Q16.16 result slot.
double fromQ32(il::interp::Slot s);

} // namespace qshade::tests
