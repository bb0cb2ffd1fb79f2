//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the IRBuilder class, which provides a high-level API for
// constructing IL functions programmatically.  The shader frontend uses it to
// produce float-domain IL and the numeric-domain transforms use it to emit
// their rewritten instruction sequences.
//
// The builder manages the insertion point (current basic block) and hands out
// fresh SSA temporaries.  Blocks are stored by value inside the function, so
// create every block of a function before taking long-lived references.
//
// Typical Usage Pattern:
//   Module m;
//   IRBuilder b(m);
//   auto &fn = b.startFunction("mad", makeSignature({f32, f32, f32}, {f32}));
//   auto &entry = b.addEntryBlock(fn, "entry");
//   b.setInsertPoint(entry);
//   auto s = b.binary(Opcode::FAdd, f32, b.blockParam(entry, 0), b.blockParam(entry, 1));
//   b.ret({b.binary(Opcode::FMul, f32, s, b.blockParam(entry, 2))});
//
// The IRBuilder does NOT own the Module it operates on.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Module.hpp"
#include "il/core/Opcode.hpp"
#include "il/core/Value.hpp"
#include "support/source_location.hpp"

#include <string>
#include <vector>

namespace il::build
{

/// @brief Helper to construct IL functions and enforce block termination.
class IRBuilder
{
  public:
    /// @brief Create builder operating on module @p m.
    explicit IRBuilder(il::core::Module &m);

    /// @brief Add an external function declaration.
    il::core::Extern &addExtern(const std::string &name, il::core::Signature sig);

    /// @brief Begin definition of function @p name; no blocks are created.
    il::core::Function &startFunction(const std::string &name, il::core::Signature sig);

    /// @brief Resume emission into an existing function.
    /// @details Temporaries continue after the highest id already defined.
    void continueFunction(il::core::Function &fn);

    /// @brief Create the entry block whose parameters mirror the signature.
    il::core::BasicBlock &addEntryBlock(il::core::Function &fn, const std::string &label);

    /// @brief Create a basic block with parameters of the given types.
    il::core::BasicBlock &createBlock(il::core::Function &fn,
                                      const std::string &label,
                                      const std::vector<il::core::Type> &paramTypes = {});

    /// @brief Reserve a frame slot and return its index.
    unsigned addStackSlot(il::core::Function &fn, unsigned size, unsigned align);

    /// @brief Access parameter @p idx of block @p bb as a value.
    il::core::Value blockParam(const il::core::BasicBlock &bb, unsigned idx) const;

    /// @brief Set current insertion point to block @p bb.
    void setInsertPoint(il::core::BasicBlock &bb);

    /// @brief Source location attached to subsequently emitted instructions.
    void setLoc(il::support::SourceLoc loc)
    {
        curLoc = loc;
    }

    /// @brief Hand out a fresh temporary id without emitting anything.
    unsigned reserveTempId();

    /// @brief Ensure temporaries handed out from now on are numbered >= @p id.
    /// @details Used when rewriting a function in place of an existing one so
    ///          fresh temporaries never collide with ids carried over verbatim.
    void reserveTempsBelow(unsigned id);

    /// @brief Append a fully formed instruction at the insertion point.
    void append(il::core::Instr instr);

    /// @brief Emit a single-result instruction with a fresh temporary.
    il::core::Value emit(il::core::Opcode op, il::core::Type type, std::vector<il::core::Value> operands);

    il::core::Value iconst(il::core::Type type, long long v);
    il::core::Value fconst(il::core::Type type, double v);
    il::core::Value binary(il::core::Opcode op, il::core::Type type, il::core::Value lhs, il::core::Value rhs);
    il::core::Value unary(il::core::Opcode op, il::core::Type type, il::core::Value operand);
    il::core::Value select(il::core::Type type, il::core::Value cond, il::core::Value a, il::core::Value b);
    il::core::Value stackAddr(unsigned slot, long long offset = 0);
    il::core::Value load(il::core::Type type, il::core::Value ptr, long long offset = 0);
    void store(il::core::Type type, il::core::Value ptr, il::core::Value value, long long offset = 0);

    /// @brief Emit a call defining one fresh result per entry of @p resultTypes.
    std::vector<il::core::Value> call(const std::string &callee,
                                      const std::vector<il::core::Type> &resultTypes,
                                      std::vector<il::core::Value> args);

    void br(const std::string &label, std::vector<il::core::Value> args = {});
    void cbr(il::core::Value cond,
             const std::string &thenLabel,
             std::vector<il::core::Value> thenArgs,
             const std::string &elseLabel,
             std::vector<il::core::Value> elseArgs);
    void ret(std::vector<il::core::Value> values = {});

  private:
    il::core::Module &mod;
    il::core::Function *curFunc{nullptr};
    il::core::BasicBlock *curBlock{nullptr};
    unsigned nextTemp{0};
    il::support::SourceLoc curLoc{};
};

} // namespace il::build
