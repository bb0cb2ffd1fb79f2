//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Instr struct, which represents a single IL instruction
// within a basic block.
//
// The Instr struct accommodates the diverse needs of different instruction
// kinds with one flat layout:
// - Standard operations (fadd, load, etc.) use the operands vector
// - Call instructions additionally store a callee name and may define several
//   results, one per callee return slot
// - Branch instructions store target labels and per-target arguments
// - Memory instructions carry their constant slot index and byte offset as
//   trailing integer operands
//
// Operand layouts:
//   stackaddr  [slot, offset]          -> ptr
//   load       [ptr, offset]           -> type
//   store      [ptr, value, offset]    (type = stored value type)
//   select     [cond, ifTrue, ifFalse] -> type
//   cbr        [cond], labels = {then, else}
//   ret        [values...]
//
// Instructions follow SSA form: each result temporary is defined exactly once
// within the function.  The source location field enables precise error
// reporting; {0,0} indicates an unknown location.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Opcode.hpp"
#include "il/core/Type.hpp"
#include "il/core/Value.hpp"
#include "support/source_location.hpp"

#include <string>
#include <vector>

namespace il::core
{

/// @brief Typed SSA temporary defined by an instruction.
struct InstrResult
{
    unsigned id = 0;
    Type type;
};

/// @brief Instruction within a basic block.
struct Instr
{
    /// Destination temporaries; empty for stores and terminators.
    /// For single-result opcodes results[0].type equals @ref type.
    std::vector<InstrResult> results;

    /// Operation code selecting semantics.
    Opcode op = Opcode::IConst;

    /// Operation type: result type, stored value type for store, void otherwise.
    Type type;

    /// General operands; size and content depend on opcode.
    std::vector<Value> operands;

    /// Callee name for call instructions.
    std::string callee;

    /// Branch target labels.
    std::vector<std::string> labels;

    /// Branch arguments per target; outer vector matches labels in size.
    std::vector<std::vector<Value>> brArgs;

    /// Source location.
    il::support::SourceLoc loc;

    [[nodiscard]] bool hasResult() const
    {
        return !results.empty();
    }

    /// @brief Id of the first result; requires hasResult().
    [[nodiscard]] unsigned result() const
    {
        return results.front().id;
    }
};

} // namespace il::core
