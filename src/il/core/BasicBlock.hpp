//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the BasicBlock struct, a maximal sequence of IL
// instructions with a single entry point and a single exit terminator.
// Blocks with parameters receive values from predecessor blocks via branch
// arguments, implementing SSA phi-node semantics without explicit phi
// instructions.
//
// Key Invariants:
// - Labels are non-empty and unique within the parent function
// - Parameter count and types match incoming branch arguments
// - The last instruction is the only terminator
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Instr.hpp"
#include "il/core/Param.hpp"

#include <string>
#include <vector>

namespace il::core
{

/// @brief Sequence of instructions terminated by a control-flow instruction.
struct BasicBlock
{
    /// Identifier of the block within its function.
    std::string label;

    /// Parameters representing incoming SSA values.
    std::vector<Param> params;

    /// Ordered list of IL instructions belonging to this block.
    std::vector<Instr> instructions;

    /// Indicates whether the block ends with a control-flow instruction.
    bool terminated = false;
};

} // namespace il::core
