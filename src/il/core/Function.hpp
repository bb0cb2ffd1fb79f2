//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Function struct, an IL function definition with its
// ABI signature, explicit stack storage and basic blocks.
//
// Each Function consists of:
// - A unique name within its containing Module
// - A Signature (ordered params and returns tagged with their ABI role)
// - StackSlots for array and aggregate storage, addressed by index
// - A sequence of BasicBlocks; the entry block parameters are the incoming
//   arguments and match the signature parameters one for one
// - Optional SSA value names for diagnostics
//
// Ownership Model:
// - Module owns Functions by value
// - Function owns all BasicBlocks, StackSlots and metadata
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/BasicBlock.hpp"
#include "il/core/Signature.hpp"

#include <string>
#include <vector>

namespace il::core
{

/// @brief Fixed-size frame storage declared by a function.
struct StackSlot
{
    unsigned size = 0;  ///< Bytes reserved.
    unsigned align = 1; ///< Required alignment; power of two.

    bool operator==(const StackSlot &other) const
    {
        return size == other.size && align == other.align;
    }
};

/// @brief Definition of an IL function with signature and basic blocks.
struct Function
{
    /// Identifier unique within its Module.
    std::string name;

    /// ABI signature; entry block parameters mirror @c sig.params.
    Signature sig;

    /// Basic blocks comprising the function body; blocks.front() is the entry.
    std::vector<BasicBlock> blocks;

    /// Frame slots referenced by stackaddr through their index.
    std::vector<StackSlot> stackSlots;

    /// Mapping from SSA value IDs to their original names for diagnostics.
    /// Index aligns with SSA value numbering; entries may be empty.
    std::vector<std::string> valueNames;

    /// @brief Locate a block by label; nullptr when absent.
    [[nodiscard]] const BasicBlock *findBlock(const std::string &label) const;

    /// @brief Smallest temporary id greater than every id defined in the body.
    [[nodiscard]] unsigned nextTempId() const;
};

} // namespace il::core
