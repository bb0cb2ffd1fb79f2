//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Param.hpp
// Purpose: Defines parameter representation for blocks.
// Key invariants: Type matches incoming branch arguments.
// Ownership/Lifetime: Parameters stored by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Type.hpp"

#include <string>

namespace il::core
{

/// @brief Describes a basic block parameter.
/// The entry block's parameters are the function's incoming arguments.
struct Param
{
    /// @brief Name used for diagnostics and debugging; may be empty.
    std::string name;

    /// @brief Static type of the parameter.
    Type type;

    /// @brief SSA temporary defined by the parameter.
    /// Unique within the parent function.
    unsigned id = 0;
};

} // namespace il::core
