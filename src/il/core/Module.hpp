//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Module struct, the top-level container for an IL
// compilation unit: the extern declarations a shader calls and the function
// definitions it provides.  Modules move cheaply and copy deeply.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Extern.hpp"
#include "il/core/Function.hpp"

#include <string>
#include <vector>

namespace il::core
{

/// @brief IL module aggregating externs and functions.
struct Module
{
    /// @brief Declared external functions available to the module.
    std::vector<Extern> externs;

    /// @brief Function definitions contained in the module.
    std::vector<Function> functions;

    /// @brief Locate a function by name; nullptr when absent.
    [[nodiscard]] const Function *findFunction(const std::string &name) const
    {
        for (const auto &fn : functions)
        {
            if (fn.name == name)
                return &fn;
        }
        return nullptr;
    }

    /// @brief Locate an extern by name; nullptr when absent.
    [[nodiscard]] const Extern *findExtern(const std::string &name) const
    {
        for (const auto &ext : externs)
        {
            if (ext.name == name)
                return &ext;
        }
        return nullptr;
    }
};

} // namespace il::core
