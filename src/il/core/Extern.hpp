//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Extern.hpp
// Purpose: Declares external symbols a module calls but does not define.
// Key invariants: Name unique among externs and functions of a module.
// Ownership/Lifetime: Module owns Extern objects by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Signature.hpp"

#include <string>

namespace il::core
{

/// @brief Imported symbol (typically a builtin helper) with its ABI signature.
struct Extern
{
    std::string name;
    Signature sig;
};

} // namespace il::core
