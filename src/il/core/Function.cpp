//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Function.cpp
// Purpose: Lookup helpers over a function body.
//
//===----------------------------------------------------------------------===//

#include "il/core/Function.hpp"

#include <algorithm>

namespace il::core
{

const BasicBlock *Function::findBlock(const std::string &label) const
{
    for (const auto &bb : blocks)
    {
        if (bb.label == label)
            return &bb;
    }
    return nullptr;
}

unsigned Function::nextTempId() const
{
    unsigned next = static_cast<unsigned>(valueNames.size());
    for (const auto &bb : blocks)
    {
        for (const auto &p : bb.params)
            next = std::max(next, p.id + 1);
        for (const auto &in : bb.instructions)
        {
            for (const auto &r : in.results)
                next = std::max(next, r.id + 1);
        }
    }
    return next;
}

} // namespace il::core
