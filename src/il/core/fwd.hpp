//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Forward declarations for the core IL types.  Headers that only need
// pointer or reference types include this file instead of the definitions.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace il::core
{
struct Module;
struct Function;
struct BasicBlock;
struct Instr;
struct Value;
struct Signature;
} // namespace il::core
