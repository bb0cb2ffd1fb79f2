//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Opcode.hpp
// Purpose: Enumerates IL instruction opcodes.
// Key invariants: Enumeration order matches Opcode.def.
// Ownership/Lifetime: Not applicable.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>

namespace il::core
{

/// @brief All instruction opcodes defined by the IL.
enum class Opcode
{
#define IL_OPCODE(NAME, ...) NAME,
#include "il/core/Opcode.def"
#undef IL_OPCODE
    Count
};

/// @brief Total number of opcodes defined by the IL.
constexpr size_t kNumOpcodes = static_cast<size_t>(Opcode::Count);

/// @brief Convert opcode @p op to its mnemonic string.
/// @return Lowercase mnemonic; empty string for out-of-range values.
const char *toString(Opcode op);

} // namespace il::core
