//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/OpcodeNames.cpp
// Purpose: Mnemonic lookup for IL opcodes generated from Opcode.def.
//
//===----------------------------------------------------------------------===//

#include "il/core/Opcode.hpp"

#include <array>

namespace il::core
{
namespace
{
/// Array order mirrors the Opcode enumeration for O(1) translation.
constexpr std::array<const char *, kNumOpcodes> kOpcodeNames = {
#define IL_OPCODE(NAME, MNEMONIC, ...) MNEMONIC,
#include "il/core/Opcode.def"
#undef IL_OPCODE
};

static_assert(kOpcodeNames.size() == kNumOpcodes, "Opcode name table must match enum count");
} // namespace

const char *toString(Opcode op)
{
    const size_t index = static_cast<size_t>(op);
    if (index < kOpcodeNames.size())
        return kOpcodeNames[index];
    return "";
}

} // namespace il::core
