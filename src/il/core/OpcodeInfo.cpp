//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/OpcodeInfo.cpp
// Purpose: Materialises the opcode metadata table from Opcode.def.
//
//===----------------------------------------------------------------------===//

#include "il/core/OpcodeInfo.hpp"

#include <array>

namespace il::core
{
namespace
{
const std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable = {{
#define IL_OPCODE(NAME, MNEMONIC, CATEGORY, RESULTS, MIN_OPS, MAX_OPS, SIDE_EFFECTS, TERMINATOR)    \
    {MNEMONIC,                                                                                     \
     OpcodeCategory::CATEGORY,                                                                     \
     ResultArity::RESULTS,                                                                         \
     MIN_OPS,                                                                                      \
     MAX_OPS,                                                                                      \
     SIDE_EFFECTS,                                                                                 \
     TERMINATOR},
#include "il/core/Opcode.def"
#undef IL_OPCODE
}};

static_assert(kOpcodeTable.size() == kNumOpcodes, "Opcode table must match enum count");
} // namespace

const OpcodeInfo &getOpcodeInfo(Opcode op)
{
    return kOpcodeTable[static_cast<size_t>(op)];
}

std::vector<Opcode> all_opcodes()
{
    std::vector<Opcode> ops;
    ops.reserve(kNumOpcodes);
    for (size_t i = 0; i < kNumOpcodes; ++i)
        ops.push_back(static_cast<Opcode>(i));
    return ops;
}

const char *toString(OpcodeCategory category)
{
    switch (category)
    {
        case OpcodeCategory::Constant:
            return "constant";
        case OpcodeCategory::Integer:
            return "integer";
        case OpcodeCategory::Boolean:
            return "boolean";
        case OpcodeCategory::FloatArith:
            return "float-arith";
        case OpcodeCategory::FloatCompare:
            return "float-compare";
        case OpcodeCategory::Conversion:
            return "conversion";
        case OpcodeCategory::Memory:
            return "memory";
        case OpcodeCategory::Call:
            return "call";
        case OpcodeCategory::Control:
            return "control";
        case OpcodeCategory::FloatRemainder:
            return "float-remainder";
        case OpcodeCategory::Count:
            break;
    }
    return "";
}

} // namespace il::core
