//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/fixed/MemoryConverters.cpp
// Purpose: Stack addressing, loads and stores.
// Key invariants: Shapes, addresses, offsets and slots are unchanged; only the
//                 value type is re-tagged.  f32 and i32 share a 4-byte
//                 footprint so slot layouts stay valid.
//
//===----------------------------------------------------------------------===//

#include "il/transform/fixed/Converters.hpp"

#include "il/transform/TransformDriver.hpp"

using namespace il::core;

namespace il::transform::lowering
{

TransformResult<void> convertMemory(FixedPointTransform &t, TransformContext &ctx, const Instr &in)
{
    switch (in.op)
    {
        case Opcode::StackAddr:
            if (auto r = expectShape(ctx, in, 2, 1); !r)
                return r;
            return copyInstruction(ctx, in);
        case Opcode::Load:
        {
            if (auto r = expectShape(ctx, in, 2, 1); !r)
                return r;
            ctx.define(in, 0, Opcode::Load, t.mapType(in.type), ctx.mapOperands(in.operands));
            return {};
        }
        case Opcode::Store:
        {
            if (auto r = expectShape(ctx, in, 3, 0); !r)
                return r;
            Instr store;
            store.op = Opcode::Store;
            store.type = t.mapType(in.type);
            store.operands = ctx.mapOperands(in.operands);
            store.loc = in.loc;
            ctx.builder().append(std::move(store));
            return {};
        }
        default:
            return unsupportedInstruction(ctx.source().name, in);
    }
}

} // namespace il::transform::lowering
