//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/fixed/ArithmeticConverters.cpp
// Purpose: Float arithmetic and comparison converters.
// Key invariants: Results carry the source result id and type i32 (i1 for
//                 comparisons).
//
//===----------------------------------------------------------------------===//

#include "il/transform/fixed/Converters.hpp"

#include "il/transform/fixed/FixedLowering.hpp"

using namespace il::core;

namespace il::transform::lowering
{

TransformResult<void> convertFloatArith(FixedPointTransform &, TransformContext &ctx, const Instr &in)
{
    const auto &info = getOpcodeInfo(in.op);
    if (auto r = expectShape(ctx, in, info.numOperandsMin, 1); !r)
        return r;
    if (!in.type.isFloat())
        return shapeMismatch(ctx.source().name, in, "operation type must be f32 or f64");

    const std::vector<Value> ops = ctx.mapOperands(in.operands);
    const unsigned id = in.result();
    FixedEmitter fx(ctx.builder());
    switch (in.op)
    {
        case Opcode::FAdd:
            fx.add(ops[0], ops[1], id);
            break;
        case Opcode::FSub:
            fx.sub(ops[0], ops[1], id);
            break;
        case Opcode::FMul:
            fx.mul(ops[0], ops[1], id);
            break;
        case Opcode::FDiv:
            fx.div(ops[0], ops[1], id);
            break;
        case Opcode::FNeg:
            fx.neg(ops[0], id);
            break;
        case Opcode::FAbs:
            fx.abs(ops[0], id);
            break;
        case Opcode::FMin:
            fx.min(ops[0], ops[1], id);
            break;
        case Opcode::FMax:
            fx.max(ops[0], ops[1], id);
            break;
        case Opcode::FSqrt:
            fx.sqrt(ops[0], id);
            break;
        default:
            return unsupportedInstruction(ctx.source().name, in);
    }
    ctx.mapValue(id, Value::temp(id));
    return {};
}

TransformResult<void> convertFloatCompare(FixedPointTransform &, TransformContext &ctx, const Instr &in)
{
    if (auto r = expectShape(ctx, in, 2, 1); !r)
        return r;
    if (!FixedEmitter::compareOpcodeFor(in.op))
        return unsupportedInstruction(ctx.source().name, in);

    const std::vector<Value> ops = ctx.mapOperands(in.operands);
    const unsigned id = in.result();
    FixedEmitter(ctx.builder()).compare(in.op, ops[0], ops[1], id);
    ctx.mapValue(id, Value::temp(id));
    return {};
}

} // namespace il::transform::lowering
