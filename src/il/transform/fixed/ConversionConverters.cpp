//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/fixed/ConversionConverters.cpp
// Purpose: Casts between the integer, float and fixed-point domains.
// Key invariants: int -> float becomes shl 16, float -> int becomes ashr 16.
//                 Float-to-float casts and the tofixed/fromfixed boundary
//                 markers become aliases of their mapped operand.
//
//===----------------------------------------------------------------------===//

#include "il/transform/fixed/Converters.hpp"

#include "il/transform/fixed/FixedLowering.hpp"

using namespace il::core;

namespace il::transform::lowering
{

TransformResult<void> convertConversion(FixedPointTransform &, TransformContext &ctx, const Instr &in)
{
    if (auto r = expectShape(ctx, in, 1, 1); !r)
        return r;

    const Value &src = in.operands[0];
    const Value operand = ctx.mapOperand(src);
    const unsigned id = in.result();
    FixedEmitter fx(ctx.builder());

    switch (in.op)
    {
        case Opcode::Sitofp:
        {
            if (src.kind == Value::Kind::ConstInt)
            {
                const auto folded = il::fixed::fromInt(static_cast<int32_t>(src.i64));
                ctx.define(in, 0, Opcode::IConst, Type(Type::Kind::I32), {Value::constInt(folded)});
                return {};
            }
            const auto from = ctx.sourceTypeOf(src);
            if (!from || !from->isInteger())
                return shapeMismatch(ctx.source().name, in, "sitofp operand must be an integer");
            fx.fromInt(operand, *from, id);
            break;
        }
        case Opcode::Fptosi:
        {
            if (!in.type.isInteger() || in.type.kind == Type::Kind::I1)
                return shapeMismatch(ctx.source().name, in, "fptosi must produce i8, i16, i32 or i64");
            fx.toInt(operand, in.type, id);
            break;
        }
        case Opcode::FPExt:
        case Opcode::FPTrunc:
        case Opcode::ToFixed:
        case Opcode::FromFixed:
            ctx.mapValue(id, operand);
            return {};
        default:
            return unsupportedInstruction(ctx.source().name, in);
    }
    ctx.mapValue(id, Value::temp(id));
    return {};
}

} // namespace il::transform::lowering
