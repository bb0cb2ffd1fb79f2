//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/fixed/Converters.cpp
// Purpose: Shared shape checks plus the constant, passthrough and control
//          converters.
//
//===----------------------------------------------------------------------===//

#include "il/transform/fixed/Converters.hpp"

#include "il/transform/TransformDriver.hpp"

using namespace il::core;

namespace il::transform::lowering
{

TransformResult<void> expectShape(const TransformContext &ctx, const Instr &in, size_t operands, size_t results)
{
    if (in.operands.size() != operands)
    {
        return shapeMismatch(ctx.source().name,
                             in,
                             "expected " + std::to_string(operands) + " operands, found " +
                                 std::to_string(in.operands.size()));
    }
    if (in.results.size() != results)
    {
        return shapeMismatch(ctx.source().name,
                             in,
                             "expected " + std::to_string(results) + " results, found " +
                                 std::to_string(in.results.size()));
    }
    return {};
}

TransformResult<void> convertConstant(FixedPointTransform &t, TransformContext &ctx, const Instr &in)
{
    if (auto r = expectShape(ctx, in, 1, 1); !r)
        return r;

    const Value &literal = in.operands[0];
    if (in.op == Opcode::IConst)
    {
        if (literal.kind != Value::Kind::ConstInt)
            return shapeMismatch(ctx.source().name, in, "iconst operand must be an integer literal");
        ctx.define(in, 0, Opcode::IConst, in.type, {literal});
        return {};
    }

    if (literal.kind != Value::Kind::ConstFloat && literal.kind != Value::Kind::ConstInt)
        return shapeMismatch(ctx.source().name, in, "fconst operand must be a literal");
    const double x = literal.kind == Value::Kind::ConstFloat ? literal.f64 : static_cast<double>(literal.i64);
    ctx.define(in, 0, Opcode::IConst, t.mapType(in.type), {Value::constInt(il::fixed::toFixed(x))});
    return {};
}

TransformResult<void> convertPassthrough(FixedPointTransform &t, TransformContext &ctx, const Instr &in)
{
    if (in.op != Opcode::Select)
        return copyInstruction(ctx, in);

    if (auto r = expectShape(ctx, in, 3, 1); !r)
        return r;
    ctx.define(in, 0, Opcode::Select, t.mapType(in.type), ctx.mapOperands(in.operands));
    return {};
}

TransformResult<void> convertControl(FixedPointTransform &, TransformContext &ctx, const Instr &in)
{
    if (in.op == Opcode::CBr && in.operands.size() != 1)
        return shapeMismatch(ctx.source().name, in, "cbr takes exactly one condition");
    return copyInstruction(ctx, in);
}

} // namespace il::transform::lowering
