//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/TransformDriver.cpp
// Purpose: Block-first function rewrite loop and module driver.
// Key invariants: Every source id is defined once; a second definition is
//                 reported before the instruction is rewritten.  Temporaries
//                 introduced by a transform are numbered above every id of
//                 the source function, so ids carried over from the source
//                 never collide with fresh ones.
//
//===----------------------------------------------------------------------===//

#include "il/transform/TransformDriver.hpp"

#include "il/core/OpcodeInfo.hpp"

#include <string>

using namespace il::core;

namespace il::transform
{

Signature FunctionTransform::mapSignature(const Signature &sig) const
{
    Signature out;
    for (const auto &p : sig.params)
        out.params.emplace_back(mapType(p.type), p.purpose);
    for (const auto &r : sig.returns)
        out.returns.emplace_back(mapType(r.type), r.purpose);
    return out;
}

TransformResult<Function> transformFunctionBody(TransformSession &session,
                                                FunctionTransform &transform,
                                                const Function &source,
                                                Signature newSig)
{
    Function out;
    out.name = source.name;
    out.sig = std::move(newSig);
    out.valueNames = source.valueNames;

    TransformContext ctx(session, transform, source, out);

    auto definedTwice = [&](const Instr &at, unsigned id)
    { return shapeMismatch(source.name, at, "value %" + std::to_string(id) + " is defined twice"); };

    out.blocks.reserve(source.blocks.size());
    for (const auto &bb : source.blocks)
    {
        BasicBlock nb;
        nb.label = bb.label;
        for (const auto &p : bb.params)
        {
            Param np = p;
            np.type = transform.mapType(p.type);
            if (ctx.isMapped(p.id))
                return definedTwice(bb.instructions.empty() ? Instr{} : bb.instructions.front(), p.id);
            nb.params.push_back(np);
            ctx.mapValue(p.id, Value::temp(np.id));
        }
        out.blocks.push_back(std::move(nb));
        ctx.mapBlock(bb.label, out.blocks.back().label);
    }

    for (size_t i = 0; i < source.stackSlots.size(); ++i)
    {
        out.stackSlots.push_back(source.stackSlots[i]);
        ctx.mapStackSlot(static_cast<unsigned>(i), static_cast<unsigned>(i));
    }

    auto &builder = session.builder;
    builder.continueFunction(out);
    builder.reserveTempsBelow(source.nextTempId());

    for (size_t b = 0; b < source.blocks.size(); ++b)
    {
        builder.setInsertPoint(out.blocks[b]);
        for (const auto &in : source.blocks[b].instructions)
        {
            builder.setLoc(in.loc);
            for (size_t k = 0; k < in.results.size(); ++k)
            {
                const unsigned id = in.results[k].id;
                bool repeated = ctx.isMapped(id);
                for (size_t j = 0; j < k && !repeated; ++j)
                    repeated = in.results[j].id == id;
                if (repeated)
                    return definedTwice(in, id);
            }
            if (auto r = transform.transformInstr(ctx, in); !r)
                return std::move(r).error();
        }
    }

    // A use visited before its definition became an alias still names the
    // source id; resolve those now that the value map is complete.
    auto resolve = [&](Value &v)
    {
        for (size_t hops = 0; v.isTemp() && hops < source.nextTempId(); ++hops)
        {
            const Value mapped = ctx.mapOperand(v);
            if (mapped == v)
                break;
            v = mapped;
        }
    };
    for (auto &bb : out.blocks)
    {
        for (auto &in : bb.instructions)
        {
            for (auto &v : in.operands)
                resolve(v);
            for (auto &args : in.brArgs)
            {
                for (auto &v : args)
                    resolve(v);
            }
        }
    }
    return out;
}

TransformResult<void> copyInstruction(TransformContext &ctx, const Instr &in)
{
    Instr copy = in;
    copy.operands = ctx.mapOperands(in.operands);
    for (auto &args : copy.brArgs)
        args = ctx.mapOperands(args);
    for (auto &label : copy.labels)
    {
        const std::string *mapped = ctx.blockFor(label);
        if (!mapped)
            return shapeMismatch(ctx.source().name, in, "unknown branch target '" + label + "'");
        label = *mapped;
    }
    if (in.op == Opcode::StackAddr)
    {
        const Value &slot = in.operands[0];
        const auto mapped = slot.kind == Value::Kind::ConstInt && slot.i64 >= 0
                                ? ctx.stackSlotFor(static_cast<unsigned>(slot.i64))
                                : std::nullopt;
        if (!mapped)
            return shapeMismatch(ctx.source().name, in, "stack slot operand does not name a slot");
        copy.operands[0] = Value::constInt(*mapped);
    }
    for (const auto &r : in.results)
        ctx.mapValue(r.id, Value::temp(r.id));
    ctx.builder().append(std::move(copy));
    return {};
}

TransformResult<Module> transformModule(const Module &source, FunctionTransform &transform, std::ostream *trace)
{
    Module out;
    TransformSession session(source, out);
    session.trace = trace;

    for (const auto &fn : source.functions)
        session.functionSigs.emplace(fn.name, transform.mapSignature(fn.sig));

    if (auto r = transform.beginModule(session); !r)
        return std::move(r).error();

    out.functions.reserve(source.functions.size());
    for (const auto &fn : source.functions)
    {
        if (trace)
            *trace << "[" << transform.name() << "] rewriting @" << fn.name << "\n";
        auto rewritten = transformFunctionBody(session, transform, fn, session.functionSigs.at(fn.name));
        if (!rewritten)
        {
            if (trace)
                *trace << "[" << transform.name() << "] failed @" << fn.name << ": "
                       << rewritten.error().message << "\n";
            return std::move(rewritten).error();
        }
        out.functions.push_back(std::move(rewritten).value());
    }
    return out;
}

} // namespace il::transform
