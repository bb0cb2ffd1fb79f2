//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/fixed/CallConverters.cpp
// Purpose: Redirects calls to their fixed-point targets.
// Key invariants: A callee is resolved once per function and the redirect is
//                 cached.  Sibling functions keep their name and use their
//                 rewritten signature; their multi-value returns stay in
//                 registers.  Builtins are redirected to the FixedPoint
//                 implementation and declared once per module with the
//                 signature the target ABI requires.  A float extern the
//                 registry does not know is an error.
//
//===----------------------------------------------------------------------===//

#include "il/transform/fixed/Converters.hpp"

#include "codegen/abi/ReturnAbi.hpp"

using namespace il::core;
using il::builtins::BuiltinVariant;
namespace abi = qshade::codegen::abi;

namespace il::transform::lowering
{
namespace
{

abi::ReturnPlan registerPlan(const Signature &sig)
{
    abi::ReturnPlan plan;
    plan.types = sig.returnTypes();
    return plan;
}

TransformResult<CallTarget> resolveBuiltin(FixedPointTransform &t,
                                           TransformContext &ctx,
                                           const Instr &in,
                                           const il::builtins::BuiltinDescriptor &desc)
{
    const auto *impl = t.registry().implementationFor(desc, BuiltinVariant::FixedPoint);
    if (!impl)
        return unknownBuiltin(ctx.source().name, in);

    const Signature flat = il::builtins::flattenToIl(desc.signature, BuiltinVariant::FixedPoint);
    auto plan = abi::classifyReturns(flat.returnTypes(), t.target());
    if (!plan)
        return shapeMismatch(ctx.source().name, in, plan.error().message);
    auto legal = abi::legalizeSignature(flat, t.target());
    if (!legal)
        return shapeMismatch(ctx.source().name, in, legal.error().message);

    auto &session = ctx.session();
    if (!session.target.findExtern(impl->symbol))
        session.builder.addExtern(impl->symbol, legal.value());

    return CallTarget{impl->symbol, legal.value(), std::move(plan).value()};
}

TransformResult<CallTarget> resolveCallTarget(FixedPointTransform &t, TransformContext &ctx, const Instr &in)
{
    const auto &session = ctx.session();
    if (session.source.findFunction(in.callee))
    {
        const Signature &sig = session.functionSigs.at(in.callee);
        return CallTarget{in.callee, sig, registerPlan(sig)};
    }

    if (auto hit = t.registry().findBySymbol(in.callee))
        return resolveBuiltin(t, ctx, in, *hit->descriptor);

    const Extern *ext = session.source.findExtern(in.callee);
    if (ext && !ext->sig.mentionsFloat())
        return CallTarget{in.callee, ext->sig, registerPlan(ext->sig)};

    return unknownBuiltin(ctx.source().name, in);
}

} // namespace

TransformResult<void> convertCall(FixedPointTransform &t, TransformContext &ctx, const Instr &in)
{
    if (in.callee.empty())
        return shapeMismatch(ctx.source().name, in, "call has no callee");

    const CallTarget *target = ctx.cachedCallTarget(in.callee);
    if (!target)
    {
        auto resolved = resolveCallTarget(t, ctx, in);
        if (!resolved)
            return std::move(resolved).error();
        target = &ctx.cacheCallTarget(in.callee, std::move(resolved).value());
    }

    const size_t hidden = target->plan.usesStructReturn() ? 1 : 0;
    const size_t expectedArgs = target->signature.params.size() - hidden;
    if (in.operands.size() != expectedArgs)
    {
        return shapeMismatch(ctx.source().name,
                             in,
                             "@" + target->symbol + " takes " + std::to_string(expectedArgs) + " arguments, found " +
                                 std::to_string(in.operands.size()));
    }
    if (in.results.size() != target->plan.types.size())
    {
        return shapeMismatch(ctx.source().name,
                             in,
                             "@" + target->symbol + " returns " + std::to_string(target->plan.types.size()) +
                                 " values, found " + std::to_string(in.results.size()));
    }

    std::vector<unsigned> ids;
    ids.reserve(in.results.size());
    for (const auto &r : in.results)
        ids.push_back(r.id);

    abi::emitMultiReturnCall(
        ctx.builder(), ctx.target(), target->symbol, target->plan, ctx.mapOperands(in.operands), ids);
    for (unsigned id : ids)
        ctx.mapValue(id, Value::temp(id));
    return {};
}

} // namespace il::transform::lowering
