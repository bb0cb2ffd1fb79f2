//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/abi/NativeCall.cpp
// Purpose: Host invoker used to cross-check return plans against the native
//          compiler.
// Key invariants: Register plans are read back through aggregates whose own
//                 return convention places the bytes of each return register
//                 in order: two general purpose words, two SSE eightbytes
//                 (x86-64), or four HFA members (AArch64).
//
//===----------------------------------------------------------------------===//

#include "codegen/abi/NativeCall.hpp"

#include <cstring>

namespace qshade::codegen::abi
{
namespace
{

struct GprPair64
{
    uint64_t reg[2];
};

struct GprPair32
{
    uint32_t reg[2];
};

struct SsePair
{
    double reg[2];
};

struct HfaQuad
{
    float reg[4];
};

/// Call @p fn as R(A...) with the first N elements of @p args.
template <typename R, typename A> R callWith(const void *fn, const A *args, size_t count)
{
    switch (count)
    {
        case 0:
            return reinterpret_cast<R (*)()>(const_cast<void *>(fn))();
        case 1:
            return reinterpret_cast<R (*)(A)>(const_cast<void *>(fn))(args[0]);
        case 2:
            return reinterpret_cast<R (*)(A, A)>(const_cast<void *>(fn))(args[0], args[1]);
        case 3:
            return reinterpret_cast<R (*)(A, A, A)>(const_cast<void *>(fn))(args[0], args[1], args[2]);
        default:
            return reinterpret_cast<R (*)(A, A, A, A)>(const_cast<void *>(fn))(args[0], args[1], args[2], args[3]);
    }
}

/// Call @p fn as void(void *, A...) passing @p out as the hidden buffer.
template <typename A> void callWithBuffer(const void *fn, void *out, const A *args, size_t count)
{
    switch (count)
    {
        case 0:
            reinterpret_cast<void (*)(void *)>(const_cast<void *>(fn))(out);
            break;
        case 1:
            reinterpret_cast<void (*)(void *, A)>(const_cast<void *>(fn))(out, args[0]);
            break;
        case 2:
            reinterpret_cast<void (*)(void *, A, A)>(const_cast<void *>(fn))(out, args[0], args[1]);
            break;
        case 3:
            reinterpret_cast<void (*)(void *, A, A, A)>(const_cast<void *>(fn))(out, args[0], args[1], args[2]);
            break;
        default:
            reinterpret_cast<void (*)(void *, A, A, A, A)>(const_cast<void *>(fn))(
                out, args[0], args[1], args[2], args[3]);
            break;
    }
}

/// Copy each value from its register image into the output buffer.
template <typename Regs> void scatter(const Regs &regs, const ReturnPlan &plan, void *out)
{
    const auto *bytes = reinterpret_cast<const unsigned char *>(regs.reg);
    const size_t regBytes = sizeof(regs.reg[0]);
    for (size_t i = 0; i < plan.locations.size(); ++i)
    {
        const auto &loc = plan.locations[i];
        std::memcpy(static_cast<unsigned char *>(out) + plan.bufferOffset(i),
                    bytes + loc.regIndex * regBytes + loc.byteOffset,
                    plan.elementSize);
    }
}

template <typename A>
il::support::Expected<void> dispatch(
    const void *fn, const ReturnPlan &plan, const TargetInfo &target, const A *args, size_t count, void *out)
{
    if (plan.usesStructReturn())
    {
        callWithBuffer<A>(fn, out, args, count);
        return {};
    }

    const bool floatRegs = !plan.locations.empty() && plan.locations.front().regClass == RegClass::Float;
    if (!floatRegs)
    {
        if (target.gprBytes == 4)
            scatter(callWith<GprPair32>(fn, args, count), plan, out);
        else
            scatter(callWith<GprPair64>(fn, args, count), plan, out);
        return {};
    }
    if (target.maxHfaMembers != 0)
        scatter(callWith<HfaQuad>(fn, args, count), plan, out);
    else
        scatter(callWith<SsePair>(fn, args, count), plan, out);
    return {};
}

} // namespace

il::support::Expected<void> invokeNative(const void *fn,
                                         const ReturnPlan &plan,
                                         const TargetInfo &target,
                                         const std::vector<NativeArg> &args,
                                         void *out)
{
    if (!target.isHost())
        return il::support::makeError({}, "cannot invoke " + target.name + " code on this host");
    if (plan.usesStructReturn() && plan.sretInRegister)
    {
        return il::support::makeError(
            {}, "struct-return through " + target.sretLocation + " cannot be expressed as a C call");
    }
    if (plan.types.empty())
        return il::support::makeError({}, "native invoker requires at least one return value");
    if (args.size() > kMaxNativeArgs)
        return il::support::makeError({}, "native invoker supports at most 4 arguments");

    const bool floatArgs = !args.empty() && args.front().type.kind == il::core::Type::Kind::F32;
    int32_t ints[kMaxNativeArgs] = {};
    float floats[kMaxNativeArgs] = {};
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i].type.isFloat() != floatArgs)
            return il::support::makeError({}, "native invoker requires arguments of a single type");
        if (floatArgs)
            floats[i] = args[i].f32;
        else
            ints[i] = args[i].i32;
    }

    if (floatArgs)
        return dispatch<float>(fn, plan, target, floats, args.size(), out);
    return dispatch<int32_t>(fn, plan, target, ints, args.size(), out);
}

} // namespace qshade::codegen::abi
