//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/interp/Interpreter.cpp
// Purpose: Block-by-block execution of IL functions.
// Key invariants: Traps (division by zero, unknown callees, missing native
//                 bindings, runaway loops) are reported as diagnostics and
//                 end the call; nothing is thrown.
//
//===----------------------------------------------------------------------===//

#include "il/interp/Interpreter.hpp"

#include "il/fixed/FixedPoint.hpp"
#include "il/io/Serializer.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <memory>

using namespace il::core;
using il::support::Expected;

namespace il::interp
{
namespace
{

constexpr unsigned kMaxCallDepth = 256;

unsigned widthOf(Type t)
{
    switch (t.kind)
    {
        case Type::Kind::I1:
            return 1;
        case Type::Kind::I8:
            return 8;
        case Type::Kind::I16:
            return 16;
        case Type::Kind::I32:
            return 32;
        default:
            return 64;
    }
}

uint64_t maskTo(int64_t v, unsigned bits)
{
    const auto u = static_cast<uint64_t>(v);
    return bits >= 64 ? u : (u & ((uint64_t{1} << bits) - 1));
}

/// Re-establish the sign-extended representation for @p t.
int64_t normalize(Type t, int64_t v)
{
    switch (t.kind)
    {
        case Type::Kind::I1:
            return v & 1;
        case Type::Kind::I8:
            return static_cast<int8_t>(v);
        case Type::Kind::I16:
            return static_cast<int16_t>(v);
        case Type::Kind::I32:
            return static_cast<int32_t>(static_cast<uint32_t>(v));
        default:
            return v;
    }
}

double roundFloat(Type t, double v)
{
    return t.kind == Type::Kind::F32 ? static_cast<double>(static_cast<float>(v)) : v;
}

int64_t floatToInt(Type to, double v)
{
    if (std::isnan(v))
        return 0;
    const unsigned bits = widthOf(to);
    const double hi = std::ldexp(1.0, static_cast<int>(bits) - 1) - 1.0;
    const double lo = -std::ldexp(1.0, static_cast<int>(bits) - 1);
    if (v >= hi)
        return bits >= 64 ? std::numeric_limits<int64_t>::max() : static_cast<int64_t>(hi);
    if (v <= lo)
        return bits >= 64 ? std::numeric_limits<int64_t>::min() : static_cast<int64_t>(lo);
    return static_cast<int64_t>(std::trunc(v));
}

Slot loadFrom(const unsigned char *p, Type t)
{
    Slot s = Slot::fromInt(0);
    switch (t.kind)
    {
        case Type::Kind::I1:
        case Type::Kind::I8:
        {
            int8_t v;
            std::memcpy(&v, p, sizeof(v));
            s.i64 = normalize(t, v);
            break;
        }
        case Type::Kind::I16:
        {
            int16_t v;
            std::memcpy(&v, p, sizeof(v));
            s.i64 = v;
            break;
        }
        case Type::Kind::I32:
        {
            int32_t v;
            std::memcpy(&v, p, sizeof(v));
            s.i64 = v;
            break;
        }
        case Type::Kind::I64:
            std::memcpy(&s.i64, p, sizeof(s.i64));
            break;
        case Type::Kind::F32:
        {
            float v;
            std::memcpy(&v, p, sizeof(v));
            s.f64 = v;
            break;
        }
        case Type::Kind::F64:
            std::memcpy(&s.f64, p, sizeof(s.f64));
            break;
        case Type::Kind::Ptr:
            std::memcpy(&s.ptr, p, sizeof(s.ptr));
            break;
        case Type::Kind::Void:
            break;
    }
    return s;
}

void storeTo(unsigned char *p, Type t, Slot s)
{
    switch (t.kind)
    {
        case Type::Kind::I1:
        case Type::Kind::I8:
        {
            const auto v = static_cast<int8_t>(s.i64);
            std::memcpy(p, &v, sizeof(v));
            break;
        }
        case Type::Kind::I16:
        {
            const auto v = static_cast<int16_t>(s.i64);
            std::memcpy(p, &v, sizeof(v));
            break;
        }
        case Type::Kind::I32:
        {
            const auto v = static_cast<int32_t>(s.i64);
            std::memcpy(p, &v, sizeof(v));
            break;
        }
        case Type::Kind::I64:
            std::memcpy(p, &s.i64, sizeof(s.i64));
            break;
        case Type::Kind::F32:
        {
            const auto v = static_cast<float>(s.f64);
            std::memcpy(p, &v, sizeof(v));
            break;
        }
        case Type::Kind::F64:
            std::memcpy(p, &s.f64, sizeof(s.f64));
            break;
        case Type::Kind::Ptr:
            std::memcpy(p, &s.ptr, sizeof(s.ptr));
            break;
        case Type::Kind::Void:
            break;
    }
}

/// Boxed native argument or result lane.
union Cell
{
    int8_t i8;
    int16_t i16;
    int32_t i32;
    int64_t i64;
    float f32;
    double f64;
    void *ptr;
};

Cell toCell(Type t, Slot s)
{
    Cell c{};
    switch (t.kind)
    {
        case Type::Kind::I1:
        case Type::Kind::I8:
            c.i8 = static_cast<int8_t>(s.i64);
            break;
        case Type::Kind::I16:
            c.i16 = static_cast<int16_t>(s.i64);
            break;
        case Type::Kind::I32:
            c.i32 = static_cast<int32_t>(s.i64);
            break;
        case Type::Kind::F32:
            c.f32 = static_cast<float>(s.f64);
            break;
        case Type::Kind::F64:
            c.f64 = s.f64;
            break;
        case Type::Kind::Ptr:
            c.ptr = s.ptr;
            break;
        default:
            c.i64 = s.i64;
            break;
    }
    return c;
}

il::support::Diag trap(const Function &fn, const Instr *in, const std::string &msg)
{
    std::string text = "trap in @" + fn.name;
    if (in)
        text += " at '" + il::io::formatInstr(*in) + "'";
    text += ": " + msg;
    return il::support::makeError(in ? in->loc : il::support::SourceLoc{}, text);
}

} // namespace

Interpreter::Interpreter(const Module &module, const il::builtins::BuiltinRegistry *registry)
    : module_(module), registry_(registry)
{
}

const Interpreter::FunctionInfo &Interpreter::infoFor(const Function &fn)
{
    auto it = infos_.find(&fn);
    if (it != infos_.end())
        return it->second;

    FunctionInfo info;
    info.types.resize(fn.nextTempId());
    for (size_t b = 0; b < fn.blocks.size(); ++b)
    {
        const auto &bb = fn.blocks[b];
        info.blocks.emplace(bb.label, b);
        for (const auto &p : bb.params)
            info.types[p.id] = p.type;
        for (const auto &in : bb.instructions)
        {
            for (const auto &r : in.results)
                info.types[r.id] = r.type;
        }
    }
    return infos_.emplace(&fn, std::move(info)).first->second;
}

Expected<std::vector<Slot>> Interpreter::call(const std::string &name, const std::vector<Slot> &args)
{
    steps_ = 0;
    const Function *fn = module_.findFunction(name);
    if (!fn)
        return il::support::makeError({}, "unknown function @" + name);
    return run(*fn, args, 0);
}

Expected<std::vector<Slot>> Interpreter::callExtern(const Extern &ext, const std::vector<Slot> &args)
{
    const auto hit = registry_ ? registry_->findBySymbol(ext.name) : std::nullopt;
    if (!hit || !hit->impl->handler)
        return il::support::makeError({}, "no native binding for @" + ext.name);

    const int sret = ext.sig.structReturnIndex();
    std::vector<Cell> cells;
    std::vector<void *> argv;
    cells.reserve(args.size());
    for (size_t i = 0; i < args.size() && i < ext.sig.params.size(); ++i)
    {
        if (static_cast<int>(i) == sret)
            continue;
        cells.push_back(toCell(ext.sig.params[i].type, args[i]));
    }
    for (auto &c : cells)
        argv.push_back(&c);

    if (sret >= 0)
    {
        // The callee's lanes land directly in the caller's buffer.
        hit->impl->handler(argv.data(), args[static_cast<size_t>(sret)].ptr);
        return std::vector<Slot>{};
    }

    alignas(16) unsigned char result[64] = {};
    hit->impl->handler(argv.data(), result);

    std::vector<Slot> out;
    size_t offset = 0;
    for (const auto &r : ext.sig.returns)
    {
        out.push_back(loadFrom(result + offset, r.type));
        offset += sizeInBytes(r.type);
    }
    return out;
}

Expected<std::vector<Slot>> Interpreter::run(const Function &fn, const std::vector<Slot> &args, unsigned depth)
{
    if (depth > kMaxCallDepth)
        return trap(fn, nullptr, "call depth exceeded");
    if (fn.blocks.empty())
        return trap(fn, nullptr, "function has no body");

    const FunctionInfo &info = infoFor(fn);
    std::vector<Slot> regs(info.types.size(), Slot::fromInt(0));

    std::vector<std::unique_ptr<unsigned char[]>> frame;
    frame.reserve(fn.stackSlots.size());
    for (const auto &slot : fn.stackSlots)
        frame.push_back(std::make_unique<unsigned char[]>(slot.size == 0 ? 1 : slot.size));

    const BasicBlock *bb = &fn.blocks.front();
    if (args.size() != bb->params.size())
        return trap(fn, nullptr, "expected " + std::to_string(bb->params.size()) + " arguments");
    for (size_t i = 0; i < args.size(); ++i)
        regs[bb->params[i].id] = args[i];

    auto eval = [&](const Value &v) -> Slot
    {
        switch (v.kind)
        {
            case Value::Kind::Temp:
                return regs[v.id];
            case Value::Kind::ConstInt:
                return Slot::fromInt(v.i64);
            case Value::Kind::ConstFloat:
                return Slot::fromFloat(v.f64);
            case Value::Kind::NullPtr:
                return Slot::fromPtr(nullptr);
        }
        return Slot::fromInt(0);
    };

    auto typeOf = [&](const Value &v, Type fallback) -> Type
    {
        if (v.kind == Value::Kind::Temp && v.id < info.types.size())
            return info.types[v.id];
        return fallback;
    };

    auto jump = [&](const std::string &label, const std::vector<Value> &brArgs, const Instr &in)
        -> Expected<const BasicBlock *>
    {
        auto it = info.blocks.find(label);
        if (it == info.blocks.end())
            return trap(fn, &in, "unknown label " + label);
        const BasicBlock *target = &fn.blocks[it->second];
        if (target->params.size() != brArgs.size())
            return trap(fn, &in, "branch argument count mismatch");
        std::vector<Slot> incoming;
        incoming.reserve(brArgs.size());
        for (const auto &a : brArgs)
            incoming.push_back(eval(a));
        for (size_t i = 0; i < incoming.size(); ++i)
            regs[target->params[i].id] = incoming[i];
        return target;
    };

    while (true)
    {
        const BasicBlock *next = nullptr;
        for (const auto &in : bb->instructions)
        {
            if (stepLimit_ != 0 && ++steps_ > stepLimit_)
                return trap(fn, &in, "step limit exceeded");

            const Type ty = in.type;
            auto operand = [&](size_t i) { return eval(in.operands[i]); };
            auto setResult = [&](Slot s) { regs[in.result()] = s; };

            switch (in.op)
            {
                case Opcode::IConst:
                    setResult(Slot::fromInt(normalize(ty, operand(0).i64)));
                    break;
                case Opcode::FConst:
                {
                    const Value &lit = in.operands[0];
                    const double x = lit.kind == Value::Kind::ConstFloat ? lit.f64 : static_cast<double>(lit.i64);
                    setResult(Slot::fromFloat(roundFloat(ty, x)));
                    break;
                }

                case Opcode::Add:
                case Opcode::Sub:
                case Opcode::Mul:
                case Opcode::And:
                case Opcode::Or:
                case Opcode::Xor:
                {
                    const auto a = static_cast<uint64_t>(operand(0).i64);
                    const auto b = static_cast<uint64_t>(operand(1).i64);
                    uint64_t r = 0;
                    switch (in.op)
                    {
                        case Opcode::Add:
                            r = a + b;
                            break;
                        case Opcode::Sub:
                            r = a - b;
                            break;
                        case Opcode::Mul:
                            r = a * b;
                            break;
                        case Opcode::And:
                            r = a & b;
                            break;
                        case Opcode::Or:
                            r = a | b;
                            break;
                        default:
                            r = a ^ b;
                            break;
                    }
                    setResult(Slot::fromInt(normalize(ty, static_cast<int64_t>(r))));
                    break;
                }
                case Opcode::SDiv:
                case Opcode::SRem:
                {
                    const int64_t a = operand(0).i64;
                    const int64_t b = operand(1).i64;
                    if (b == 0)
                        return trap(fn, &in, "division by zero");
                    int64_t r = 0;
                    if (b == -1)
                        r = in.op == Opcode::SDiv ? static_cast<int64_t>(0 - static_cast<uint64_t>(a)) : 0;
                    else
                        r = in.op == Opcode::SDiv ? a / b : a % b;
                    setResult(Slot::fromInt(normalize(ty, r)));
                    break;
                }
                case Opcode::UDiv:
                case Opcode::URem:
                {
                    const unsigned bits = widthOf(ty);
                    const uint64_t a = maskTo(operand(0).i64, bits);
                    const uint64_t b = maskTo(operand(1).i64, bits);
                    if (b == 0)
                        return trap(fn, &in, "division by zero");
                    const uint64_t r = in.op == Opcode::UDiv ? a / b : a % b;
                    setResult(Slot::fromInt(normalize(ty, static_cast<int64_t>(r))));
                    break;
                }
                case Opcode::Shl:
                case Opcode::LShr:
                case Opcode::AShr:
                {
                    const unsigned bits = widthOf(ty);
                    const unsigned amount = static_cast<unsigned>(operand(1).i64) & (bits - 1);
                    const int64_t a = operand(0).i64;
                    int64_t r = 0;
                    if (in.op == Opcode::Shl)
                        r = static_cast<int64_t>(static_cast<uint64_t>(a) << amount);
                    else if (in.op == Opcode::LShr)
                        r = static_cast<int64_t>(maskTo(a, bits) >> amount);
                    else
                        r = a >> amount;
                    setResult(Slot::fromInt(normalize(ty, r)));
                    break;
                }
                case Opcode::ICmpEq:
                case Opcode::ICmpNe:
                case Opcode::SCmpLT:
                case Opcode::SCmpLE:
                case Opcode::SCmpGT:
                case Opcode::SCmpGE:
                {
                    const int64_t a = operand(0).i64;
                    const int64_t b = operand(1).i64;
                    bool r = false;
                    switch (in.op)
                    {
                        case Opcode::ICmpEq:
                            r = a == b;
                            break;
                        case Opcode::ICmpNe:
                            r = a != b;
                            break;
                        case Opcode::SCmpLT:
                            r = a < b;
                            break;
                        case Opcode::SCmpLE:
                            r = a <= b;
                            break;
                        case Opcode::SCmpGT:
                            r = a > b;
                            break;
                        default:
                            r = a >= b;
                            break;
                    }
                    setResult(Slot::fromInt(r ? 1 : 0));
                    break;
                }
                case Opcode::UCmpLT:
                case Opcode::UCmpLE:
                case Opcode::UCmpGT:
                case Opcode::UCmpGE:
                {
                    const Type opTy = typeOf(in.operands[0], typeOf(in.operands[1], Type(Type::Kind::I64)));
                    const unsigned bits = widthOf(opTy);
                    const uint64_t a = maskTo(operand(0).i64, bits);
                    const uint64_t b = maskTo(operand(1).i64, bits);
                    bool r = false;
                    switch (in.op)
                    {
                        case Opcode::UCmpLT:
                            r = a < b;
                            break;
                        case Opcode::UCmpLE:
                            r = a <= b;
                            break;
                        case Opcode::UCmpGT:
                            r = a > b;
                            break;
                        default:
                            r = a >= b;
                            break;
                    }
                    setResult(Slot::fromInt(r ? 1 : 0));
                    break;
                }
                case Opcode::Sext:
                {
                    const Type from = typeOf(in.operands[0], ty);
                    int64_t v = operand(0).i64;
                    if (from.kind == Type::Kind::I1)
                        v = (v & 1) ? -1 : 0;
                    setResult(Slot::fromInt(normalize(ty, v)));
                    break;
                }
                case Opcode::Zext:
                case Opcode::Zext1:
                {
                    const Type from = in.op == Opcode::Zext1 ? Type(Type::Kind::I1) : typeOf(in.operands[0], ty);
                    const uint64_t v = maskTo(operand(0).i64, widthOf(from));
                    setResult(Slot::fromInt(normalize(ty, static_cast<int64_t>(v))));
                    break;
                }
                case Opcode::Trunc:
                    setResult(Slot::fromInt(normalize(ty, operand(0).i64)));
                    break;
                case Opcode::Trunc1:
                    setResult(Slot::fromInt(operand(0).i64 & 1));
                    break;
                case Opcode::Select:
                    setResult((operand(0).i64 & 1) ? operand(1) : operand(2));
                    break;

                case Opcode::FAdd:
                case Opcode::FSub:
                case Opcode::FMul:
                case Opcode::FDiv:
                case Opcode::FMin:
                case Opcode::FMax:
                case Opcode::FRem:
                {
                    const double a = operand(0).f64;
                    const double b = operand(1).f64;
                    double r = 0.0;
                    if (ty.kind == Type::Kind::F32)
                    {
                        const auto fa = static_cast<float>(a);
                        const auto fb = static_cast<float>(b);
                        switch (in.op)
                        {
                            case Opcode::FAdd:
                                r = fa + fb;
                                break;
                            case Opcode::FSub:
                                r = fa - fb;
                                break;
                            case Opcode::FMul:
                                r = fa * fb;
                                break;
                            case Opcode::FDiv:
                                r = fa / fb;
                                break;
                            case Opcode::FMin:
                                r = std::fmin(fa, fb);
                                break;
                            case Opcode::FMax:
                                r = std::fmax(fa, fb);
                                break;
                            default:
                                r = std::fmod(fa, fb);
                                break;
                        }
                    }
                    else
                    {
                        switch (in.op)
                        {
                            case Opcode::FAdd:
                                r = a + b;
                                break;
                            case Opcode::FSub:
                                r = a - b;
                                break;
                            case Opcode::FMul:
                                r = a * b;
                                break;
                            case Opcode::FDiv:
                                r = a / b;
                                break;
                            case Opcode::FMin:
                                r = std::fmin(a, b);
                                break;
                            case Opcode::FMax:
                                r = std::fmax(a, b);
                                break;
                            default:
                                r = std::fmod(a, b);
                                break;
                        }
                    }
                    setResult(Slot::fromFloat(roundFloat(ty, r)));
                    break;
                }
                case Opcode::FNeg:
                    setResult(Slot::fromFloat(-operand(0).f64));
                    break;
                case Opcode::FAbs:
                    setResult(Slot::fromFloat(std::fabs(operand(0).f64)));
                    break;
                case Opcode::FSqrt:
                {
                    const double x = operand(0).f64;
                    const double r = ty.kind == Type::Kind::F32 ? std::sqrt(static_cast<float>(x)) : std::sqrt(x);
                    setResult(Slot::fromFloat(roundFloat(ty, r)));
                    break;
                }
                case Opcode::FCmpEQ:
                case Opcode::FCmpNE:
                case Opcode::FCmpLT:
                case Opcode::FCmpLE:
                case Opcode::FCmpGT:
                case Opcode::FCmpGE:
                {
                    const double a = operand(0).f64;
                    const double b = operand(1).f64;
                    bool r = false;
                    switch (in.op)
                    {
                        case Opcode::FCmpEQ:
                            r = a == b;
                            break;
                        case Opcode::FCmpNE:
                            r = a != b;
                            break;
                        case Opcode::FCmpLT:
                            r = a < b;
                            break;
                        case Opcode::FCmpLE:
                            r = a <= b;
                            break;
                        case Opcode::FCmpGT:
                            r = a > b;
                            break;
                        default:
                            r = a >= b;
                            break;
                    }
                    setResult(Slot::fromInt(r ? 1 : 0));
                    break;
                }

                case Opcode::Sitofp:
                {
                    int64_t v = operand(0).i64;
                    if (typeOf(in.operands[0], Type(Type::Kind::I64)).kind == Type::Kind::I1)
                        v = (v & 1) ? -1 : 0;
                    setResult(Slot::fromFloat(roundFloat(ty, static_cast<double>(v))));
                    break;
                }
                case Opcode::Fptosi:
                    setResult(Slot::fromInt(floatToInt(ty, operand(0).f64)));
                    break;
                case Opcode::FPExt:
                case Opcode::FPTrunc:
                    setResult(Slot::fromFloat(roundFloat(ty, operand(0).f64)));
                    break;
                case Opcode::ToFixed:
                    setResult(Slot::fromInt(il::fixed::toFixed(operand(0).f64)));
                    break;
                case Opcode::FromFixed:
                    setResult(Slot::fromFloat(
                        roundFloat(ty, il::fixed::toFloat(static_cast<int32_t>(operand(0).i64)))));
                    break;

                case Opcode::StackAddr:
                {
                    const int64_t slot = operand(0).i64;
                    if (slot < 0 || static_cast<size_t>(slot) >= frame.size())
                        return trap(fn, &in, "invalid stack slot");
                    setResult(Slot::fromPtr(frame[static_cast<size_t>(slot)].get() + operand(1).i64));
                    break;
                }
                case Opcode::Load:
                {
                    auto *base = static_cast<unsigned char *>(operand(0).ptr);
                    if (!base)
                        return trap(fn, &in, "null dereference");
                    setResult(loadFrom(base + operand(1).i64, ty));
                    break;
                }
                case Opcode::Store:
                {
                    auto *base = static_cast<unsigned char *>(operand(0).ptr);
                    if (!base)
                        return trap(fn, &in, "null dereference");
                    storeTo(base + operand(2).i64, ty, operand(1));
                    break;
                }

                case Opcode::Call:
                {
                    std::vector<Slot> callArgs;
                    callArgs.reserve(in.operands.size());
                    for (const auto &v : in.operands)
                        callArgs.push_back(eval(v));

                    Expected<std::vector<Slot>> results = std::vector<Slot>{};
                    if (const Function *callee = module_.findFunction(in.callee))
                        results = run(*callee, callArgs, depth + 1);
                    else if (const Extern *ext = module_.findExtern(in.callee))
                        results = callExtern(*ext, callArgs);
                    else
                        return trap(fn, &in, "unknown callee @" + in.callee);
                    if (!results)
                        return results;
                    if (results.value().size() != in.results.size())
                        return trap(fn, &in, "callee returned a different number of values");
                    for (size_t i = 0; i < in.results.size(); ++i)
                        regs[in.results[i].id] = results.value()[i];
                    break;
                }

                case Opcode::Br:
                {
                    auto target = jump(in.labels[0], in.brArgs[0], in);
                    if (!target)
                        return target.error();
                    next = target.value();
                    break;
                }
                case Opcode::CBr:
                {
                    const size_t arm = (operand(0).i64 & 1) ? 0 : 1;
                    auto target = jump(in.labels[arm], in.brArgs[arm], in);
                    if (!target)
                        return target.error();
                    next = target.value();
                    break;
                }
                case Opcode::Ret:
                {
                    std::vector<Slot> out;
                    out.reserve(in.operands.size());
                    for (const auto &v : in.operands)
                        out.push_back(eval(v));
                    return out;
                }
            }
            if (next)
                break;
        }
        if (!next)
            return trap(fn, nullptr, "block " + bb->label + " fell through");
        bb = next;
    }
}

} // namespace il::interp
