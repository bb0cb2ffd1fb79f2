//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/verify/Verifier.cpp
// Purpose: Structural IL verification.
// Key invariants: Reports the first violation only; never mutates the input.
//
//===----------------------------------------------------------------------===//

#include "il/verify/Verifier.hpp"

#include "il/core/Module.hpp"
#include "il/core/OpcodeInfo.hpp"
#include "il/io/Serializer.hpp"

#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace il::verify
{
using namespace il::core;
using il::support::Expected;
using il::support::makeError;

namespace
{
using TypeMap = std::unordered_map<unsigned, Type>;

il::support::Diag fail(const Function &fn, const Instr *in, const std::string &msg)
{
    std::ostringstream os;
    os << fn.name << ": ";
    if (in)
        os << "'" << il::io::formatInstr(*in) << "': ";
    os << msg;
    return makeError(in ? in->loc : il::support::SourceLoc{}, os.str());
}

/// @brief Type of @p v when it is a defined temporary, or nullptr.
const Type *typeOf(const TypeMap &types, const Value &v)
{
    if (v.kind != Value::Kind::Temp)
        return nullptr;
    auto it = types.find(v.id);
    return it == types.end() ? nullptr : &it->second;
}

const Signature *findCallee(const Module &m, const std::string &name)
{
    if (const Function *fn = m.findFunction(name))
        return &fn->sig;
    if (const Extern *ext = m.findExtern(name))
        return &ext->sig;
    return nullptr;
}

Expected<void> checkBranchArgs(const Function &fn, const Instr &in, const TypeMap &types)
{
    if (in.brArgs.size() != in.labels.size())
        return fail(fn, &in, "branch argument lists do not match targets");
    for (size_t t = 0; t < in.labels.size(); ++t)
    {
        const BasicBlock *target = fn.findBlock(in.labels[t]);
        if (!target)
            return fail(fn, &in, "unknown label " + in.labels[t]);
        if (target->params.size() != in.brArgs[t].size())
            return fail(fn, &in, "argument count mismatch for " + in.labels[t]);
        for (size_t i = 0; i < target->params.size(); ++i)
        {
            const Type *ty = typeOf(types, in.brArgs[t][i]);
            if (ty && *ty != target->params[i].type)
                return fail(fn, &in, "argument type mismatch for " + in.labels[t]);
        }
    }
    return {};
}

Expected<void> checkOperandTypes(const Function &fn, const Instr &in, const TypeMap &types)
{
    const auto &info = getOpcodeInfo(in.op);
    auto expectAll = [&](Type expected, size_t count) -> Expected<void> {
        for (size_t i = 0; i < count && i < in.operands.size(); ++i)
        {
            const Type *ty = typeOf(types, in.operands[i]);
            if (ty && *ty != expected)
                return fail(fn, &in, "operand " + std::to_string(i) + " has type " + ty->toString() +
                                         ", expected " + expected.toString());
        }
        return {};
    };

    switch (info.category)
    {
        case OpcodeCategory::FloatArith:
            if (!in.type.isFloat())
                return fail(fn, &in, "float arithmetic on non-float type");
            return expectAll(in.type, in.operands.size());
        case OpcodeCategory::FloatCompare:
        {
            const Type *lhs = typeOf(types, in.operands[0]);
            const Type *rhs = typeOf(types, in.operands[1]);
            if ((lhs && !lhs->isFloat()) || (rhs && !rhs->isFloat()))
                return fail(fn, &in, "float comparison on non-float operand");
            return {};
        }
        default:
            break;
    }

    switch (in.op)
    {
        case Opcode::Add:
        case Opcode::Sub:
        case Opcode::Mul:
        case Opcode::SDiv:
        case Opcode::UDiv:
        case Opcode::SRem:
        case Opcode::URem:
        case Opcode::And:
        case Opcode::Or:
        case Opcode::Xor:
        case Opcode::Shl:
        case Opcode::LShr:
        case Opcode::AShr:
            if (!in.type.isInteger())
                return fail(fn, &in, "integer arithmetic on non-integer type");
            return expectAll(in.type, 2);
        case Opcode::Select:
        {
            const Type *cond = typeOf(types, in.operands[0]);
            if (cond && cond->kind != Type::Kind::I1)
                return fail(fn, &in, "select condition must be i1");
            for (size_t i = 1; i < 3; ++i)
            {
                const Type *ty = typeOf(types, in.operands[i]);
                if (ty && *ty != in.type)
                    return fail(fn, &in, "select arm type mismatch");
            }
            return {};
        }
        case Opcode::Load:
        case Opcode::Store:
        {
            const Type *ptr = typeOf(types, in.operands[0]);
            if (ptr && ptr->kind != Type::Kind::Ptr)
                return fail(fn, &in, "address operand must be ptr");
            if (in.op == Opcode::Store)
            {
                const Type *val = typeOf(types, in.operands[1]);
                if (val && *val != in.type)
                    return fail(fn, &in, "stored value type mismatch");
            }
            if (in.operands.back().kind != Value::Kind::ConstInt)
                return fail(fn, &in, "offset must be an integer constant");
            return {};
        }
        case Opcode::StackAddr:
        {
            const Value &slot = in.operands[0];
            if (slot.kind != Value::Kind::ConstInt || slot.i64 < 0 ||
                static_cast<size_t>(slot.i64) >= fn.stackSlots.size())
                return fail(fn, &in, "invalid stack slot");
            return {};
        }
        default:
            return {};
    }
}

Expected<void> checkInstr(const Module &m, const Function &fn, const Instr &in, const TypeMap &types)
{
    const auto &info = getOpcodeInfo(in.op);
    const size_t n = in.operands.size();
    if (n < info.numOperandsMin || (!isVariadicOperandCount(info.numOperandsMax) && n > info.numOperandsMax))
        return fail(fn, &in, "wrong operand count");
    if (info.resultArity == ResultArity::One && in.results.size() != 1)
        return fail(fn, &in, "expected exactly one result");
    if (info.resultArity == ResultArity::None && in.hasResult())
        return fail(fn, &in, "instruction cannot define a result");
    if (info.resultArity == ResultArity::One && in.results[0].type != in.type)
        return fail(fn, &in, "result type disagrees with instruction type");

    for (const auto &v : in.operands)
    {
        if (v.kind == Value::Kind::Temp && !types.count(v.id))
            return fail(fn, &in, "use of undefined temporary %" + std::to_string(v.id));
    }
    for (const auto &args : in.brArgs)
    {
        for (const auto &v : args)
        {
            if (v.kind == Value::Kind::Temp && !types.count(v.id))
                return fail(fn, &in, "use of undefined temporary %" + std::to_string(v.id));
        }
    }

    switch (in.op)
    {
        case Opcode::Br:
        case Opcode::CBr:
            if (in.labels.size() != (in.op == Opcode::Br ? 1u : 2u))
                return fail(fn, &in, "wrong number of branch targets");
            return checkBranchArgs(fn, in, types);
        case Opcode::Ret:
            if (n != fn.sig.returns.size())
                return fail(fn, &in, "return arity does not match signature");
            for (size_t i = 0; i < n; ++i)
            {
                const Type *ty = typeOf(types, in.operands[i]);
                if (ty && *ty != fn.sig.returns[i].type)
                    return fail(fn, &in, "return type mismatch");
            }
            return {};
        case Opcode::Call:
        {
            const Signature *sig = findCallee(m, in.callee);
            if (!sig)
                return fail(fn, &in, "unknown callee @" + in.callee);
            if (sig->params.size() != n)
                return fail(fn, &in, "argument count mismatch for @" + in.callee);
            if (sig->returns.size() != in.results.size())
                return fail(fn, &in, "result count mismatch for @" + in.callee);
            for (size_t i = 0; i < n; ++i)
            {
                const Type *ty = typeOf(types, in.operands[i]);
                if (ty && *ty != sig->params[i].type)
                    return fail(fn, &in, "argument type mismatch for @" + in.callee);
            }
            for (size_t i = 0; i < in.results.size(); ++i)
            {
                if (in.results[i].type != sig->returns[i].type)
                    return fail(fn, &in, "result type mismatch for @" + in.callee);
            }
            return {};
        }
        default:
            return checkOperandTypes(fn, in, types);
    }
}
} // namespace

Expected<void> Verifier::verifyFunction(const Function &fn, const Module &m)
{
    if (fn.blocks.empty())
        return fail(fn, nullptr, "function has no blocks");

    const BasicBlock &entry = fn.blocks.front();
    if (entry.params.size() != fn.sig.params.size())
        return fail(fn, nullptr, "entry block parameters do not match signature");
    for (size_t i = 0; i < entry.params.size(); ++i)
    {
        if (entry.params[i].type != fn.sig.params[i].type)
            return fail(fn, nullptr, "entry parameter " + std::to_string(i) + " type mismatch");
    }
    if (fn.sig.structReturnIndex() >= 0 && !fn.sig.returns.empty())
        return fail(fn, nullptr, "struct-return function must not declare returns");

    // Collect definitions first; branches may reference later blocks.
    TypeMap types;
    std::unordered_set<std::string> labels;
    auto define = [&](unsigned id, Type t) { return types.emplace(id, t).second; };
    for (const auto &bb : fn.blocks)
    {
        if (!labels.insert(bb.label).second)
            return fail(fn, nullptr, "duplicate label " + bb.label);
        for (const auto &p : bb.params)
        {
            if (!define(p.id, p.type))
                return fail(fn, nullptr, "temporary %" + std::to_string(p.id) + " defined twice");
        }
        for (const auto &in : bb.instructions)
        {
            for (const auto &r : in.results)
            {
                if (!define(r.id, r.type))
                    return fail(fn, &in, "temporary %" + std::to_string(r.id) + " defined twice");
            }
        }
    }

    for (const auto &bb : fn.blocks)
    {
        if (bb.instructions.empty() || !getOpcodeInfo(bb.instructions.back().op).isTerminator)
            return fail(fn, nullptr, "block " + bb.label + " lacks a terminator");
        for (size_t i = 0; i < bb.instructions.size(); ++i)
        {
            const Instr &in = bb.instructions[i];
            if (i + 1 < bb.instructions.size() && getOpcodeInfo(in.op).isTerminator)
                return fail(fn, &in, "terminator in the middle of block " + bb.label);
            if (auto r = checkInstr(m, fn, in, types); !r)
                return r;
        }
    }
    return {};
}

Expected<void> Verifier::verify(const Module &m)
{
    std::unordered_set<std::string> names;
    for (const auto &ext : m.externs)
    {
        if (!names.insert(ext.name).second)
            return makeError({}, "duplicate symbol @" + ext.name);
    }
    for (const auto &fn : m.functions)
    {
        if (!names.insert(fn.name).second)
            return makeError({}, "duplicate symbol @" + fn.name);
    }
    for (const auto &fn : m.functions)
    {
        if (auto r = verifyFunction(fn, m); !r)
            return r;
    }
    return {};
}

Expected<void> Verifier::verifyNoFloat(const Function &fn)
{
    auto floatIn = [](const std::vector<AbiParam> &list) {
        for (const auto &p : list)
        {
            if (p.type.isFloat())
                return true;
        }
        return false;
    };
    if (floatIn(fn.sig.params) || floatIn(fn.sig.returns))
        return fail(fn, nullptr, "float type in signature");
    for (const auto &bb : fn.blocks)
    {
        for (const auto &p : bb.params)
        {
            if (p.type.isFloat())
                return fail(fn, nullptr, "float parameter in block " + bb.label);
        }
        for (const auto &in : bb.instructions)
        {
            if (in.type.isFloat())
                return fail(fn, &in, "float-typed instruction");
            for (const auto &r : in.results)
            {
                if (r.type.isFloat())
                    return fail(fn, &in, "float-typed result");
            }
            for (const auto &v : in.operands)
            {
                if (v.kind == Value::Kind::ConstFloat)
                    return fail(fn, &in, "float immediate");
            }
        }
    }
    return {};
}

} // namespace il::verify
