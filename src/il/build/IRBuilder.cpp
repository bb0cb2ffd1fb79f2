//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/build/IRBuilder.cpp
// Purpose: Provide a structured API for constructing IL functions.
// Key invariants: Builder maintains a current function/block insertion context
//                 and monotonically increasing SSA identifiers.
// Ownership/Lifetime: Builder references a module owned by the caller.
//
//===----------------------------------------------------------------------===//

#include "il/build/IRBuilder.hpp"

#include "il/core/OpcodeInfo.hpp"

#include <cassert>

namespace il::build
{
using namespace il::core;

#ifndef NDEBUG
static void assertUniqueLabelInFunction(const Function &fn, const std::string &label)
{
    for (const auto &block : fn.blocks)
    {
        assert(block.label != label && "block label already exists in function");
    }
}
#endif // NDEBUG

IRBuilder::IRBuilder(Module &m) : mod(m) {}

Extern &IRBuilder::addExtern(const std::string &name, Signature sig)
{
    assert(!name.empty() && "extern name cannot be empty");
    mod.externs.push_back({name, std::move(sig)});
    return mod.externs.back();
}

Function &IRBuilder::startFunction(const std::string &name, Signature sig)
{
    assert(!name.empty() && "function name cannot be empty");
    Function fn;
    fn.name = name;
    fn.sig = std::move(sig);
    mod.functions.push_back(std::move(fn));
    curFunc = &mod.functions.back();
    curBlock = nullptr;
    nextTemp = 0;
    return *curFunc;
}

void IRBuilder::continueFunction(Function &fn)
{
    curFunc = &fn;
    curBlock = nullptr;
    nextTemp = fn.nextTempId();
}

BasicBlock &IRBuilder::addEntryBlock(Function &fn, const std::string &label)
{
    std::vector<Type> types;
    types.reserve(fn.sig.params.size());
    for (const auto &p : fn.sig.params)
        types.push_back(p.type);
    return createBlock(fn, label, types);
}

BasicBlock &IRBuilder::createBlock(Function &fn, const std::string &label, const std::vector<Type> &paramTypes)
{
    assert(!label.empty() && "block label cannot be empty");
#ifndef NDEBUG
    assertUniqueLabelInFunction(fn, label);
#endif
    if (curFunc != &fn)
        continueFunction(fn);

    fn.blocks.push_back({label, {}, {}, false});
    BasicBlock &bb = fn.blocks.back();
    for (Type t : paramTypes)
    {
        assert(t.kind != Type::Kind::Void && "parameter cannot have Void type");
        Param p;
        p.type = t;
        p.id = nextTemp++;
        bb.params.push_back(p);
    }
    return bb;
}

unsigned IRBuilder::addStackSlot(Function &fn, unsigned size, unsigned align)
{
    fn.stackSlots.push_back({size, align});
    return static_cast<unsigned>(fn.stackSlots.size() - 1);
}

Value IRBuilder::blockParam(const BasicBlock &bb, unsigned idx) const
{
    assert(idx < bb.params.size());
    return Value::temp(bb.params[idx].id);
}

void IRBuilder::setInsertPoint(BasicBlock &bb)
{
    curBlock = &bb;
}

unsigned IRBuilder::reserveTempId()
{
    return nextTemp++;
}

void IRBuilder::reserveTempsBelow(unsigned id)
{
    if (nextTemp < id)
        nextTemp = id;
}

void IRBuilder::append(Instr instr)
{
    assert(curBlock && "insertion point not set");
    assert(!curBlock->terminated && "block already terminated");
    for (const auto &r : instr.results)
    {
        if (r.id >= nextTemp)
            nextTemp = r.id + 1;
    }
    if (instr.loc.line == 0)
        instr.loc = curLoc;
    if (getOpcodeInfo(instr.op).isTerminator)
        curBlock->terminated = true;
    curBlock->instructions.push_back(std::move(instr));
}

Value IRBuilder::emit(Opcode op, Type type, std::vector<Value> operands)
{
    Instr in;
    in.op = op;
    in.type = type;
    in.operands = std::move(operands);
    const unsigned id = reserveTempId();
    in.results.push_back({id, type});
    append(std::move(in));
    return Value::temp(id);
}

Value IRBuilder::iconst(Type type, long long v)
{
    return emit(Opcode::IConst, type, {Value::constInt(v)});
}

Value IRBuilder::fconst(Type type, double v)
{
    return emit(Opcode::FConst, type, {Value::constFloat(v)});
}

Value IRBuilder::binary(Opcode op, Type type, Value lhs, Value rhs)
{
    return emit(op, type, {lhs, rhs});
}

Value IRBuilder::unary(Opcode op, Type type, Value operand)
{
    return emit(op, type, {operand});
}

Value IRBuilder::select(Type type, Value cond, Value a, Value b)
{
    return emit(Opcode::Select, type, {cond, a, b});
}

Value IRBuilder::stackAddr(unsigned slot, long long offset)
{
    return emit(Opcode::StackAddr, Type(Type::Kind::Ptr), {Value::constInt(slot), Value::constInt(offset)});
}

Value IRBuilder::load(Type type, Value ptr, long long offset)
{
    return emit(Opcode::Load, type, {ptr, Value::constInt(offset)});
}

void IRBuilder::store(Type type, Value ptr, Value value, long long offset)
{
    Instr in;
    in.op = Opcode::Store;
    in.type = type;
    in.operands = {ptr, value, Value::constInt(offset)};
    append(std::move(in));
}

std::vector<Value> IRBuilder::call(const std::string &callee, const std::vector<Type> &resultTypes, std::vector<Value> args)
{
    Instr in;
    in.op = Opcode::Call;
    in.callee = callee;
    in.operands = std::move(args);
    in.type = resultTypes.size() == 1 ? resultTypes.front() : Type(Type::Kind::Void);
    std::vector<Value> out;
    for (Type t : resultTypes)
    {
        const unsigned id = reserveTempId();
        in.results.push_back({id, t});
        out.push_back(Value::temp(id));
    }
    append(std::move(in));
    return out;
}

void IRBuilder::br(const std::string &label, std::vector<Value> args)
{
    Instr in;
    in.op = Opcode::Br;
    in.labels.push_back(label);
    in.brArgs.push_back(std::move(args));
    append(std::move(in));
}

void IRBuilder::cbr(Value cond,
                    const std::string &thenLabel,
                    std::vector<Value> thenArgs,
                    const std::string &elseLabel,
                    std::vector<Value> elseArgs)
{
    Instr in;
    in.op = Opcode::CBr;
    in.operands.push_back(cond);
    in.labels = {thenLabel, elseLabel};
    in.brArgs.push_back(std::move(thenArgs));
    in.brArgs.push_back(std::move(elseArgs));
    append(std::move(in));
}

void IRBuilder::ret(std::vector<Value> values)
{
    Instr in;
    in.op = Opcode::Ret;
    in.operands = std::move(values);
    append(std::move(in));
}

} // namespace il::build
