//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/TransformContext.cpp
// Purpose: Value, block, stack-slot and call-target maps for one rewrite.
//
//===----------------------------------------------------------------------===//

#include "il/transform/TransformContext.hpp"

using namespace il::core;

namespace il::transform
{

TransformContext::TransformContext(TransformSession &session,
                                   const FunctionTransform &transform,
                                   const Function &source,
                                   Function &target)
    : session_(session), transform_(transform), source_(source), target_(target)
{
    for (const auto &bb : source.blocks)
    {
        for (const auto &p : bb.params)
            sourceTypes_.emplace(p.id, p.type);
        for (const auto &in : bb.instructions)
        {
            for (const auto &r : in.results)
                sourceTypes_.emplace(r.id, r.type);
        }
    }
}

Value TransformContext::mapOperand(const Value &v) const
{
    switch (v.kind)
    {
        case Value::Kind::Temp:
        {
            auto it = valueMap_.find(v.id);
            return it == valueMap_.end() ? v : it->second;
        }
        case Value::Kind::ConstFloat:
            return transform_.mapImmediate(v);
        default:
            return v;
    }
}

std::vector<Value> TransformContext::mapOperands(const std::vector<Value> &values) const
{
    std::vector<Value> out;
    out.reserve(values.size());
    for (const auto &v : values)
        out.push_back(mapOperand(v));
    return out;
}

void TransformContext::mapValue(unsigned oldId, Value value)
{
    valueMap_.emplace(oldId, value);
}

bool TransformContext::isMapped(unsigned oldId) const
{
    return valueMap_.count(oldId) != 0;
}

void TransformContext::mapBlock(const std::string &oldLabel, const std::string &newLabel)
{
    blockMap_.emplace(oldLabel, newLabel);
}

const std::string *TransformContext::blockFor(const std::string &oldLabel) const
{
    auto it = blockMap_.find(oldLabel);
    return it == blockMap_.end() ? nullptr : &it->second;
}

void TransformContext::mapStackSlot(unsigned oldSlot, unsigned newSlot)
{
    stackSlotMap_.emplace(oldSlot, newSlot);
}

std::optional<unsigned> TransformContext::stackSlotFor(unsigned oldSlot) const
{
    auto it = stackSlotMap_.find(oldSlot);
    if (it == stackSlotMap_.end())
        return std::nullopt;
    return it->second;
}

const CallTarget *TransformContext::cachedCallTarget(const std::string &callee) const
{
    auto it = callTargets_.find(callee);
    return it == callTargets_.end() ? nullptr : &it->second;
}

const CallTarget &TransformContext::cacheCallTarget(const std::string &callee, CallTarget target)
{
    return callTargets_.emplace(callee, std::move(target)).first->second;
}

std::optional<Type> TransformContext::sourceTypeOf(const Value &v) const
{
    switch (v.kind)
    {
        case Value::Kind::Temp:
        {
            auto it = sourceTypes_.find(v.id);
            if (it == sourceTypes_.end())
                return std::nullopt;
            return it->second;
        }
        case Value::Kind::ConstFloat:
            return Type(Type::Kind::F32);
        case Value::Kind::NullPtr:
            return Type(Type::Kind::Ptr);
        default:
            return std::nullopt;
    }
}

Value TransformContext::define(const Instr &old, size_t resultIndex, Opcode op, Type type, std::vector<Value> operands)
{
    const unsigned id = old.results[resultIndex].id;
    Instr in;
    in.op = op;
    in.type = type;
    in.operands = std::move(operands);
    in.results.push_back({id, type});
    in.loc = old.loc;
    session_.builder.append(std::move(in));
    const Value v = Value::temp(id);
    mapValue(id, v);
    return v;
}

} // namespace il::transform
