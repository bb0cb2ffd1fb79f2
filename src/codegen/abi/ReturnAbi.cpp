//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/abi/ReturnAbi.cpp
// Purpose: Return classification for x86-64 SysV, AAPCS64 and RV32 ilp32.
// Key invariants: Lanes are laid out as a C struct of the element type; the
//                 aggregate either fits the return registers or is returned
//                 through memory.
//
//===----------------------------------------------------------------------===//

#include "codegen/abi/ReturnAbi.hpp"

#include "il/build/IRBuilder.hpp"
#include "il/core/Function.hpp"
#include "il/core/Instr.hpp"

#include <sstream>

using il::core::ArgumentPurpose;
using il::core::Instr;
using il::core::Opcode;
using il::core::Signature;
using il::core::Type;
using il::core::Value;

namespace qshade::codegen::abi
{
namespace
{

ReturnPlan structReturnPlan(const std::vector<Type> &types, unsigned elem, const TargetInfo &target)
{
    ReturnPlan plan;
    plan.method = ReturnMethod::StructReturn;
    plan.types = types;
    plan.elementSize = elem;
    plan.bufferSize = static_cast<unsigned>(types.size()) * elem;
    plan.bufferAlign = elem;
    plan.sretInRegister = target.sretInRegister;
    return plan;
}

/// Pack lanes into consecutive registers of @p regBytes each.
void packLanes(ReturnPlan &plan, RegClass cls, unsigned regBytes)
{
    for (size_t i = 0; i < plan.types.size(); ++i)
    {
        const unsigned at = plan.bufferOffset(i);
        plan.locations.push_back({cls, at / regBytes, at % regBytes});
    }
}

} // namespace

il::support::Expected<ReturnPlan> classifyReturns(const std::vector<Type> &returnTypes, const TargetInfo &target)
{
    ReturnPlan plan;
    plan.types = returnTypes;
    if (returnTypes.empty())
        return plan;

    const Type elemType = returnTypes.front();
    for (const Type &t : returnTypes)
    {
        if (t != elemType)
        {
            return il::support::makeError(
                {}, "mixed return types are not supported: " + elemType.toString() + " and " + t.toString());
        }
    }
    if (elemType.kind == Type::Kind::Void)
        return il::support::makeError({}, "void cannot be a return value");

    const unsigned elem = static_cast<unsigned>(il::core::sizeInBytes(elemType));
    const unsigned total = elem * static_cast<unsigned>(returnTypes.size());
    plan.elementSize = elem;

    const bool floatLanes = elemType.isFloat() && target.hasFloatReturnRegs;
    const RegClass cls = floatLanes ? RegClass::Float : RegClass::Integer;

    if (returnTypes.size() == 1)
    {
        plan.locations.push_back({cls, 0, 0});
        return plan;
    }

    if (floatLanes && target.maxHfaMembers != 0)
    {
        // Homogeneous float aggregate: one member per vector register.
        if (returnTypes.size() <= target.maxHfaMembers)
        {
            for (unsigned i = 0; i < returnTypes.size(); ++i)
                plan.locations.push_back({RegClass::Float, i, 0});
            return plan;
        }
        return structReturnPlan(returnTypes, elem, target);
    }

    if (total > target.maxRegisterReturnBytes)
        return structReturnPlan(returnTypes, elem, target);

    packLanes(plan, cls, floatLanes ? target.fprBytes : target.gprBytes);
    return plan;
}

il::support::Expected<Signature> legalizeSignature(const Signature &sig, const TargetInfo &target)
{
    auto plan = classifyReturns(sig.returnTypes(), target);
    if (!plan)
        return plan.error();
    if (!plan.value().usesStructReturn())
        return sig;

    Signature out;
    out.params.emplace_back(Type(Type::Kind::Ptr), ArgumentPurpose::StructReturn);
    out.params.insert(out.params.end(), sig.params.begin(), sig.params.end());
    return out;
}

std::vector<Value> emitMultiReturnCall(il::build::IRBuilder &builder,
                                       il::core::Function &fn,
                                       const std::string &callee,
                                       const ReturnPlan &plan,
                                       std::vector<Value> args,
                                       const std::vector<unsigned> &resultIds)
{
    auto idFor = [&](size_t i) { return i < resultIds.size() ? resultIds[i] : builder.reserveTempId(); };

    std::vector<Value> values;
    values.reserve(plan.types.size());

    if (!plan.usesStructReturn())
    {
        Instr call;
        call.op = Opcode::Call;
        call.callee = callee;
        call.operands = std::move(args);
        call.type = plan.types.size() == 1 ? plan.types.front() : Type(Type::Kind::Void);
        for (size_t i = 0; i < plan.types.size(); ++i)
        {
            const unsigned id = idFor(i);
            call.results.push_back({id, plan.types[i]});
            values.push_back(Value::temp(id));
        }
        builder.append(std::move(call));
        return values;
    }

    const unsigned slot = builder.addStackSlot(fn, plan.bufferSize, plan.bufferAlign);
    const Value buffer = builder.stackAddr(slot, 0);
    args.insert(args.begin(), buffer);
    builder.call(callee, {}, std::move(args));

    for (size_t i = 0; i < plan.types.size(); ++i)
    {
        Instr load;
        load.op = Opcode::Load;
        load.type = plan.types[i];
        load.operands = {buffer, Value::constInt(plan.bufferOffset(i))};
        const unsigned id = idFor(i);
        load.results.push_back({id, plan.types[i]});
        builder.append(std::move(load));
        values.push_back(Value::temp(id));
    }
    return values;
}

std::string describe(const ReturnPlan &plan, const TargetInfo &target)
{
    std::ostringstream os;
    if (plan.usesStructReturn())
    {
        os << "sret " << plan.bufferSize << " bytes align " << plan.bufferAlign << " via "
           << target.sretLocation;
        return os.str();
    }
    os << "registers";
    if (plan.locations.empty())
        os << " none";
    for (const auto &loc : plan.locations)
        os << ' ' << target.regName(loc.regClass, loc.regIndex) << '+' << loc.byteOffset;
    return os.str();
}

} // namespace qshade::codegen::abi
