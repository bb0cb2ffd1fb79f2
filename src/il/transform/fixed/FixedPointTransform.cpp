//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/fixed/FixedPointTransform.cpp
// Purpose: Type mapping, extern set-up and converter dispatch.
//
//===----------------------------------------------------------------------===//

#include "il/transform/fixed/FixedPointTransform.hpp"

#include "il/transform/TransformContext.hpp"
#include "il/transform/fixed/Converters.hpp"

using namespace il::core;

namespace il::transform
{
namespace
{
std::array<FixedPointTransform::Converter, kNumOpcodeCategories> makeConverterTable()
{
    std::array<FixedPointTransform::Converter, kNumOpcodeCategories> table{};
    auto set = [&](OpcodeCategory c, FixedPointTransform::Converter fn) { table[static_cast<size_t>(c)] = fn; };
    set(OpcodeCategory::Constant, &lowering::convertConstant);
    set(OpcodeCategory::Integer, &lowering::convertPassthrough);
    set(OpcodeCategory::Boolean, &lowering::convertPassthrough);
    set(OpcodeCategory::FloatArith, &lowering::convertFloatArith);
    set(OpcodeCategory::FloatCompare, &lowering::convertFloatCompare);
    set(OpcodeCategory::Conversion, &lowering::convertConversion);
    set(OpcodeCategory::Memory, &lowering::convertMemory);
    set(OpcodeCategory::Call, &lowering::convertCall);
    set(OpcodeCategory::Control, &lowering::convertControl);
    // FloatRemainder has no fixed-point lowering.
    return table;
}
} // namespace

FixedPointTransform::FixedPointTransform(const il::builtins::BuiltinRegistry &registry,
                                         const qshade::codegen::abi::TargetInfo &target,
                                         il::fixed::FixedPointFormat format)
    : registry_(registry), target_(target), format_(format)
{
}

FixedPointTransform::Converter FixedPointTransform::converterFor(OpcodeCategory category)
{
    static const auto table = makeConverterTable();
    return table[static_cast<size_t>(category)];
}

Type FixedPointTransform::mapType(Type type) const
{
    return type.isFloat() ? il::fixed::storageType(format_) : type;
}

Value FixedPointTransform::mapImmediate(const Value &value) const
{
    if (value.kind != Value::Kind::ConstFloat)
        return value;
    return Value::constInt(il::fixed::toFixed(value.f64));
}

TransformResult<void> FixedPointTransform::beginModule(TransformSession &session)
{
    if (!il::fixed::isSupported(format_))
    {
        TransformError err{qshade::diag::FixedDiag::UnsupportedInstruction};
        err.message = std::string("fixed-point format '") + il::fixed::toString(format_) + "' is not supported";
        return err;
    }

    // Externs that never carry floats are kept as is.  Float externs are
    // redeclared by the call converter under their fixed-point symbol.
    for (const auto &ext : session.source.externs)
    {
        if (!ext.sig.mentionsFloat())
            session.target.externs.push_back(ext);
    }
    return {};
}

TransformResult<void> FixedPointTransform::transformInstr(TransformContext &ctx, const Instr &in)
{
    const auto &info = getOpcodeInfo(in.op);
    Converter convert = converterFor(info.category);
    if (!convert)
        return unsupportedInstruction(ctx.source().name, in);
    return convert(*this, ctx, in);
}

} // namespace il::transform
