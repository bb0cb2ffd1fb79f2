//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/TransformError.cpp
// Purpose: Factories that populate TransformError from the FixedDiag table.
//
//===----------------------------------------------------------------------===//

#include "il/transform/TransformError.hpp"

#include "il/core/Instr.hpp"
#include "il/core/OpcodeInfo.hpp"
#include "il/io/Serializer.hpp"

namespace il::transform
{
using qshade::diag::FixedDiag;
using qshade::diag::formatMessage;

std::string TransformError::code() const
{
    return std::string(qshade::diag::getCode(kind));
}

il::support::Diag TransformError::toDiag() const
{
    il::support::Diag d = il::support::makeError(loc, message);
    d.code = code();
    return d;
}

namespace
{
TransformError functionError(FixedDiag kind, const std::string &function, const il::core::Instr &in)
{
    TransformError err{kind};
    err.function = function;
    err.instruction = il::io::formatInstr(in);
    err.loc = in.loc;
    return err;
}

std::string join(const std::vector<std::string> &items)
{
    std::string out;
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i)
            out += ", ";
        out += items[i];
    }
    return out.empty() ? "none" : out;
}
} // namespace

TransformError unsupportedInstruction(const std::string &function, const il::core::Instr &in)
{
    TransformError err = functionError(FixedDiag::UnsupportedInstruction, function, in);
    const auto &info = il::core::getOpcodeInfo(in.op);
    err.message = formatMessage(err.kind,
                                {{"function", function},
                                 {"opcode", info.name},
                                 {"category", il::core::toString(info.category)}});
    return err;
}

TransformError shapeMismatch(const std::string &function, const il::core::Instr &in, const std::string &detail)
{
    TransformError err = functionError(FixedDiag::InstructionShapeMismatch, function, in);
    err.message = formatMessage(
        err.kind, {{"function", function}, {"opcode", il::core::toString(in.op)}, {"detail", detail}});
    return err;
}

TransformError unknownBuiltin(const std::string &function, const il::core::Instr &in)
{
    TransformError err = functionError(FixedDiag::UnknownBuiltinFunction, function, in);
    err.builtin = in.callee;
    err.message = formatMessage(err.kind, {{"function", function}, {"builtin", in.callee}});
    return err;
}

TransformError missingBuiltinVariant(const std::string &builtin,
                                     const std::string &missing,
                                     const std::vector<std::string> &found)
{
    TransformError err{FixedDiag::MissingBuiltinVariant};
    err.builtin = builtin;
    err.subjects.push_back(missing);
    err.subjects.insert(err.subjects.end(), found.begin(), found.end());
    const std::string foundText = join(found);
    err.message =
        formatMessage(err.kind, {{"builtin", builtin}, {"variant", missing}, {"found", foundText}});
    return err;
}

TransformError duplicateBuiltinVariant(const std::string &builtin,
                                       const std::string &variant,
                                       const std::string &firstSite,
                                       const std::string &secondSite)
{
    TransformError err{FixedDiag::DuplicateBuiltinVariant};
    err.builtin = builtin;
    err.subjects = {variant, firstSite, secondSite};
    err.message = formatMessage(
        err.kind,
        {{"builtin", builtin}, {"variant", variant}, {"first", firstSite}, {"second", secondSite}});
    return err;
}

TransformError builtinSignatureMismatch(const std::string &builtin,
                                        const std::string &floatSig,
                                        const std::string &fixedSig)
{
    TransformError err{FixedDiag::BuiltinSignatureMismatch};
    err.builtin = builtin;
    err.subjects = {floatSig, fixedSig};
    err.message =
        formatMessage(err.kind, {{"builtin", builtin}, {"float", floatSig}, {"fixed", fixedSig}});
    return err;
}

} // namespace il::transform
