//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/io/Serializer.cpp
// Purpose: Textual rendering of IL modules, functions and instructions.
// Key invariants: Output depends only on the printed entity.
//
//===----------------------------------------------------------------------===//

#include "il/io/Serializer.hpp"

#include "il/core/Module.hpp"
#include "il/core/OpcodeInfo.hpp"

#include <sstream>

namespace il::io
{
using namespace il::core;

namespace
{
void printValues(std::ostream &os, const std::vector<Value> &values)
{
    for (size_t i = 0; i < values.size(); ++i)
    {
        if (i)
            os << ", ";
        os << il::core::toString(values[i]);
    }
}

void printTarget(std::ostream &os, const Instr &in, size_t idx)
{
    os << in.labels[idx];
    if (idx < in.brArgs.size() && !in.brArgs[idx].empty())
    {
        os << '(';
        printValues(os, in.brArgs[idx]);
        os << ')';
    }
}

void printInstr(std::ostream &os, const Instr &in)
{
    if (in.hasResult())
    {
        for (size_t i = 0; i < in.results.size(); ++i)
        {
            if (i)
                os << ", ";
            os << '%' << in.results[i].id;
        }
        os << " = ";
    }

    switch (in.op)
    {
        case Opcode::Call:
            os << "call @" << in.callee << '(';
            printValues(os, in.operands);
            os << ')';
            if (in.hasResult())
            {
                os << " -> (";
                for (size_t i = 0; i < in.results.size(); ++i)
                {
                    if (i)
                        os << ", ";
                    os << in.results[i].type.toString();
                }
                os << ')';
            }
            return;
        case Opcode::Br:
            os << "br ";
            printTarget(os, in, 0);
            return;
        case Opcode::CBr:
            os << "cbr " << il::core::toString(in.operands.front()) << ", ";
            printTarget(os, in, 0);
            os << ", ";
            printTarget(os, in, 1);
            return;
        case Opcode::Ret:
            os << "ret";
            if (!in.operands.empty())
            {
                os << ' ';
                printValues(os, in.operands);
            }
            return;
        default:
            break;
    }

    os << il::core::toString(in.op);
    if (in.type.kind != Type::Kind::Void)
        os << '.' << in.type.toString();
    if (!in.operands.empty())
    {
        os << ' ';
        printValues(os, in.operands);
    }
}

void printFunction(std::ostream &os, const Function &fn)
{
    os << "func @" << fn.name << il::core::toString(fn.sig) << " {\n";
    for (size_t i = 0; i < fn.stackSlots.size(); ++i)
    {
        os << "  slot" << i << ": size " << fn.stackSlots[i].size << ", align " << fn.stackSlots[i].align
           << '\n';
    }
    for (const auto &bb : fn.blocks)
    {
        os << bb.label;
        if (!bb.params.empty())
        {
            os << '(';
            for (size_t i = 0; i < bb.params.size(); ++i)
            {
                if (i)
                    os << ", ";
                os << '%' << bb.params[i].id << ": " << bb.params[i].type.toString();
            }
            os << ')';
        }
        os << ":\n";
        for (const auto &in : bb.instructions)
        {
            os << "  ";
            printInstr(os, in);
            if (in.hasResult() && in.result() < fn.valueNames.size() && !fn.valueNames[in.result()].empty())
                os << "  ; " << fn.valueNames[in.result()];
            os << '\n';
        }
    }
    os << "}\n";
}
} // namespace

void Serializer::write(const Module &m, std::ostream &os)
{
    for (const auto &ext : m.externs)
        os << "extern @" << ext.name << il::core::toString(ext.sig) << '\n';
    for (size_t i = 0; i < m.functions.size(); ++i)
    {
        if (i || !m.externs.empty())
            os << '\n';
        printFunction(os, m.functions[i]);
    }
}

void Serializer::write(const Function &fn, std::ostream &os)
{
    printFunction(os, fn);
}

std::string Serializer::toString(const Module &m)
{
    std::ostringstream os;
    write(m, os);
    return os.str();
}

std::string Serializer::toString(const Function &fn)
{
    std::ostringstream os;
    write(fn, os);
    return os.str();
}

std::string formatInstr(const Instr &in)
{
    std::ostringstream os;
    printInstr(os, in);
    return os.str();
}

} // namespace il::io
