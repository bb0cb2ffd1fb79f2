// File: tests/unit/FixedDiagTests.cpp
// Purpose: Pin the stable codes and message rendering of lowering diagnostics.
// Key invariants: Codes E-FX001..E-FX006 follow enum order.
// Ownership/Lifetime: Stateless.
// Links: include/qshade/diag/FixedDiag.hpp, src/il/transform/TransformError.hpp

#include "qshade/diag/FixedDiag.hpp"

#include "il/core/Instr.hpp"
#include "il/transform/TransformError.hpp"
#include "support/diagnostics.hpp"

#include <gtest/gtest.h>

#include <sstream>

using qshade::diag::FixedDiag;

TEST(FixedDiag, CodesAreStable)
{
    EXPECT_EQ(qshade::diag::getCode(FixedDiag::UnsupportedInstruction), "E-FX001");
    EXPECT_EQ(qshade::diag::getCode(FixedDiag::InstructionShapeMismatch), "E-FX002");
    EXPECT_EQ(qshade::diag::getCode(FixedDiag::MissingBuiltinVariant), "E-FX003");
    EXPECT_EQ(qshade::diag::getCode(FixedDiag::DuplicateBuiltinVariant), "E-FX004");
    EXPECT_EQ(qshade::diag::getCode(FixedDiag::BuiltinSignatureMismatch), "E-FX005");
    EXPECT_EQ(qshade::diag::getCode(FixedDiag::UnknownBuiltinFunction), "E-FX006");
    EXPECT_EQ(qshade::diag::getId(FixedDiag::UnknownBuiltinFunction), "unknown-builtin-function");
}

TEST(FixedDiag, FormatLeavesUnknownPlaceholders)
{
    const std::string msg =
        qshade::diag::formatMessage(FixedDiag::UnknownBuiltinFunction, {{"function", "main"}});
    EXPECT_EQ(msg, "function 'main': call to unknown function '{builtin}'");
}

TEST(TransformError, UnsupportedInstructionNamesOpcodeAndCategory)
{
    il::core::Instr in;
    in.op = il::core::Opcode::FRem;
    in.type = il::core::Type(il::core::Type::Kind::F32);
    in.operands = {il::core::Value::temp(0), il::core::Value::temp(1)};
    in.results.push_back({2, in.type});
    in.loc = {1, 7, 3};

    const auto err = il::transform::unsupportedInstruction("shade", in);
    EXPECT_EQ(err.kind, FixedDiag::UnsupportedInstruction);
    EXPECT_EQ(err.function, "shade");
    EXPECT_EQ(err.instruction, "%2 = frem.f32 %0, %1");
    EXPECT_EQ(err.message, "function 'shade': no fixed-point lowering for 'frem' (float-remainder)");

    std::ostringstream os;
    il::support::DiagnosticEngine de;
    de.report(err.toDiag());
    de.printAll(os);
    EXPECT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(os.str(), "7:3: error[E-FX001]: function 'shade': no fixed-point lowering for 'frem' (float-remainder)\n");
}
