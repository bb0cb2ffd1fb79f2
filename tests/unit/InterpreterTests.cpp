// File: tests/unit/InterpreterTests.cpp
// Purpose: Exercise the reference interpreter on both numeric domains.
// Key invariants: Integer results are sign-extended from their width; traps
//                 surface as diagnostics.
// Ownership/Lifetime: Modules are built per test through ShaderBuilder.
// Links: src/il/interp/Interpreter.hpp

#include "common/ShaderBuilder.hpp"

#include "il/builtins/BuiltinCatalog.hpp"
#include "il/interp/Interpreter.hpp"

#include <gtest/gtest.h>

using namespace il::core;
using il::interp::Interpreter;
using il::interp::Slot;
using namespace qshade::tests;

TEST(Interpreter, FloatArithmeticRoundsToF32)
{
    ShaderBuilder sb;
    sb.begin("f", {kF32, kF32}, {kF32});
    Value q = sb.ir().binary(Opcode::FDiv, kF32, sb.param(0), sb.param(1));
    sb.ir().ret({q});

    Interpreter interp(sb.module());
    auto r = interp.call("f", {f32(1.0), f32(3.0)});
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    EXPECT_EQ(r.value()[0].f64, static_cast<double>(1.0f / 3.0f));
}

TEST(Interpreter, IntegerWidthsWrapAndCompareUnsigned)
{
    ShaderBuilder sb;
    sb.begin("f", {kI32}, {kI32, kI1});
    Value sum = sb.ir().binary(Opcode::Add, kI32, sb.param(0), Value::constInt(1));
    Value big = sb.ir().binary(Opcode::UCmpGT, kI1, sb.param(0), Value::constInt(0));
    sb.ir().ret({sum, big});

    Interpreter interp(sb.module());
    auto r = interp.call("f", {Slot::fromInt(2147483647)});
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value()[0].i64, -2147483648LL);
    EXPECT_EQ(r.value()[1].i64, 1);

    auto neg = interp.call("f", {Slot::fromInt(-1)});
    ASSERT_TRUE(neg.hasValue());
    EXPECT_EQ(neg.value()[1].i64, 1); // 0xFFFFFFFF > 0 unsigned
}

TEST(Interpreter, BranchesPassBlockArguments)
{
    // Sum 1..n with a loop carrying (i, acc).
    ShaderBuilder sb;
    sb.begin("sum", {kI32}, {kI32});
    const size_t loop = sb.addBlock("loop", {kI32, kI32});
    const size_t done = sb.addBlock("done", {kI32});
    sb.setInsertPoint(0);
    sb.ir().br("loop", {Value::constInt(1), Value::constInt(0)});

    sb.setInsertPoint(loop);
    Value i = sb.blockParam(loop, 0);
    Value acc = sb.blockParam(loop, 1);
    Value next = sb.ir().binary(Opcode::Add, kI32, acc, i);
    Value inc = sb.ir().binary(Opcode::Add, kI32, i, Value::constInt(1));
    Value more = sb.ir().binary(Opcode::SCmpLE, kI1, inc, sb.param(0));
    sb.ir().cbr(more, "loop", {inc, next}, "done", {next});

    sb.setInsertPoint(done);
    sb.ir().ret({sb.blockParam(done, 0)});

    Interpreter interp(sb.module());
    auto r = interp.call("sum", {Slot::fromInt(10)});
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    EXPECT_EQ(r.value()[0].i64, 55);
}

TEST(Interpreter, StackSlotsHoldStoredValues)
{
    ShaderBuilder sb;
    Function &fn = sb.begin("mem", {kF32}, {kF32});
    const unsigned slot = sb.ir().addStackSlot(fn, 8, 4);
    Value p = sb.ir().stackAddr(slot);
    sb.ir().store(kF32, p, sb.param(0), 4);
    Value back = sb.ir().load(kF32, p, 4);
    sb.ir().ret({back});

    Interpreter interp(sb.module());
    auto r = interp.call("mem", {f32(2.5)});
    ASSERT_TRUE(r.hasValue());
    EXPECT_EQ(r.value()[0].f64, 2.5);
}

TEST(Interpreter, DivisionByZeroTraps)
{
    ShaderBuilder sb;
    sb.begin("f", {kI32}, {kI32});
    Value q = sb.ir().binary(Opcode::SDiv, kI32, Value::constInt(1), sb.param(0));
    sb.ir().ret({q});

    Interpreter interp(sb.module());
    auto r = interp.call("f", {Slot::fromInt(0)});
    ASSERT_FALSE(r.hasValue());
    EXPECT_NE(r.error().message.find("division by zero"), std::string::npos);
}

TEST(Interpreter, StepLimitStopsRunawayLoops)
{
    ShaderBuilder sb;
    sb.begin("spin", {}, {});
    const size_t loop = sb.addBlock("loop");
    sb.setInsertPoint(0);
    sb.ir().br("loop");
    sb.setInsertPoint(loop);
    sb.ir().br("loop");

    Interpreter interp(sb.module());
    interp.setStepLimit(1000);
    auto r = interp.call("spin", {});
    ASSERT_FALSE(r.hasValue());
    EXPECT_NE(r.error().message.find("step limit"), std::string::npos);
    EXPECT_EQ(interp.steps(), 1001u);
}

TEST(Interpreter, ExternCallsReachNativeBuiltins)
{
    const auto &reg = il::builtins::defaultBuiltinRegistry();
    ASSERT_TRUE(reg.hasValue());

    ShaderBuilder sb;
    sb.declareExtern("qs_hue2rgb_f32", {kF32}, {kF32, kF32, kF32});
    sb.begin("f", {kF32}, {kF32, kF32, kF32});
    auto rgb = sb.ir().call("qs_hue2rgb_f32", {kF32, kF32, kF32}, {sb.param(0)});
    sb.ir().ret(rgb);

    Interpreter interp(sb.module(), &reg.value());
    auto r = interp.call("f", {f32(0.5)});
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    EXPECT_EQ(r.value()[0].f64, 0.0);
    EXPECT_EQ(r.value()[1].f64, 1.0);
    EXPECT_EQ(r.value()[2].f64, 1.0);
}

TEST(Interpreter, UnboundExternIsReported)
{
    ShaderBuilder sb;
    sb.declareExtern("mystery", {}, {kI32});
    sb.begin("f", {}, {kI32});
    auto v = sb.ir().call("mystery", {kI32}, {});
    sb.ir().ret(v);

    Interpreter interp(sb.module());
    auto r = interp.call("f", {});
    ASSERT_FALSE(r.hasValue());
    EXPECT_NE(r.error().message.find("no native binding for @mystery"), std::string::npos);
}
