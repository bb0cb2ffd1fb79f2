// File: tests/il/transform/IdentityTransformTests.cpp
// Purpose: The identity transform reproduces its input exactly, which pins
//          down the structural half of the rewrite driver.
// Key invariants: Serialized output equals serialized input.
// Ownership/Lifetime: Modules are built per test.
// Links: src/il/transform/TransformDriver.hpp

#include "common/ShaderBuilder.hpp"

#include "il/io/Serializer.hpp"
#include "il/transform/IdentityTransform.hpp"
#include "il/transform/TransformDriver.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace il::core;
using namespace qshade::tests;

TEST(IdentityTransform, ReproducesModuleText)
{
    ShaderBuilder sb;
    sb.declareExtern("qs_sin_f32", {kF32}, {kF32});

    Function &fn = sb.begin("pulse", {kF32, kI32}, {kF32});
    const unsigned slot = sb.ir().addStackSlot(fn, 8, 4);
    const size_t loop = sb.addBlock("loop", {kI32, kF32});
    const size_t exit = sb.addBlock("exit", {kF32});

    sb.setInsertPoint(0);
    Value p = sb.ir().stackAddr(slot, 4);
    sb.ir().store(kF32, p, sb.param(0));
    sb.ir().br("loop", {sb.param(1), Value::constFloat(0.125)});

    sb.setInsertPoint(loop);
    Value n = sb.blockParam(loop, 0);
    Value acc = sb.blockParam(loop, 1);
    Value x = sb.ir().load(kF32, p);
    auto s = sb.ir().call("qs_sin_f32", {kF32}, {x});
    Value next = sb.ir().binary(Opcode::FAdd, kF32, acc, s[0]);
    Value dec = sb.ir().binary(Opcode::Sub, kI32, n, Value::constInt(1));
    Value more = sb.ir().binary(Opcode::SCmpGT, kI1, dec, Value::constInt(0));
    sb.ir().cbr(more, "loop", {dec, next}, "exit", {next});

    sb.setInsertPoint(exit);
    sb.ir().ret({sb.blockParam(exit, 0)});

    Module &src = sb.module();
    src.functions[0].valueNames = {"seed", "count"};

    il::transform::IdentityTransform id;
    auto out = il::transform::transformModule(src, id);
    ASSERT_TRUE(out.hasValue()) << out.error().message;
    EXPECT_EQ(il::io::Serializer::toString(out.value()), il::io::Serializer::toString(src));
    EXPECT_EQ(out.value().functions[0].valueNames, src.functions[0].valueNames);
    EXPECT_EQ(out.value().functions[0].nextTempId(), src.functions[0].nextTempId());
}

TEST(IdentityTransform, TracesEachFunction)
{
    ShaderBuilder sb;
    sb.begin("a", {}, {});
    sb.ir().ret();
    sb.begin("b", {}, {});
    sb.ir().ret();

    std::ostringstream trace;
    il::transform::IdentityTransform id;
    auto out = il::transform::transformModule(sb.module(), id, &trace);
    ASSERT_TRUE(out.hasValue());
    EXPECT_EQ(trace.str(), "[identity] rewriting @a\n[identity] rewriting @b\n");
}

TEST(IdentityTransform, RejectsBranchesToUnknownBlocks)
{
    ShaderBuilder sb;
    sb.begin("lost", {}, {});
    sb.ir().br("nowhere");

    il::transform::IdentityTransform id;
    auto out = il::transform::transformModule(sb.module(), id);
    ASSERT_FALSE(out.hasValue());
    EXPECT_EQ(out.error().kind, qshade::diag::FixedDiag::InstructionShapeMismatch);
    EXPECT_EQ(out.error().message, "function 'lost': malformed 'br': unknown branch target 'nowhere'");
}
