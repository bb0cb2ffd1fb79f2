// File: tests/codegen/abi/ReturnAbiTests.cpp
// Purpose: Check return classification, signature legalization and call
//          emission for every modelled target.
// Key invariants: Single values always return in a register; aggregates
//                 beyond the target's register budget use a caller buffer.
// Ownership/Lifetime: Plans and modules are per-test values.
// Links: src/codegen/abi/ReturnAbi.hpp

#include "codegen/abi/ReturnAbi.hpp"
#include "codegen/abi/Target.hpp"

#include "il/build/IRBuilder.hpp"
#include "il/io/Serializer.hpp"
#include "il/verify/Verifier.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace il::core;
using namespace qshade::codegen::abi;

namespace
{
const Type kF32(Type::Kind::F32);
const Type kI32(Type::Kind::I32);
const Type kI64(Type::Kind::I64);

ReturnPlan plan(std::vector<Type> types, const TargetInfo &target)
{
    auto p = classifyReturns(types, target);
    EXPECT_TRUE(p.hasValue()) << p.error().message;
    return p.hasValue() ? p.value() : ReturnPlan{};
}
} // namespace

TEST(ReturnAbi, SingleValuesUseTheFirstReturnRegister)
{
    const auto &x64 = TargetInfo::x86_64SysV();
    EXPECT_EQ(describe(plan({kI32}, x64), x64), "registers rax+0");
    EXPECT_EQ(describe(plan({kF32}, x64), x64), "registers xmm0+0");

    const auto &rv = TargetInfo::riscv32Ilp32();
    EXPECT_EQ(describe(plan({kF32}, rv), rv), "registers a0+0");
    EXPECT_EQ(describe(plan({}, rv), rv), "registers none");
}

TEST(ReturnAbi, X86PacksEightbytes)
{
    const auto &x64 = TargetInfo::x86_64SysV();
    EXPECT_EQ(describe(plan({kI32, kI32, kI32}, x64), x64), "registers rax+0 rax+4 rdx+0");
    EXPECT_EQ(describe(plan({kF32, kF32, kF32, kF32}, x64), x64), "registers xmm0+0 xmm0+4 xmm1+0 xmm1+4");

    const auto big = plan({kI32, kI32, kI32, kI32, kI32}, x64);
    EXPECT_TRUE(big.usesStructReturn());
    EXPECT_EQ(big.bufferSize, 20u);
    EXPECT_EQ(big.bufferAlign, 4u);
    EXPECT_FALSE(big.sretInRegister);
    EXPECT_EQ(describe(big, x64), "sret 20 bytes align 4 via rdi");
}

TEST(ReturnAbi, AArch64UsesHfaRegistersAndX8)
{
    const auto &a64 = TargetInfo::aarch64Aapcs64();
    EXPECT_EQ(describe(plan({kF32, kF32, kF32}, a64), a64), "registers v0+0 v1+0 v2+0");
    EXPECT_EQ(describe(plan({kI32, kI32, kI32}, a64), a64), "registers x0+0 x0+4 x1+0");

    const auto fiveFloats = plan({kF32, kF32, kF32, kF32, kF32}, a64);
    EXPECT_TRUE(fiveFloats.usesStructReturn());
    EXPECT_TRUE(fiveFloats.sretInRegister);
    EXPECT_EQ(describe(fiveFloats, a64), "sret 20 bytes align 4 via x8");
}

TEST(ReturnAbi, Riscv32HasEightBytesOfReturnRegisters)
{
    const auto &rv = TargetInfo::riscv32Ilp32();
    EXPECT_EQ(describe(plan({kI32, kI32}, rv), rv), "registers a0+0 a1+0");
    EXPECT_EQ(describe(plan({kF32, kF32}, rv), rv), "registers a0+0 a1+0");
    EXPECT_EQ(describe(plan({kI32, kI32, kI32}, rv), rv), "sret 12 bytes align 4 via a0");
}

TEST(ReturnAbi, MixedTypesAreRejected)
{
    auto p = classifyReturns({kI32, kF32}, TargetInfo::x86_64SysV());
    ASSERT_FALSE(p.hasValue());
    EXPECT_EQ(p.error().message, "mixed return types are not supported: i32 and f32");
}

TEST(ReturnAbi, LegalizeInsertsTheBufferParameter)
{
    const Signature sig = makeSignature({kI32}, {kI32, kI32, kI32});

    auto x64 = legalizeSignature(sig, TargetInfo::x86_64SysV());
    ASSERT_TRUE(x64.hasValue());
    EXPECT_EQ(x64.value(), sig);

    auto rv = legalizeSignature(sig, TargetInfo::riscv32Ilp32());
    ASSERT_TRUE(rv.hasValue());
    ASSERT_EQ(rv.value().params.size(), 2u);
    EXPECT_EQ(rv.value().params[0].purpose, ArgumentPurpose::StructReturn);
    EXPECT_EQ(rv.value().params[0].type.kind, Type::Kind::Ptr);
    EXPECT_EQ(rv.value().structReturnIndex(), 0);
    EXPECT_TRUE(rv.value().returns.empty());
}

TEST(ReturnAbi, FourLanesFitSixteenByteRegisterBudgets)
{
    const std::vector<Type> floats{kF32, kF32, kF32, kF32};
    const std::vector<Type> ints{kI32, kI32, kI32, kI32};
    EXPECT_FALSE(plan(floats, TargetInfo::x86_64SysV()).usesStructReturn());
    EXPECT_FALSE(plan(ints, TargetInfo::x86_64SysV()).usesStructReturn());
    EXPECT_FALSE(plan(floats, TargetInfo::aarch64Aapcs64()).usesStructReturn());
    EXPECT_FALSE(plan(ints, TargetInfo::aarch64Aapcs64()).usesStructReturn());
    EXPECT_TRUE(plan(ints, TargetInfo::riscv32Ilp32()).usesStructReturn());
}

TEST(ReturnAbi, SignaturesReportFloatLanes)
{
    EXPECT_FALSE(makeSignature({kI32}, {kI32}).mentionsFloat());
    EXPECT_FALSE(makeSignature({}, {}).mentionsFloat());
    EXPECT_TRUE(makeSignature({kF32}, {}).mentionsFloat());
    EXPECT_TRUE(makeSignature({kI32}, {kI32, Type(Type::Kind::F64)}).mentionsFloat());

    // Float lanes moved into a caller buffer no longer appear in the signature.
    const Signature sig = makeSignature({kI32}, {kF32, kF32, kF32});
    auto rv = legalizeSignature(sig, TargetInfo::riscv32Ilp32());
    ASSERT_TRUE(rv.hasValue());
    EXPECT_TRUE(sig.mentionsFloat());
    EXPECT_FALSE(rv.value().mentionsFloat());
}

TEST(ReturnAbi, EmitCallThroughBufferLoadsEachLane)
{
    const auto &rv = TargetInfo::riscv32Ilp32();
    const Signature flat = makeSignature({kI32}, {kI32, kI32, kI32});
    const auto p = plan(flat.returnTypes(), rv);
    auto legal = legalizeSignature(flat, rv);
    ASSERT_TRUE(legal.hasValue());

    Module m;
    il::build::IRBuilder b(m);
    b.addExtern("triple", legal.value());
    Function &fn = b.startFunction("caller", makeSignature({kI32}, {kI32, kI32, kI32}));
    BasicBlock &entry = b.addEntryBlock(fn, "entry");
    b.setInsertPoint(entry);
    const Value arg = b.blockParam(entry, 0);
    auto lanes = emitMultiReturnCall(b, fn, "triple", p, {arg});
    b.ret(lanes);

    ASSERT_EQ(lanes.size(), 3u);
    ASSERT_EQ(fn.stackSlots.size(), 1u);
    EXPECT_EQ(fn.stackSlots[0].size, 12u);
    EXPECT_EQ(il::io::Serializer::toString(fn),
              "func @caller(i32) -> (i32, i32, i32) {\n"
              "  slot0: size 12, align 4\n"
              "entry(%0: i32):\n"
              "  %1 = stackaddr.ptr 0, 0\n"
              "  call @triple(%1, %0)\n"
              "  %2 = load.i32 %1, 0\n"
              "  %3 = load.i32 %1, 4\n"
              "  %4 = load.i32 %1, 8\n"
              "  ret %2, %3, %4\n"
              "}\n");
    EXPECT_TRUE(il::verify::Verifier::verify(m).hasValue());
}

TEST(ReturnAbi, EmitRegisterCallKeepsRequestedIds)
{
    const auto &x64 = TargetInfo::x86_64SysV();
    const auto p = plan({kI64, kI64}, x64);

    Module m;
    il::build::IRBuilder b(m);
    b.addExtern("pair", makeSignature({}, {kI64, kI64}));
    Function &fn = b.startFunction("caller", makeSignature({}, {kI64, kI64}));
    BasicBlock &entry = b.addEntryBlock(fn, "entry");
    b.setInsertPoint(entry);
    b.reserveTempsBelow(10);
    auto lanes = emitMultiReturnCall(b, fn, "pair", p, {}, {7, 9});
    b.ret(lanes);

    ASSERT_EQ(lanes.size(), 2u);
    EXPECT_EQ(lanes[0].id, 7u);
    EXPECT_EQ(lanes[1].id, 9u);
    EXPECT_TRUE(fn.stackSlots.empty());
    EXPECT_TRUE(il::verify::Verifier::verify(m).hasValue());
}

TEST(TargetInfo, LookupByName)
{
    EXPECT_EQ(TargetInfo::byName("riscv32-ilp32"), &TargetInfo::riscv32Ilp32());
    EXPECT_EQ(TargetInfo::byName("host"), &TargetInfo::host());
    EXPECT_EQ(TargetInfo::byName("sparc"), nullptr);
    EXPECT_EQ(TargetInfo::x86_64SysV().regName(RegClass::Float, 5), "?");
}
