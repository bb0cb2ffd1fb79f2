// File: tests/codegen/abi/NativeCallTests.cpp
// Purpose: Cross-check return plans against natively compiled functions by
//          reading results the way the plan says they arrive.
// Key invariants: For every host-invokable plan, invokeNative produces the
//                 same lanes as calling the function directly from C++.
// Ownership/Lifetime: Output buffers are test-local arrays.
// Links: src/codegen/abi/NativeCall.hpp, src/runtime/builtins/qs_builtins.h

#include "codegen/abi/NativeCall.hpp"
#include "codegen/abi/Target.hpp"

#include "il/fixed/FixedPoint.hpp"
#include "runtime/builtins/qs_builtins.h"

#include <gtest/gtest.h>

#include <cstring>
#include <vector>

using namespace il::core;
using namespace qshade::codegen::abi;

namespace
{
const Type kF32(Type::Kind::F32);
const Type kI32(Type::Kind::I32);

struct Five
{
    int32_t v[5];
};

Five makeFive(int32_t base)
{
    Five f;
    for (int i = 0; i < 5; ++i)
        f.v[i] = base + i * 11;
    return f;
}

ReturnPlan hostPlan(std::vector<Type> types)
{
    auto p = classifyReturns(types, TargetInfo::host());
    EXPECT_TRUE(p.hasValue());
    return p.hasValue() ? p.value() : ReturnPlan{};
}

} // namespace

/// Tests that call into native code; skipped where the host ABI is not modelled.
class NativeCallOnHost : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        if (!TargetInfo::host().isHost())
            GTEST_SKIP() << "no modelled ABI for this host";
    }
};

TEST_F(NativeCallOnHost, ScalarReturnMatchesDirectCall)
{
    const auto plan = hostPlan({kI32});
    int32_t out = 0;
    const int32_t x = il::fixed::toFixed(0.75);
    auto r = invokeNative(reinterpret_cast<const void *>(&qs_sin_q32), plan, TargetInfo::host(),
                          {NativeArg::fromI32(x)}, &out);
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    EXPECT_EQ(out, qs_sin_q32(x));
}

TEST_F(NativeCallOnHost, FloatLanesMatchDirectCall)
{
    const auto &host = TargetInfo::host();
    const auto plan = hostPlan({kF32, kF32, kF32});
    if (plan.usesStructReturn() && plan.sretInRegister)
        GTEST_SKIP() << "struct return through " << host.sretLocation;

    float out[3] = {};
    auto r = invokeNative(reinterpret_cast<const void *>(&qs_hsv2rgb_f32), plan, host,
                          {NativeArg::fromF32(0.3f), NativeArg::fromF32(0.8f), NativeArg::fromF32(0.9f)}, out);
    ASSERT_TRUE(r.hasValue()) << r.error().message;

    const qs_vec3f want = qs_hsv2rgb_f32(0.3f, 0.8f, 0.9f);
    EXPECT_EQ(out[0], want.x);
    EXPECT_EQ(out[1], want.y);
    EXPECT_EQ(out[2], want.z);
}

TEST_F(NativeCallOnHost, FixedLanesMatchDirectCall)
{
    const auto &host = TargetInfo::host();
    const auto plan = hostPlan({kI32, kI32});
    if (plan.usesStructReturn() && plan.sretInRegister)
        GTEST_SKIP() << "struct return through " << host.sretLocation;

    const int32_t x = il::fixed::toFixed(1.0);
    const int32_t y = il::fixed::toFixed(0.5);
    const int32_t angle = il::fixed::toFixed(0.6);
    int32_t out[2] = {};
    auto r = invokeNative(reinterpret_cast<const void *>(&qs_rotate2_q32), plan, host,
                          {NativeArg::fromI32(x), NativeArg::fromI32(y), NativeArg::fromI32(angle)}, out);
    ASSERT_TRUE(r.hasValue()) << r.error().message;

    const qs_vec2q want = qs_rotate2_q32(x, y, angle);
    EXPECT_EQ(out[0], want.x);
    EXPECT_EQ(out[1], want.y);
}

TEST_F(NativeCallOnHost, StructReturnWritesThroughTheBuffer)
{
    const auto &host = TargetInfo::host();
    const auto plan = hostPlan({kI32, kI32, kI32, kI32, kI32});
    ASSERT_TRUE(plan.usesStructReturn());

    int32_t out[5] = {};
    auto r = invokeNative(reinterpret_cast<const void *>(&makeFive), plan, host, {NativeArg::fromI32(100)}, out);
    if (plan.sretInRegister)
    {
        ASSERT_FALSE(r.hasValue());
        EXPECT_NE(r.error().message.find(host.sretLocation), std::string::npos);
        return;
    }
    ASSERT_TRUE(r.hasValue()) << r.error().message;
    const Five want = makeFive(100);
    EXPECT_EQ(std::memcmp(out, want.v, sizeof(out)), 0);
}

TEST_F(NativeCallOnHost, FourFloatLanesMatchDirectCall)
{
    const auto &host = TargetInfo::host();
    const auto plan = hostPlan({kF32, kF32, kF32, kF32});
    if (plan.usesStructReturn() && plan.sretInRegister)
        GTEST_SKIP() << "struct return through " << host.sretLocation;

    float out[4] = {};
    auto r = invokeNative(reinterpret_cast<const void *>(&qs_hsv2rgb_vec4_f32),
                          plan,
                          host,
                          {NativeArg::fromF32(0.7f), NativeArg::fromF32(0.5f), NativeArg::fromF32(0.8f),
                           NativeArg::fromF32(0.25f)},
                          out);
    ASSERT_TRUE(r.hasValue()) << r.error().message;

    const qs_vec4f want = qs_hsv2rgb_vec4_f32(0.7f, 0.5f, 0.8f, 0.25f);
    EXPECT_EQ(out[0], want.x);
    EXPECT_EQ(out[1], want.y);
    EXPECT_EQ(out[2], want.z);
    EXPECT_EQ(out[3], 0.25f);
}

TEST_F(NativeCallOnHost, FourFixedLanesMatchDirectCall)
{
    const auto &host = TargetInfo::host();
    const auto plan = hostPlan({kI32, kI32, kI32, kI32});
    if (plan.usesStructReturn() && plan.sretInRegister)
        GTEST_SKIP() << "struct return through " << host.sretLocation;

    const int32_t r0 = il::fixed::toFixed(0.9);
    const int32_t g0 = il::fixed::toFixed(0.2);
    const int32_t b0 = il::fixed::toFixed(0.4);
    const int32_t a0 = il::fixed::toFixed(0.5);
    int32_t out[4] = {};
    auto r = invokeNative(reinterpret_cast<const void *>(&qs_rgb2hsv_vec4_q32),
                          plan,
                          host,
                          {NativeArg::fromI32(r0), NativeArg::fromI32(g0), NativeArg::fromI32(b0), NativeArg::fromI32(a0)},
                          out);
    ASSERT_TRUE(r.hasValue()) << r.error().message;

    const qs_vec4q want = qs_rgb2hsv_vec4_q32(r0, g0, b0, a0);
    EXPECT_EQ(out[0], want.x);
    EXPECT_EQ(out[1], want.y);
    EXPECT_EQ(out[2], want.z);
    EXPECT_EQ(out[3], a0);
}

TEST_F(NativeCallOnHost, RejectsMoreThanFourArguments)
{
    int32_t out = 0;
    std::vector<NativeArg> args(kMaxNativeArgs + 1, NativeArg::fromI32(1));
    auto r = invokeNative(reinterpret_cast<const void *>(&qs_hash_u32), hostPlan({kI32}), TargetInfo::host(), args, &out);
    ASSERT_FALSE(r.hasValue());
    EXPECT_NE(r.error().message.find("at most 4"), std::string::npos);
}

TEST(NativeCall, ForeignTargetsAreRefused)
{
    for (const TargetInfo *t : TargetInfo::all())
    {
        if (t->isHost())
            continue;
        int32_t out = 0;
        auto r = invokeNative(reinterpret_cast<const void *>(&qs_sin_q32), ReturnPlan{}, *t, {}, &out);
        ASSERT_FALSE(r.hasValue());
        EXPECT_NE(r.error().message.find(t->name), std::string::npos);
    }
}

TEST_F(NativeCallOnHost, RejectsMixedArguments)
{
    int32_t out = 0;
    auto r = invokeNative(reinterpret_cast<const void *>(&qs_hash_u32), hostPlan({kI32}), TargetInfo::host(),
                          {NativeArg::fromI32(1), NativeArg::fromF32(2.0f)}, &out);
    ASSERT_FALSE(r.hasValue());
}
