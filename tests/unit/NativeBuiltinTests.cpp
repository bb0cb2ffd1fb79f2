// File: tests/unit/NativeBuiltinTests.cpp
// Purpose: Check the Q16.16 native builtins against the wrapping reference
//          arithmetic in il::fixed and against their float twins.
// Key invariants: Intermediate sums and differences wrap modulo 2^32 exactly
//                 like il::fixed::add/sub, including at extreme inputs.
// Ownership/Lifetime: Pure functions; no shared state.
// Links: src/runtime/builtins/qs_color.c, src/il/fixed/FixedPoint.hpp

#include "il/fixed/FixedPoint.hpp"
#include "runtime/builtins/qs_builtins.h"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>

namespace fx = il::fixed;

namespace
{
constexpr int32_t kOne = 1 << 16;

int32_t clamp01(int32_t v)
{
    return fx::min(fx::max(v, 0), kOne);
}

qs_vec3q referenceHue2rgb(int32_t hue)
{
    const int32_t h6 = static_cast<int32_t>(static_cast<uint32_t>(hue) * 6u);
    qs_vec3q rgb;
    rgb.x = clamp01(fx::sub(fx::abs(fx::sub(h6, 3 * kOne)), kOne));
    rgb.y = clamp01(fx::sub(2 * kOne, fx::abs(fx::sub(h6, 2 * kOne))));
    rgb.z = clamp01(fx::sub(2 * kOne, fx::abs(fx::sub(h6, 4 * kOne))));
    return rgb;
}

double real(int32_t v)
{
    return static_cast<double>(v) / fx::kScale;
}
} // namespace

TEST(NativeBuiltins, Hue2rgbWrapsAtExtremeHues)
{
    for (int32_t hue : {-357913941,
                        357913941,
                        std::numeric_limits<int32_t>::min(),
                        std::numeric_limits<int32_t>::max(),
                        -(1 << 30),
                        fx::toFixed(0.25)})
    {
        const qs_vec3q got = qs_hue2rgb_q32(hue);
        const qs_vec3q want = referenceHue2rgb(hue);
        EXPECT_EQ(got.x, want.x) << "hue " << hue;
        EXPECT_EQ(got.y, want.y) << "hue " << hue;
        EXPECT_EQ(got.z, want.z) << "hue " << hue;
    }
}

TEST(NativeBuiltins, Rotate2WrapsLargeProducts)
{
    const int32_t big = 30000 << 16;
    for (int32_t angle : {kOne, fx::toFixed(2.5), fx::toFixed(-0.8)})
    {
        const qs_vec2q got = qs_rotate2_q32(big, -big, angle);
        const int32_t c = qs_cos_q32(angle);
        const int32_t s = qs_sin_q32(angle);
        EXPECT_EQ(got.x, fx::sub(fx::mul(big, c), fx::mul(-big, s))) << "angle " << angle;
        EXPECT_EQ(got.y, fx::add(fx::mul(big, s), fx::mul(-big, c))) << "angle " << angle;
    }
}

TEST(NativeBuiltins, Rgb2hsvFixedTracksFloat)
{
    const float colours[][3] = {{0.9f, 0.2f, 0.4f}, {0.1f, 0.8f, 0.3f}, {0.25f, 0.5f, 0.75f}, {0.6f, 0.6f, 0.6f}};
    for (const auto &c : colours)
    {
        const qs_vec3f f = qs_rgb2hsv_f32(c[0], c[1], c[2]);
        const qs_vec3q q = qs_rgb2hsv_q32(fx::toFixed(c[0]), fx::toFixed(c[1]), fx::toFixed(c[2]));
        EXPECT_NEAR(real(q.x), f.x, 0.005) << c[0] << "," << c[1] << "," << c[2];
        EXPECT_NEAR(real(q.y), f.y, 0.005) << c[0] << "," << c[1] << "," << c[2];
        EXPECT_NEAR(real(q.z), f.z, 0.005) << c[0] << "," << c[1] << "," << c[2];
    }
}

TEST(NativeBuiltins, Rgb2hsvInvertsHsv2rgb)
{
    const qs_vec3f rgb = qs_hsv2rgb_f32(0.3f, 0.7f, 0.8f);
    const qs_vec3f hsv = qs_rgb2hsv_f32(rgb.x, rgb.y, rgb.z);
    EXPECT_NEAR(hsv.x, 0.3f, 1e-4);
    EXPECT_NEAR(hsv.y, 0.7f, 1e-4);
    EXPECT_NEAR(hsv.z, 0.8f, 1e-4);
}

TEST(NativeBuiltins, Vec4OverloadsPassAlphaThrough)
{
    const int32_t alpha = fx::toFixed(0.375);
    const qs_vec4q hsv = qs_rgb2hsv_vec4_q32(fx::toFixed(0.9), fx::toFixed(0.2), fx::toFixed(0.4), alpha);
    const qs_vec3q hsv3 = qs_rgb2hsv_q32(fx::toFixed(0.9), fx::toFixed(0.2), fx::toFixed(0.4));
    EXPECT_EQ(hsv.x, hsv3.x);
    EXPECT_EQ(hsv.y, hsv3.y);
    EXPECT_EQ(hsv.z, hsv3.z);
    EXPECT_EQ(hsv.w, alpha);

    const qs_vec4f rgba = qs_hsv2rgb_vec4_f32(0.1f, 0.5f, 1.0f, -2.0f);
    const qs_vec3f rgb = qs_hsv2rgb_f32(0.1f, 0.5f, 1.0f);
    EXPECT_EQ(rgba.x, rgb.x);
    EXPECT_EQ(rgba.y, rgb.y);
    EXPECT_EQ(rgba.z, rgb.z);
    EXPECT_EQ(rgba.w, -2.0f);
}
