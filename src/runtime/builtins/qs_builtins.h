// File: src/runtime/builtins/qs_builtins.h
// Purpose: Declares the native shader builtins called by generated code.
// Key invariants: Every variant-dependent routine exists as an _f32/_q32 pair
//                 with identical shapes; _q32 routines use Q16.16 encodings.
// Ownership/Lifetime: Stateless; results are returned by value.
// Links: src/il/builtins/BuiltinCatalog.cpp
#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    /// @brief Three float lanes returned by value (12 bytes).
    typedef struct qs_vec3f
    {
        float x, y, z;
    } qs_vec3f;

    /// @brief Three Q16.16 lanes returned by value (12 bytes).
    typedef struct qs_vec3q
    {
        int32_t x, y, z;
    } qs_vec3q;

    /// @brief Two float lanes returned by value (8 bytes).
    typedef struct qs_vec2f
    {
        float x, y;
    } qs_vec2f;

    /// @brief Two Q16.16 lanes returned by value (8 bytes).
    typedef struct qs_vec2q
    {
        int32_t x, y;
    } qs_vec2q;

    /// @brief Four float lanes returned by value (16 bytes).
    typedef struct qs_vec4f
    {
        float x, y, z, w;
    } qs_vec4f;

    /// @brief Four Q16.16 lanes returned by value (16 bytes).
    typedef struct qs_vec4q
    {
        int32_t x, y, z, w;
    } qs_vec4q;

    float qs_sin_f32(float x);
    float qs_cos_f32(float x);
    float qs_saturate_f32(float x);
    qs_vec3f qs_hue2rgb_f32(float hue);
    qs_vec3f qs_hsv2rgb_f32(float h, float s, float v);
    qs_vec4f qs_hsv2rgb_vec4_f32(float h, float s, float v, float a);
    qs_vec3f qs_rgb2hsv_f32(float r, float g, float b);
    qs_vec4f qs_rgb2hsv_vec4_f32(float r, float g, float b, float a);
    qs_vec2f qs_rotate2_f32(float x, float y, float angle);

    int32_t qs_sin_q32(int32_t x);
    int32_t qs_cos_q32(int32_t x);
    int32_t qs_saturate_q32(int32_t x);
    qs_vec3q qs_hue2rgb_q32(int32_t hue);
    qs_vec3q qs_hsv2rgb_q32(int32_t h, int32_t s, int32_t v);
    qs_vec4q qs_hsv2rgb_vec4_q32(int32_t h, int32_t s, int32_t v, int32_t a);
    qs_vec3q qs_rgb2hsv_q32(int32_t r, int32_t g, int32_t b);
    qs_vec4q qs_rgb2hsv_vec4_q32(int32_t r, int32_t g, int32_t b, int32_t a);
    qs_vec2q qs_rotate2_q32(int32_t x, int32_t y, int32_t angle);

    /// @brief Integer hash shared by both numeric domains.
    uint32_t qs_hash_u32(uint32_t x, uint32_t seed);

#ifdef __cplusplus
}
#endif
