// File: src/runtime/builtins/qs_fixed_math.h
// Purpose: Q16.16 primitives shared by the _q32 builtins.
// Key invariants: Match il::fixed bit for bit.  Add and subtract wrap
//                 through uint32_t, never through signed overflow.
// Ownership/Lifetime: Header-only static inline helpers.
#pragma once

#include <stdint.h>

#define QS_FIXED_ONE 65536
#define QS_FIXED_MAX INT32_MAX
#define QS_FIXED_MIN INT32_MIN

static inline int32_t qs_fx_add(int32_t a, int32_t b)
{
    return (int32_t)((uint32_t)a + (uint32_t)b);
}

static inline int32_t qs_fx_sub(int32_t a, int32_t b)
{
    return (int32_t)((uint32_t)a - (uint32_t)b);
}

static inline int32_t qs_fx_mul(int32_t a, int32_t b)
{
    return (int32_t)(uint32_t)(uint64_t)(((int64_t)a * (int64_t)b) >> 16);
}

static inline int32_t qs_fx_div(int32_t a, int32_t b)
{
    if (b == 0)
        return a == 0 ? 0 : (a < 0 ? QS_FIXED_MIN : QS_FIXED_MAX);
    uint64_t abs_a = a < 0 ? (uint64_t)(0u - (uint32_t)a) : (uint64_t)(uint32_t)a;
    uint32_t abs_b = b < 0 ? 0u - (uint32_t)b : (uint32_t)b;
    uint64_t recip = 0x80000000u / abs_b;
    int32_t q = (int32_t)(uint32_t)(((abs_a * recip) << 1) >> 16);
    return (a ^ b) < 0 ? (int32_t)(0u - (uint32_t)q) : q;
}

static inline int32_t qs_fx_abs(int32_t a)
{
    return a < 0 ? (int32_t)(0u - (uint32_t)a) : a;
}

static inline int32_t qs_fx_min(int32_t a, int32_t b)
{
    return a < b ? a : b;
}

static inline int32_t qs_fx_clamp01(int32_t a)
{
    if (a < 0)
        return 0;
    return a > QS_FIXED_ONE ? QS_FIXED_ONE : a;
}
