#pragma once

// Compile-time configuration
// Every macro here can be overridden by defining it before the first include.

#include <cassert>
#include <cmath>

// Finiteness assertions inside the relaxed primitives.
// Follows NDEBUG unless set explicitly, so release builds pay nothing.
#ifndef RELAXFP_ENABLE_ASSERTS
#ifdef NDEBUG
#define RELAXFP_ENABLE_ASSERTS 0
#else
#define RELAXFP_ENABLE_ASSERTS 1
#endif
#endif

// Forced inlining for the one-line forwarding functions
#ifndef RELAXFP_INLINE
#if defined(__GNUC__) || defined(__clang__)
#define RELAXFP_INLINE inline __attribute__((always_inline))
#elif defined(_MSC_VER)
#define RELAXFP_INLINE __forceinline
#else
#define RELAXFP_INLINE inline
#endif
#endif

// Compiler assumption: the optimizer may treat `cond` as always true.
// The condition must be free of side effects.
#ifndef RELAXFP_ASSUME
#if defined(__clang__)
#define RELAXFP_ASSUME(cond) __builtin_assume(cond)
#elif defined(__GNUC__) && __GNUC__ >= 13
#define RELAXFP_ASSUME(cond) __attribute__((assume(cond)))
#elif defined(__GNUC__)
#define RELAXFP_ASSUME(cond)                                                   \
  do {                                                                         \
    if (!(cond))                                                               \
      __builtin_unreachable();                                                 \
  } while (0)
#elif defined(_MSC_VER)
#define RELAXFP_ASSUME(cond) __assume(cond)
#else
#define RELAXFP_ASSUME(cond) ((void)0)
#endif
#endif

// Side-effect free finiteness test usable inside RELAXFP_ASSUME
#if defined(__GNUC__) || defined(__clang__)
#define RELAXFP_IS_FINITE(x) __builtin_isfinite(x)
#else
#define RELAXFP_IS_FINITE(x) std::isfinite(x)
#endif

// Fast-math scope for the body of a relaxed primitive.
// Must expand at the start of a compound statement, before any declaration.
//
// Clang: `float_control(precise, off)` gives the operations in the enclosing
// block the full fast-math flag set (no NaNs, no infinities, no signed zeros,
// reciprocals, approximate functions, reassociation, contraction).
// GCC and MSVC: no per-block equivalent; the primitive keeps IEEE evaluation
// and relies on RELAXFP_ASSUME for the finite-operand assumption.
#ifndef RELAXFP_FAST_MATH_SCOPE
#if defined(__clang__)
#define RELAXFP_FAST_MATH_SCOPE _Pragma("float_control(precise, off)")
#define RELAXFP_HAS_FAST_MATH_SCOPE 1
#else
#define RELAXFP_FAST_MATH_SCOPE
#endif
#endif

#ifndef RELAXFP_HAS_FAST_MATH_SCOPE
#define RELAXFP_HAS_FAST_MATH_SCOPE 0
#endif

#if RELAXFP_ENABLE_ASSERTS
#define RELAXFP_ASSERT(cond, msg) assert((cond) && msg)
#else
#define RELAXFP_ASSERT(cond, msg) ((void)0)
#endif
