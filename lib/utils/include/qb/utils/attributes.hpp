/*
Module Name:
- attributes.hpp

Abstract:
- Cross-compiler wrappers for the few inlining and branch hints used on hot paths.
- Keeps spelling uniform across MSVC, Clang and GCC.

Provided Macros:
- QB_FORCE_INLINE
- QB_LIKELY(x), QB_UNLIKELY(x)

Notes:
- Hints guide code generation only and do not change semantics.
*/
#pragma once

#ifndef __has_attribute
#define __has_attribute(x) 0
#endif

// QB_FORCE_INLINE
#if defined(_MSC_VER)
#define QB_FORCE_INLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
#define QB_FORCE_INLINE inline __attribute__((always_inline))
#else
#define QB_FORCE_INLINE inline
#endif

// QB_LIKELY / QB_UNLIKELY
#if defined(__clang__) || defined(__GNUC__)
#define QB_LIKELY(x) (__builtin_expect(!!(x), 1))
#define QB_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define QB_LIKELY(x) (x)
#define QB_UNLIKELY(x) (x)
#endif
