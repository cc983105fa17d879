/*
 * Copyright (C) 2026 The Sieve Authors. All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions
 * are met:
 * 1. Redistributions of source code must retain the above copyright
 *    notice, this list of conditions and the following disclaimer.
 * 2. Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE SIEVE AUTHORS AND CONTRIBUTORS ``AS IS''
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
 * THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE SIEVE AUTHORS OR CONTRIBUTORS
 * BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF
 * THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef Sieve_Platform_h
#define Sieve_Platform_h

/* COMPILER() - the compiler being used to build the project */
#define COMPILER(SIEVE_FEATURE) (defined SIEVE_COMPILER_##SIEVE_FEATURE && SIEVE_COMPILER_##SIEVE_FEATURE)

/* ENABLE() - turn on a specific feature of the project */
#define ENABLE(SIEVE_FEATURE) (defined ENABLE_##SIEVE_FEATURE && ENABLE_##SIEVE_FEATURE)

/* COMPILER(MSVC) */
#if defined(_MSC_VER)
#define SIEVE_COMPILER_MSVC 1
#endif

/* COMPILER(CLANG) */
#if defined(__clang__)
#define SIEVE_COMPILER_CLANG 1
#endif

/* COMPILER(GCC_OR_CLANG) - GCC or a compiler that speaks its dialect */
#if defined(__GNUC__)
#define SIEVE_COMPILER_GCC_OR_CLANG 1
#endif

#if COMPILER(GCC_OR_CLANG)
#define ALWAYS_INLINE inline __attribute__((__always_inline__))
#define NEVER_INLINE __attribute__((__noinline__))
#define UNLIKELY(x) __builtin_expect(!!(x), 0)
#define LIKELY(x) __builtin_expect(!!(x), 1)
#else
#define ALWAYS_INLINE inline
#define NEVER_INLINE
#define UNLIKELY(x) (x)
#define LIKELY(x) (x)
#endif

/* Failure memoization in the backtracking interpreter. Turning it off at build time
   leaves MatchOptions::memoize without effect. */
#ifndef ENABLE_REGEX_MEMOIZATION
#define ENABLE_REGEX_MEMOIZATION 1
#endif

#endif /* Sieve_Platform_h */
