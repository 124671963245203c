// =============================================================================
//  SEQUIN
//  
//  Copyright © 2008-present: The SEQUIN Authors
//            Please see the AUTHORS.md file.
//  
//  All rights reserved. This program and the accompanying materials
//  are made available under the terms of the GNU Public License v3.0 (or, at
//  your option, any later version) which accompanies this distribution, and
//  is available at http://www.gnu.org/licenses/gpl.html
// =============================================================================

/**
 * @file 
 * Compiler specific macros for inlining and assertions.
 */

#ifndef SEQUIN_COMPILERSPECIFIC_HPP_
#define SEQUIN_COMPILERSPECIFIC_HPP_

// SEQUIN_STRONG_INLINE uses __forceinline on MSVC and Intel ICPC, but doesn't use always_inline of GCC.
#if (defined _MSC_VER) || (defined __INTEL_COMPILER)
#define SEQUIN_STRONG_INLINE __forceinline
#else
#define SEQUIN_STRONG_INLINE inline
#endif

// Assume release build as default
#if defined(NDEBUG) || !defined(DEBUG)
#ifndef SEQUIN_NO_DEBUG
#define SEQUIN_NO_DEBUG
#endif
#ifdef SEQUIN_DEBUG
#undef SEQUIN_DEBUG
#endif
#endif
#if defined(DEBUG) || defined(SEQUIN_DEBUG)
#define SEQUIN_DEBUG
#undef SEQUIN_NO_DEBUG
#include <cassert>
#endif

#ifdef SEQUIN_NO_DEBUG
#define sequin_assert_impl(x)
#else
#define sequin_assert_impl(x) assert(x)
#endif

// Allow user supplied sequin_assert
#ifndef sequin_assert
#define sequin_assert(x) sequin_assert_impl(x)
#endif

#ifdef __GNUC__
#define sequin_likely(x) __builtin_expect(!!(x), 1)
#define sequin_unlikely(x) __builtin_expect(!!(x), 0)
#endif

#ifndef sequin_likely
#define sequin_likely(x) (x)
#define sequin_unlikely(x) (x)
#endif

#endif  // SEQUIN_COMPILERSPECIFIC_HPP_
