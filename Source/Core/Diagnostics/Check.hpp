#pragma once
//
// Lapwatch - Core/Diagnostics/Check.hpp
// Lightweight invariant macros (no heavy deps).
//
// Provided:
//   - LAP_CHECK(cond): soft check (no-op in Release). In Debug, optional trap.
//   - LAP_VERIFY(cond): always evaluates cond; in Debug can optionally trap.
//
// LAP_ASSERT lives in Logger.hpp (it reports through the logger).
//
// Optional toggles (define before including this header):
//   - LAP_CHECK_BREAK  : LAP_CHECK traps in Debug when cond fails
//   - LAP_VERIFY_BREAK : LAP_VERIFY traps in Debug when cond fails
//

#ifndef LAP_DEBUG
#  ifndef NDEBUG
#    define LAP_DEBUG 1
#  else
#    define LAP_DEBUG 0
#  endif
#endif

#if LAP_DEBUG
#  if defined(_MSC_VER)
#    define LAP_INTERNAL_DEBUG_BREAK() __debugbreak()
#  elif defined(__clang__) || defined(__GNUC__)
#    define LAP_INTERNAL_DEBUG_BREAK() __builtin_trap()
#  else
#    include <cstdlib>
#    define LAP_INTERNAL_DEBUG_BREAK() std::abort()
#  endif
#else
#  define LAP_INTERNAL_DEBUG_BREAK() ((void)0)
#endif

// ----------------------------------------------------------------------------
// LAP_CHECK: soft check
//  - Release: no-op, cond is not evaluated
//  - Debug:   silent unless LAP_CHECK_BREAK is defined
// ----------------------------------------------------------------------------
#ifndef LAP_CHECK
#  if LAP_DEBUG
#    ifdef LAP_CHECK_BREAK
#      define LAP_CHECK(cond) do { if(!(cond)) { LAP_INTERNAL_DEBUG_BREAK(); } } while(0)
#    else
#      define LAP_CHECK(cond) do { if(!(cond)) { /* optional breakpoint in debug */ } } while(0)
#    endif
#  else
#    define LAP_CHECK(cond) ((void)0)
#  endif
#endif

// ----------------------------------------------------------------------------
// LAP_VERIFY: always evaluates `cond`
// ----------------------------------------------------------------------------
#ifndef LAP_VERIFY
#  if LAP_DEBUG && defined(LAP_VERIFY_BREAK)
#    define LAP_VERIFY(cond) do { if(!(cond)) { LAP_INTERNAL_DEBUG_BREAK(); } } while(0)
#  else
#    define LAP_VERIFY(cond) ((void)(cond))
#  endif
#endif
