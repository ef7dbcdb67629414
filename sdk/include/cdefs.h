// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

/*
 * Testing against Clang-specific extensions.
 */
#ifndef __has_attribute
#	define __has_attribute(x) 0
#endif
#ifndef __has_feature
#	define __has_feature(x) 0
#endif
#ifndef __has_extension
#	define __has_extension __has_feature
#endif
#ifndef __has_builtin
#	define __has_builtin(x) 0
#endif

/// Helper to use C++ in headers only in C++ mode.
#ifdef __cplusplus
#	define __if_cxx(x) x
#	define __if_c(x)
#else
#	define __if_cxx(x)
#	define __if_c(x) x
#endif

#ifndef __BEGIN_DECLS
#	if defined(__cplusplus)
#		define __BEGIN_DECLS                                                  \
			extern "C"                                                         \
			{
#		define __END_DECLS }
#	else
#		define __BEGIN_DECLS
#		define __END_DECLS
#	endif
#endif

// glibc's <sys/cdefs.h> defines some of these already when building the host
// tools, so only provide the ones that are missing.
#ifndef __noinline
#	define __noinline __attribute__((noinline))
#endif
#ifndef __always_inline
#	define __always_inline __attribute__((always_inline))
#endif

#ifndef __predict_true
#	define __predict_true(exp) __builtin_expect((exp), 1)
#endif
#ifndef __predict_false
#	define __predict_false(exp) __builtin_expect((exp), 0)
#endif

#ifndef __STRING
#	define __STRING(a) #a
#endif
#ifndef __XSTRING
#	define __XSTRING(a) __STRING(a)
#endif

/**
 * True when building the firmware image for a bare-metal RISC-V target, false
 * when building the host tools (or the host-side tests of device code).
 */
#if defined(__riscv) && !defined(__linux__)
#	define CYCLEBENCH_BAREMETAL 1
#else
#	define CYCLEBENCH_BAREMETAL 0
#endif
