#pragma once

#if defined(__clang__) && defined(__clang_minor__)
#define FXR_CLANG (__clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__)
#elif defined(__GNUC__) && defined(__GNUC_MINOR__) && defined(__GNUC_PATCHLEVEL__)
#define FXR_GCC (__GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__)
#elif defined(_MSC_FULL_VER)
#define FXR_MSVC _MSC_FULL_VER
#endif

#if defined(__GNUC__)
#define FXR_LIKELY(x) (__builtin_expect(!!(x), 1))
#define FXR_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define FXR_LIKELY(x) (!!(x))
#define FXR_UNLIKELY(x) (!!(x))
#endif

#if defined(FXR_MSVC)
#define FXR_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__)
#define FXR_ALWAYS_INLINE inline __attribute__((__always_inline__))
#else
#define FXR_ALWAYS_INLINE inline
#endif

#define FXR_STRINGIFY(x) #x
#define FXR_VER_STRING(major, minor, patch) FXR_STRINGIFY(major) "." FXR_STRINGIFY(minor) "." FXR_STRINGIFY(patch)

#ifdef FXR_CLANG
#define FXR_COMPILER_VERSION "clang " FXR_VER_STRING(__clang_major__, __clang_minor__, __clang_patchlevel__)
#elif defined(__GNUC__)
#define FXR_COMPILER_VERSION "g++ " FXR_VER_STRING(__GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__)
#elif defined(_MSC_VER)
#define FXR_COMPILER_VERSION "MSVC " FXR_STRINGIFY(_MSC_FULL_VER)
#else
#error "Unknown compiler. Only clang, gcc and MSVC are supported."
#endif

#ifndef FXR_VERSION
#define FXR_VERSION "0.1.0"
#endif
