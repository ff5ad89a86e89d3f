#pragma once

// STANZA_API is empty for the static library. The STANZA_BUILD_SHARED CMake option
// builds with STANZA_BUILD_SHARED and hands STANZA_SHARED to consumers.
#ifndef STANZA_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define STANZA_PLATFORM_WINDOWS 1
#else
#define STANZA_PLATFORM_WINDOWS 0
#endif
#if STANZA_PLATFORM_WINDOWS
#if defined(STANZA_BUILD_SHARED)
#define STANZA_API __declspec(dllexport)
#elif defined(STANZA_SHARED)
#define STANZA_API __declspec(dllimport)
#else
#define STANZA_API
#endif
#else
#if defined(STANZA_BUILD_SHARED) || defined(STANZA_SHARED)
#if __GNUC__ >= 4
#define STANZA_API __attribute__((visibility("default")))
#else
#define STANZA_API
#endif // __GNUC__
#else
#define STANZA_API
#endif // STANZA_BUILD_SHARED || STANZA_SHARED
#endif // STANZA_PLATFORM_WINDOWS
#endif // STANZA_API

#ifndef STANZA_DEFAULT_MAX_DEPTH
#define STANZA_DEFAULT_MAX_DEPTH 64
#endif

#ifndef STANZA_DEFAULT_BUFFER_SIZE
#define STANZA_DEFAULT_BUFFER_SIZE (16 * 1024)
#endif
