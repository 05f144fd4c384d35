#pragma once

#include <cstdio>

#ifndef RICHEDIT_ENABLE_LOGGING
#define RICHEDIT_ENABLE_LOGGING 0
#endif

#if RICHEDIT_ENABLE_LOGGING
#define RICHEDIT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[richedit] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define RICHEDIT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[richedit] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define RICHEDIT_LOG_DEBUG(...) do { } while (0)
#define RICHEDIT_LOG_WARN(...) do { } while (0)
#endif
