#pragma once

#include <cstdio>

#ifndef KARTA_ENABLE_LOGGING
#define KARTA_ENABLE_LOGGING 0
#endif

#if KARTA_ENABLE_LOGGING
#define KARTA_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[karta] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define KARTA_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[karta][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define KARTA_LOG_DEBUG(...) do { } while (0)
#define KARTA_LOG_WARN(...) do { } while (0)
#endif
