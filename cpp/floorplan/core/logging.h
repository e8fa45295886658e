#pragma once

#include <cstdio>

#ifndef FLOORPLAN_ENABLE_LOGGING
#define FLOORPLAN_ENABLE_LOGGING 0
#endif

#if FLOORPLAN_ENABLE_LOGGING
#define FLOORPLAN_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[floorplan] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define FLOORPLAN_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[floorplan][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define FLOORPLAN_LOG_DEBUG(...) do { } while (0)
#define FLOORPLAN_LOG_WARN(...) do { } while (0)
#endif
