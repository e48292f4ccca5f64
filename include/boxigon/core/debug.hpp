#pragma once

#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef BOXIGON_ENABLE_DEBUG
#define BOXIGON_ENABLE_DEBUG 0
#endif

// Debug levels
#define BOXIGON_DEBUG_LEVEL_NONE 0
#define BOXIGON_DEBUG_LEVEL_BASIC 1
#define BOXIGON_DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef BOXIGON_CURRENT_DEBUG_LEVEL
#define BOXIGON_CURRENT_DEBUG_LEVEL BOXIGON_DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define BOXIGON_DEBUG_MSG(level, x) do { \
    if (BOXIGON_ENABLE_DEBUG && (level) <= BOXIGON_CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Non-fatal anomalies, always reported
#define BOXIGON_WARN(component, x) do { \
    std::cerr << "[" << component << "] Warning: " << x << "\n"; \
} while(0)
