#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime assertion that works in both debug and release builds.
 *
 * Unlike standard assert(), GENEVO_ASSERT is never compiled out.
 * Use for caller contract violations (bad probabilities, breeding before start).
 *
 * When an assertion fails:
 * - Logs a CRITICAL message with file, line, and condition
 * - Aborts the program immediately
 *
 * Example:
 *   GENEVO_ASSERT(probability > 0.0 && probability < 1.0,
 *                 "Bit flip probability must be in (0, 1)");
 */
#define GENEVO_ASSERT(condition, message)                                                   \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
