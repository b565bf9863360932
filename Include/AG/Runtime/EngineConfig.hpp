#pragma once

#include <cstddef>

namespace ag {

// Inference settings shared by every session of an Advisor
struct EngineConfig {
    // Firings allowed in a single run before CycleLimitExceeded
    size_t maxCycles{10000};
    // Firings reported by CycleLimitExceeded
    size_t traceDepth{10};
    bool debug{false};

    /**
     * @brief Defaults overridden by AG_DEBUG, AG_MAX_CYCLES and AG_TRACE_DEPTH
     *
     * Unparseable numeric values are ignored.
     */
    static EngineConfig fromEnvironment();
};

} // namespace ag
