#include "AG/Runtime/EngineConfig.hpp"

#include <cctype>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace ag {

static std::optional<size_t> readCount(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw) return std::nullopt;
    std::string v = raw;
    if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
    try {
        return static_cast<size_t>(std::stoull(v));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

EngineConfig EngineConfig::fromEnvironment() {
    EngineConfig config;
    if (const char* env = std::getenv("AG_DEBUG")) {
        std::string v = env;
        for (auto &c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (v == "1" || v == "true" || v == "yes" || v == "on") {
            config.debug = true;
        }
    }
    if (auto n = readCount("AG_MAX_CYCLES")) config.maxCycles = *n;
    if (auto n = readCount("AG_TRACE_DEPTH")) config.traceDepth = *n;
    return config;
}

} // namespace ag
