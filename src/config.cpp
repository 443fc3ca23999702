#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace {

bool readEnv(const char* name, std::string& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    out = v;
    return true;
}

} // namespace

size_t parseSize(const std::string& name, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("invalid value for " + name + ": '" + value + "'");
    }
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("value out of range for " + name + ": '" + value + "'");
    }
}

void Config::applyEnvironment() {
    readEnv("CCSIFT_COLLINFO_URL", collinfo_url);
    readEnv("CCSIFT_INDEX_BASE", index_base);
    readEnv("CCSIFT_DATA_BASE", data_base);
    readEnv("CCSIFT_USER_AGENT", user_agent);

    std::string retries;
    if (readEnv("CCSIFT_RETRIES", retries)) {
        retry.retries = static_cast<unsigned>(parseSize("CCSIFT_RETRIES", retries));
    }

    std::string level;
    if (readEnv("CCSIFT_LOG_LEVEL", level) && !Utils::parseLogLevel(level, log_level)) {
        throw std::invalid_argument("invalid CCSIFT_LOG_LEVEL: '" + level + "'");
    }
}
