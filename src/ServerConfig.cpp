#include "ServerConfig.hpp"
#include <stdexcept>

namespace {

std::int64_t readInt(const Json::Value& section, const char* name, std::int64_t fallback) {
    if (!section.isMember(name)) {
        return fallback;
    }
    const Json::Value& v = section[name];
    if (!v.isIntegral()) {
        throw std::invalid_argument(std::string("pistream.") + name + " must be an integer");
    }
    return v.asInt64();
}

std::string readString(const Json::Value& section, const char* name, const std::string& fallback) {
    if (!section.isMember(name)) {
        return fallback;
    }
    const Json::Value& v = section[name];
    if (!v.isString() || v.asString().empty()) {
        throw std::invalid_argument(std::string("pistream.") + name + " must be a non-empty string");
    }
    return v.asString();
}

}  // namespace

ServerConfig parseServerConfig(const Json::Value& customConfig) {
    ServerConfig cfg;
    if (!customConfig.isObject() || !customConfig.isMember("pistream")) {
        return cfg;
    }
    const Json::Value& section = customConfig["pistream"];
    if (!section.isObject()) {
        throw std::invalid_argument("pistream section must be an object");
    }

    cfg.objectRoot = readString(section, "object_root", cfg.objectRoot);
    cfg.objectKey = readString(section, "object_key", cfg.objectKey);
    cfg.maxRange = readInt(section, "max_range", cfg.maxRange);
    cfg.defaultLength = readInt(section, "default_length", cfg.defaultLength);
    cfg.cacheMaxAge = readInt(section, "cache_max_age", cfg.cacheMaxAge);
    cfg.retryAfter = readInt(section, "retry_after", cfg.retryAfter);

    if (cfg.maxRange <= 0 || cfg.maxRange > kMaxRangeCeiling) {
        throw std::invalid_argument("pistream.max_range must be in [1, " + std::to_string(kMaxRangeCeiling) + "]");
    }
    if (cfg.defaultLength <= 0 || cfg.defaultLength > cfg.maxRange) {
        throw std::invalid_argument("pistream.default_length must be in [1, max_range]");
    }
    if (cfg.cacheMaxAge < 0) {
        throw std::invalid_argument("pistream.cache_max_age must be non-negative");
    }
    if (cfg.retryAfter < 0) {
        throw std::invalid_argument("pistream.retry_after must be non-negative");
    }
    return cfg;
}
