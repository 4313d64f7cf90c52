#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <system_error>
#include <tripsift/common/text_utils.h>
#include <tripsift/config/config_helpers.h>
#include <tripsift/config/search_config.h>

namespace tripsift::config {

namespace {

void readCount(const std::filesystem::path& path, const std::string& key, size_t minimum,
               size_t& target) {
    auto raw = parse_config_value(path, "search", key);
    if (raw.empty())
        return;
    auto value = common::parseNumber(raw);
    if (!value || *value < static_cast<double>(minimum) || std::floor(*value) != *value ||
        *value >= static_cast<double>(std::numeric_limits<size_t>::max())) {
        spdlog::warn("Config {}: ignoring search.{} = '{}' (expected an integer >= {})",
                     path.string(), key, raw, minimum);
        return;
    }
    target = static_cast<size_t>(*value);
}

} // namespace

search::SearchEngineConfig loadSearchEngineConfig(const std::filesystem::path& path) {
    search::SearchEngineConfig config;

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config at '{}', using search defaults", path.string());
        return config;
    }

    readCount(path, "overfetch_factor", 1, config.overfetchFactor);
    readCount(path, "default_limit", 1, config.defaultLimit);
    readCount(path, "worker_threads", 0, config.workerThreads);

    if (auto raw = parse_config_value(path, "search", "default_threshold"); !raw.empty()) {
        auto value = common::parseNumber(raw);
        if (value && *value >= 0.0 && *value <= 1.0) {
            config.defaultThreshold = static_cast<float>(*value);
        } else {
            spdlog::warn("Config {}: ignoring search.default_threshold = '{}' (expected 0..1)",
                         path.string(), raw);
        }
    }

    for (const auto& [key, raw] : parse_config_section(path, "weights")) {
        if (key == "default") {
            if (auto value = common::parseNumber(raw)) {
                config.weights.defaultWeight = std::clamp(static_cast<float>(*value), 0.0f, 1.0f);
            } else {
                spdlog::warn("Config {}: ignoring weights.default = '{}'", path.string(), raw);
            }
            continue;
        }

        auto kind = search::constraintKindFromName(key);
        if (!kind) {
            spdlog::warn("Config {}: unknown constraint '{}' in [weights]", path.string(), key);
            continue;
        }
        auto value = common::parseNumber(raw);
        if (!value) {
            spdlog::warn("Config {}: ignoring weights.{} = '{}'", path.string(), key, raw);
            continue;
        }
        if (*value < 0.0 || *value > 1.0) {
            spdlog::warn("Config {}: weights.{} = {} clamped to [0, 1]", path.string(), key,
                         *value);
        }
        config.weights.setWeight(*kind, std::clamp(static_cast<float>(*value), 0.0f, 1.0f));
    }

    spdlog::debug("Loaded search config from {} (overfetch={}, limit={}, threshold={})",
                  path.string(), config.overfetchFactor, config.defaultLimit,
                  config.defaultThreshold);
    return config;
}

std::string loadLogLevel(const std::filesystem::path& path) {
    return parse_config_value(path, "logging", "level");
}

} // namespace tripsift::config
