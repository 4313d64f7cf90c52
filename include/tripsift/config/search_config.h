#pragma once

#include <filesystem>
#include <string>
#include <tripsift/search/travel_search_engine.h>

namespace tripsift::config {

/**
 * @brief Load engine settings from a TOML style config file
 *
 * Reads [search] overfetch_factor, default_limit, default_threshold and
 * worker_threads, plus one [weights] key per constraint name. A missing file
 * yields the defaults; malformed values keep their default and log a warning.
 */
search::SearchEngineConfig loadSearchEngineConfig(const std::filesystem::path& path);

/**
 * @brief [logging] level from the config file, empty when unset
 */
std::string loadLogLevel(const std::filesystem::path& path);

} // namespace tripsift::config
