#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <tripsift/core/types.h>
#include <tripsift/search/search_results.h>
#include <tripsift/search/soft_scorer.h>
#include <tripsift/vector/candidate_store.h>

namespace tripsift::search {

using json = nlohmann::json;

json toJson(const SearchResultItem& item);

/**
 * @brief Serialize a response
 *
 * {"query", "results": [{"id", "text", "source", "metadata", "score",
 * "base_similarity"}], "total_results", "processing_time", "hard_filter",
 * "constraints"}. hard_filter is null for an unfiltered search.
 */
json toJson(const SearchResponse& response);

json toJson(const ScoreExplanation& explanation);

/**
 * @brief Parse corpus fixtures
 *
 * Expects an array of {"id", "text", "source", "metadata": {...}} objects.
 * Metadata values may be strings, numbers or booleans; they are stored in
 * string form. Embeddings are left empty for the caller to fill in.
 */
Result<std::vector<vector::CandidateRecord>> parseCorpus(const json& doc);

Result<std::vector<vector::CandidateRecord>> loadCorpusFile(const std::filesystem::path& path);

} // namespace tripsift::search
