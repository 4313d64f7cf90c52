#pragma once

#include <optional>
#include <string>
#include <vector>
#include <tripsift/search/filter_selector.h>
#include <tripsift/vector/candidate_store.h>

namespace tripsift::search {

/**
 * @brief Individual ranked fragment
 */
struct SearchResultItem {
    std::string id;
    std::string body;
    std::string source;
    vector::Attributes attributes;

    float baseSimilarity = 0.0f; // From the store distance
    float score = 0.0f;          // baseSimilarity after soft penalties, <= baseSimilarity
};

/**
 * @brief Response of a travel search
 */
struct SearchResponse {
    std::string query;
    std::vector<SearchResultItem> results; // Descending score
    size_t totalResults = 0;
    double processingTime = 0.0; // Seconds

    std::optional<HardFilter> hardFilter;
    std::string constraintSummary;
    size_t candidatesFetched = 0; // Raw store hits before thresholding
};

/**
 * @brief Free-text query with its constraints and result shaping options
 */
struct SearchQuery {
    std::string text;
    RawConstraints constraints;
    size_t limit = 10;
    float threshold = 0.1f; // Minimum final score, in [0, 1]
};

} // namespace tripsift::search
