#pragma once

#include <vector>
#include <tripsift/core/types.h>
#include <tripsift/search/search_results.h>

namespace tripsift::search {

/**
 * @brief Threshold, order and truncate scored candidates
 *
 * Pairs candidates[i] with scores[i], drops pairs scoring below @p threshold,
 * sorts by score descending (stable, so ties keep the store's order) and keeps
 * at most @p limit entries. No survivors yield an empty list, not an error.
 *
 * @return InvalidArgument when candidates and scores differ in length
 */
Result<std::vector<SearchResultItem>> assembleResults(std::vector<SearchResultItem> candidates,
                                                      const std::vector<float>& scores,
                                                      float threshold, size_t limit);

} // namespace tripsift::search
