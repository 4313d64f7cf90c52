#include <algorithm>
#include <string>
#include <tripsift/search/result_assembler.h>

namespace tripsift::search {

Result<std::vector<SearchResultItem>> assembleResults(std::vector<SearchResultItem> candidates,
                                                      const std::vector<float>& scores,
                                                      float threshold, size_t limit) {
    if (candidates.size() != scores.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "Got " + std::to_string(scores.size()) + " scores for " +
                         std::to_string(candidates.size()) + " candidates"};
    }

    std::vector<SearchResultItem> kept;
    kept.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (scores[i] < threshold)
            continue;
        candidates[i].score = scores[i];
        kept.push_back(std::move(candidates[i]));
    }

    std::stable_sort(kept.begin(), kept.end(),
                     [](const SearchResultItem& a, const SearchResultItem& b) {
                         return a.score > b.score;
                     });

    if (kept.size() > limit) {
        kept.resize(limit);
    }
    return kept;
}

} // namespace tripsift::search
