#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <set>
#include <tripsift/common/text_utils.h>
#include <tripsift/search/travel_constraints.h>
#include <tripsift/vector/candidate_store.h>

namespace tripsift::vector {

namespace utils {

float distanceToSimilarity(float distance) {
    if (distance < 0.0f)
        distance = 0.0f;
    return 1.0f / (1.0f + distance);
}

float squaredL2Distance(const Embedding& a, const Embedding& b) {
    float sum = 0.0f;
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        float d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

Attributes normalizeAttributes(const Attributes& attributes) {
    Attributes normalized;
    for (const auto& [key, value] : attributes) {
        auto kind = search::constraintKindFromName(key);
        if (!kind) {
            normalized.emplace(key, value);
            continue;
        }
        auto trimmed = common::trimCopy(value);
        auto name = std::string(search::constraintName(*kind));
        if (*kind == search::ConstraintKind::Destination) {
            normalized[name] = common::toTitleCase(trimmed);
        } else if (*kind == search::ConstraintKind::TravelMonth && search::parseMonth(trimmed)) {
            normalized[name] = std::string(search::monthName(*search::parseMonth(trimmed)));
        } else {
            normalized[name] = common::toLowerCopy(trimmed);
        }
    }
    return normalized;
}

} // namespace utils

Result<std::vector<StoreHit>>
InMemoryCandidateStore::query(const Embedding& query_embedding, size_t k,
                              const std::optional<EqualityFilter>& filter) {
    if (query_embedding.empty()) {
        return Error{ErrorCode::InvalidArgument, "Query embedding is empty"};
    }

    std::shared_lock lock(mutex_);
    if (dimension_ != 0 && query_embedding.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument,
                     "Query embedding dimension " + std::to_string(query_embedding.size()) +
                         " does not match store dimension " + std::to_string(dimension_)};
    }
    if (k == 0 || records_.empty()) {
        return std::vector<StoreHit>{};
    }

    std::vector<std::pair<float, size_t>> scored;
    scored.reserve(records_.size());
    for (size_t i = 0; i < records_.size(); ++i) {
        const auto& record = records_[i];
        if (filter) {
            auto it = record.attributes.find(filter->field);
            if (it == record.attributes.end() || it->second != filter->value)
                continue;
        }
        scored.emplace_back(utils::squaredL2Distance(query_embedding, record.embedding), i);
    }

    const size_t take = std::min(k, scored.size());
    // Pairs compare by distance, then insertion order
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(take),
                      scored.end());

    std::vector<StoreHit> hits;
    hits.reserve(take);
    for (size_t i = 0; i < take; ++i) {
        const auto& record = records_[scored[i].second];
        StoreHit hit;
        hit.id = record.id;
        hit.body = record.body;
        hit.source = record.source;
        hit.attributes = record.attributes;
        hit.distance = scored[i].first;
        hits.push_back(std::move(hit));
    }

    spdlog::trace("InMemoryCandidateStore: {} of {} records matched filter, returning {}",
                  scored.size(), records_.size(), hits.size());
    return hits;
}

Result<void> InMemoryCandidateStore::addDocuments(const std::vector<CandidateRecord>& records) {
    std::unique_lock lock(mutex_);

    // Validate the whole batch before touching the store
    size_t dimension = dimension_;
    for (const auto& record : records) {
        if (record.id.empty()) {
            return Error{ErrorCode::InvalidData, "Fragment id must not be empty"};
        }
        if (record.body.empty()) {
            return Error{ErrorCode::InvalidData, "Fragment '" + record.id + "' has no text"};
        }
        if (record.embedding.empty()) {
            return Error{ErrorCode::InvalidData, "Fragment '" + record.id + "' has no embedding"};
        }
        if (dimension == 0) {
            dimension = record.embedding.size();
        } else if (record.embedding.size() != dimension) {
            return Error{ErrorCode::InvalidArgument,
                         "Fragment '" + record.id + "' has embedding dimension " +
                             std::to_string(record.embedding.size()) + ", expected " +
                             std::to_string(dimension)};
        }
    }

    for (const auto& record : records) {
        CandidateRecord stored = record;
        stored.attributes = utils::normalizeAttributes(record.attributes);

        auto it = std::find_if(records_.begin(), records_.end(),
                               [&](const CandidateRecord& r) { return r.id == record.id; });
        if (it != records_.end()) {
            *it = std::move(stored);
        } else {
            records_.push_back(std::move(stored));
        }
    }
    dimension_ = dimension;

    spdlog::debug("InMemoryCandidateStore: stored {} fragments (total {})", records.size(),
                  records_.size());
    return Result<void>();
}

Result<size_t> InMemoryCandidateStore::deleteBySource(const std::string& source) {
    std::unique_lock lock(mutex_);
    const size_t before = records_.size();
    records_.erase(std::remove_if(records_.begin(), records_.end(),
                                  [&](const CandidateRecord& r) { return r.source == source; }),
                   records_.end());
    const size_t removed = before - records_.size();
    if (records_.empty())
        dimension_ = 0;
    spdlog::debug("InMemoryCandidateStore: removed {} fragments of '{}'", removed, source);
    return removed;
}

Result<void> InMemoryCandidateStore::clear() {
    std::unique_lock lock(mutex_);
    records_.clear();
    dimension_ = 0;
    return Result<void>();
}

Result<size_t> InMemoryCandidateStore::count() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

Result<StoreStats> InMemoryCandidateStore::getStats() const {
    std::shared_lock lock(mutex_);

    std::set<std::string> categories;
    std::set<std::string> destinations;
    std::set<std::string> sources;
    for (const auto& record : records_) {
        if (auto it = record.attributes.find("category"); it != record.attributes.end())
            categories.insert(it->second);
        if (auto it = record.attributes.find("destination"); it != record.attributes.end())
            destinations.insert(it->second);
        if (!record.source.empty())
            sources.insert(record.source);
    }

    StoreStats stats;
    stats.total_fragments = records_.size();
    stats.embedding_dim = dimension_;
    stats.categories.assign(categories.begin(), categories.end());
    stats.destinations.assign(destinations.begin(), destinations.end());
    stats.sources.assign(sources.begin(), sources.end());
    return stats;
}

std::unique_ptr<ICandidateStore> createCandidateStore(CandidateStoreType type) {
    switch (type) {
        case CandidateStoreType::InMemory:
            return std::make_unique<InMemoryCandidateStore>();
    }
    return nullptr;
}

} // namespace tripsift::vector
