#pragma once

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <tripsift/core/types.h>

namespace tripsift::vector {

/// Structured attributes attached to a fragment, in stored (string) form
using Attributes = std::map<std::string, std::string>;

/**
 * Document fragment as written to a candidate store
 */
struct CandidateRecord {
    std::string id;         // Unique fragment id
    std::string body;       // Fragment text (mandatory)
    std::string source;     // Source document identifier (e.g. file name)
    Attributes attributes;  // destination, price_range, travel_month, ...
    Embedding embedding;    // Document vector

    CandidateRecord() = default;
    CandidateRecord(std::string id, std::string body, std::string source, Attributes attributes,
                    Embedding embedding)
        : id(std::move(id)), body(std::move(body)), source(std::move(source)),
          attributes(std::move(attributes)), embedding(std::move(embedding)) {}
};

/**
 * Single equality predicate pushed down to the store
 */
struct EqualityFilter {
    std::string field;
    std::string value;
};

/**
 * Nearest-neighbor hit returned by a store query
 */
struct StoreHit {
    std::string id;
    std::string body;
    std::string source;
    Attributes attributes;
    float distance = 0.0f; // Smaller is closer
};

struct StoreStats {
    size_t total_fragments = 0;
    size_t embedding_dim = 0;
    std::vector<std::string> categories;   // Distinct category values, sorted
    std::vector<std::string> destinations; // Distinct destination values, sorted
    std::vector<std::string> sources;      // Distinct source identifiers, sorted
};

/**
 * @brief Abstract interface for candidate stores
 *
 * A candidate store is an (approximate) nearest-neighbor index over fragment
 * vectors that can apply at most one equality pre-filter per query.
 */
class ICandidateStore {
public:
    virtual ~ICandidateStore() = default;

    /**
     * @brief k-nearest-neighbor query
     *
     * @param query_embedding The query vector
     * @param k Maximum number of hits
     * @param filter Optional equality filter on one attribute
     * @return Hits ordered by ascending distance
     */
    virtual Result<std::vector<StoreHit>>
    query(const Embedding& query_embedding, size_t k,
          const std::optional<EqualityFilter>& filter = std::nullopt) = 0;

    /**
     * @brief Insert or replace fragments (matched by id)
     */
    virtual Result<void> addDocuments(const std::vector<CandidateRecord>& records) = 0;

    /**
     * @brief Delete every fragment of a source document
     * @return Number of fragments removed
     */
    virtual Result<size_t> deleteBySource(const std::string& source) = 0;

    virtual Result<void> clear() = 0;

    virtual Result<size_t> count() const = 0;

    virtual Result<StoreStats> getStats() const = 0;

    virtual std::string getBackendName() const = 0;
};

/**
 * @brief Exact-scan store kept in memory
 *
 * Reference backend and test double: distances are squared L2 over every
 * stored vector. Attribute values are normalized on insert so that equality
 * filters built from normalized constraint values match.
 */
class InMemoryCandidateStore : public ICandidateStore {
public:
    InMemoryCandidateStore() = default;

    Result<std::vector<StoreHit>>
    query(const Embedding& query_embedding, size_t k,
          const std::optional<EqualityFilter>& filter = std::nullopt) override;

    Result<void> addDocuments(const std::vector<CandidateRecord>& records) override;
    Result<size_t> deleteBySource(const std::string& source) override;
    Result<void> clear() override;
    Result<size_t> count() const override;
    Result<StoreStats> getStats() const override;
    std::string getBackendName() const override { return "in-memory"; }

private:
    mutable std::shared_mutex mutex_;
    std::vector<CandidateRecord> records_;
    size_t dimension_ = 0;
};

enum class CandidateStoreType {
    InMemory // Exact scan, in process (testing and fixtures)
};

std::unique_ptr<ICandidateStore>
createCandidateStore(CandidateStoreType type = CandidateStoreType::InMemory);

/**
 * Utility functions for store results
 */
namespace utils {
/**
 * Convert a store distance to a similarity score in (0, 1]: 1 / (1 + distance)
 */
float distanceToSimilarity(float distance);

/**
 * Squared euclidean distance; vectors must have equal size
 */
float squaredL2Distance(const Embedding& a, const Embedding& b);

/**
 * Normalize vocabulary attribute values the way constraint values are normalized
 * (destination title-cased, travel_month as a month name, other vocabulary
 * attributes lower-cased, all trimmed)
 */
Attributes normalizeAttributes(const Attributes& attributes);
} // namespace utils

} // namespace tripsift::vector
