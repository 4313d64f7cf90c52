#pragma once

#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <future>
#include <memory>
#include <string>
#include <tripsift/core/types.h>
#include <tripsift/ml/provider.h>
#include <tripsift/search/search_results.h>
#include <tripsift/search/soft_scorer.h>
#include <tripsift/vector/candidate_store.h>

namespace tripsift::search {

/**
 * @brief Configuration for the travel search engine
 */
struct SearchEngineConfig {
    // Raw candidates requested from the store per result slot (k = limit * factor)
    size_t overfetchFactor = 3;

    size_t defaultLimit = 10;
    float defaultThreshold = 0.1f;

    // SearchDispatcher worker count; 0 = hardware concurrency
    size_t workerThreads = 0;

    PenaltyWeights weights;
};

/**
 * @brief Retrieval ranking and soft-filtering engine
 *
 * Embeds the query, pushes one constraint down to the candidate store as an
 * equality filter, soft-scores every other constraint and returns the ranked
 * fragments. Collaborators are borrowed and must outlive the engine.
 *
 * search() is const and keeps no per-request state, so concurrent calls are
 * safe as long as the collaborators are.
 */
class TravelSearchEngine {
public:
    TravelSearchEngine(ml::IEmbeddingProvider& embedder, vector::ICandidateStore& store,
                       SearchEngineConfig config = {});

    /**
     * @brief Run a search
     *
     * Embedding failures are returned as ErrorCode::EmbeddingFailed. Candidate
     * store failures are logged and produce an empty response.
     */
    Result<SearchResponse> search(const SearchQuery& query) const;

    /**
     * @brief Convenience overload using the configured default limit and threshold
     */
    Result<SearchResponse> search(const std::string& text, const RawConstraints& constraints) const;

    /**
     * @brief Per-constraint penalty breakdown of a stored hit, for debugging
     */
    ScoreExplanation explain(const SearchResultItem& item, const ConstraintSet& constraints,
                             const std::optional<HardFilter>& hardFilter) const;

    const SearchEngineConfig& getConfig() const { return config_; }
    const SoftScorer& getScorer() const { return scorer_; }
    SoftScorer& getScorer() { return scorer_; }

private:
    std::vector<vector::StoreHit> fetchCandidates(const Embedding& queryEmbedding, size_t k,
                                                  const std::optional<HardFilter>& filter) const;

    ml::IEmbeddingProvider& embedder_;
    vector::ICandidateStore& store_;
    SearchEngineConfig config_;
    SoftScorer scorer_;
};

/**
 * @brief Runs searches on a worker pool so a request loop never blocks on the
 * embedding provider or the candidate store
 */
class SearchDispatcher {
public:
    /**
     * @param threads Worker count; 0 takes SearchEngineConfig::workerThreads, and
     *                hardware concurrency when that is 0 as well
     */
    explicit SearchDispatcher(const TravelSearchEngine& engine, size_t threads = 0);
    ~SearchDispatcher();

    SearchDispatcher(const SearchDispatcher&) = delete;
    SearchDispatcher& operator=(const SearchDispatcher&) = delete;

    std::future<Result<SearchResponse>> submit(SearchQuery query);

    /**
     * @brief Wait for queued searches and stop the workers
     */
    void shutdown();

    size_t getThreadCount() const { return threads_; }

private:
    const TravelSearchEngine& engine_;
    size_t threads_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

} // namespace tripsift::search
