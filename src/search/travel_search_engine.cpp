#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <chrono>
#include <exception>
#include <limits>
#include <thread>
#include <tripsift/search/filter_selector.h>
#include <tripsift/search/result_assembler.h>
#include <tripsift/search/travel_search_engine.h>

namespace tripsift::search {

TravelSearchEngine::TravelSearchEngine(ml::IEmbeddingProvider& embedder,
                                       vector::ICandidateStore& store, SearchEngineConfig config)
    : embedder_(embedder), store_(store), config_(std::move(config)), scorer_(config_.weights) {}

Result<SearchResponse> TravelSearchEngine::search(const std::string& text,
                                                  const RawConstraints& constraints) const {
    SearchQuery query;
    query.text = text;
    query.constraints = constraints;
    query.limit = config_.defaultLimit;
    query.threshold = config_.defaultThreshold;
    return search(query);
}

Result<SearchResponse> TravelSearchEngine::search(const SearchQuery& query) const {
    const auto start = std::chrono::steady_clock::now();
    auto elapsedSeconds = [&start]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    if (query.limit == 0) {
        return Error{ErrorCode::InvalidArgument, "Result limit must be positive"};
    }
    if (!(query.threshold >= 0.0f && query.threshold <= 1.0f)) {
        return Error{ErrorCode::InvalidArgument, "Similarity threshold must be within [0, 1]"};
    }

    auto parsed = ConstraintSet::fromMap(query.constraints);
    if (!parsed) {
        return parsed.error();
    }
    const ConstraintSet constraints = std::move(parsed).value();

    auto embedding = embedder_.generateEmbedding(query.text);
    if (!embedding) {
        spdlog::error("Query embedding failed ({}, {}): {}", embedder_.getProviderName(),
                      embedding.error().code, embedding.error().message);
        return Error{ErrorCode::EmbeddingFailed, embedding.error().message};
    }

    SearchResponse response;
    response.query = query.text;
    response.hardFilter = selectHardFilter(constraints);
    response.constraintSummary = constraints.summary();

    const size_t factor = std::max<size_t>(1, config_.overfetchFactor);
    const size_t k = query.limit > std::numeric_limits<size_t>::max() / factor
                         ? std::numeric_limits<size_t>::max()
                         : query.limit * factor;
    auto hits = fetchCandidates(embedding.value(), k, response.hardFilter);
    response.candidatesFetched = hits.size();

    std::vector<SearchResultItem> candidates;
    std::vector<float> scores;
    candidates.reserve(hits.size());
    scores.reserve(hits.size());
    for (auto& hit : hits) {
        SearchResultItem item;
        item.id = std::move(hit.id);
        item.body = std::move(hit.body);
        item.source = std::move(hit.source);
        item.attributes = std::move(hit.attributes);
        item.baseSimilarity =
            std::clamp(vector::utils::distanceToSimilarity(hit.distance), 0.0f, 1.0f);

        float score =
            scorer_.score(item.baseSimilarity, item.attributes, constraints, response.hardFilter);
        if (spdlog::should_log(spdlog::level::trace)) {
            auto explanation =
                scorer_.explain(item.baseSimilarity, item.attributes, constraints,
                                response.hardFilter);
            for (const auto& p : explanation.penalties) {
                spdlog::trace("  {} {}: weight={:.2f} fraction={:.2f}", item.id,
                              constraintName(p.kind), p.weight, p.fraction);
            }
        }
        scores.push_back(score);
        candidates.push_back(std::move(item));
    }

    auto assembled = assembleResults(std::move(candidates), scores, query.threshold, query.limit);
    if (!assembled) {
        return assembled.error();
    }
    response.results = std::move(assembled).value();
    response.totalResults = response.results.size();
    response.processingTime = elapsedSeconds();

    spdlog::debug("Search '{}' [{}]: {} candidates, {} results in {:.3f}s", query.text,
                  response.constraintSummary, response.candidatesFetched, response.totalResults,
                  response.processingTime);
    return response;
}

ScoreExplanation TravelSearchEngine::explain(const SearchResultItem& item,
                                             const ConstraintSet& constraints,
                                             const std::optional<HardFilter>& hardFilter) const {
    return scorer_.explain(item.baseSimilarity, item.attributes, constraints, hardFilter);
}

std::vector<vector::StoreHit>
TravelSearchEngine::fetchCandidates(const Embedding& queryEmbedding, size_t k,
                                    const std::optional<HardFilter>& filter) const {
    std::optional<vector::EqualityFilter> storeFilter;
    if (filter) {
        storeFilter = vector::EqualityFilter{std::string(filter->name()), filter->value};
    }

    try {
        auto hits = store_.query(queryEmbedding, k, storeFilter);
        if (!hits) {
            spdlog::warn("Candidate store '{}' query failed: {}; returning no candidates",
                         store_.getBackendName(), hits.error().message);
            return {};
        }
        return std::move(hits).value();
    } catch (const std::exception& e) {
        spdlog::warn("Candidate store '{}' threw: {}; returning no candidates",
                     store_.getBackendName(), e.what());
        return {};
    }
}

// ============================================================================
// SearchDispatcher
// ============================================================================

SearchDispatcher::SearchDispatcher(const TravelSearchEngine& engine, size_t threads)
    : engine_(engine), threads_(threads) {
    if (threads_ == 0) {
        threads_ = engine_.getConfig().workerThreads;
    }
    if (threads_ == 0) {
        threads_ = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    pool_ = std::make_unique<boost::asio::thread_pool>(threads_);
    spdlog::debug("SearchDispatcher started with {} workers", threads_);
}

SearchDispatcher::~SearchDispatcher() {
    shutdown();
}

std::future<Result<SearchResponse>> SearchDispatcher::submit(SearchQuery query) {
    auto promise = std::make_shared<std::promise<Result<SearchResponse>>>();
    auto future = promise->get_future();

    if (!pool_) {
        promise->set_value(Error{ErrorCode::InvalidState, "SearchDispatcher is shut down"});
        return future;
    }

    boost::asio::post(*pool_, [this, promise, q = std::move(query)]() {
        try {
            promise->set_value(engine_.search(q));
        } catch (const std::exception& e) {
            promise->set_value(Error{ErrorCode::InternalError, e.what()});
        }
    });
    return future;
}

void SearchDispatcher::shutdown() {
    if (!pool_) {
        return;
    }
    pool_->join();
    pool_.reset();
}

} // namespace tripsift::search
