#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <tripsift/common/text_utils.h>
#include <tripsift/config/config_helpers.h>
#include <tripsift/config/search_config.h>
#include <tripsift/ml/provider.h>
#include <tripsift/search/search_json.h>
#include <tripsift/search/travel_search_engine.h>
#include <tripsift/vector/candidate_store.h>

using json = nlohmann::json;
using namespace tripsift;

namespace {

std::optional<spdlog::level::level_enum> parseLevel(std::string v) {
    v = common::toLowerCopy(common::trimCopy(v));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

// Order: --log-level > TRIPSIFT_LOG_LEVEL > [logging] level > warn
void applyLogLevel(const std::string& cliLevel, const std::filesystem::path& configPath) {
    std::string requested = cliLevel;
    if (requested.empty()) {
        if (const char* env = std::getenv("TRIPSIFT_LOG_LEVEL"); env && *env) {
            requested = env;
        } else {
            requested = config::loadLogLevel(configPath);
        }
    }
    if (requested.empty()) {
        spdlog::set_level(spdlog::level::warn);
        return;
    }
    if (auto lvl = parseLevel(requested)) {
        spdlog::set_level(*lvl);
    } else {
        spdlog::set_level(spdlog::level::warn);
        spdlog::warn("Unknown log level '{}', using warn", requested);
    }
}

Result<search::RawConstraints> parseConstraintArgs(const std::vector<std::string>& args) {
    search::RawConstraints raw;
    for (const auto& arg : args) {
        auto eq = arg.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Constraint '{}' must have the form name=value", arg)};
        }
        raw[common::toLowerCopy(common::trimCopy(arg.substr(0, eq)))] =
            common::trimCopy(arg.substr(eq + 1));
    }
    return raw;
}

/**
 * Load a corpus file, embed every fragment with the mock provider and index it
 */
Result<void> indexCorpus(const std::string& corpusPath, ml::IEmbeddingProvider& embedder,
                         vector::ICandidateStore& store) {
    auto records = search::loadCorpusFile(corpusPath);
    if (!records) {
        return records.error();
    }
    auto docs = std::move(records).value();

    std::vector<std::string> texts;
    texts.reserve(docs.size());
    for (const auto& d : docs) {
        texts.push_back(d.body);
    }
    auto embeddings = embedder.generateBatchEmbeddings(texts);
    if (!embeddings) {
        return Error{ErrorCode::EmbeddingFailed, embeddings.error().message};
    }
    auto vectors = std::move(embeddings).value();
    for (size_t i = 0; i < docs.size(); ++i) {
        docs[i].embedding = std::move(vectors[i]);
    }
    return store.addDocuments(docs);
}

std::string attributeOr(const vector::Attributes& attrs, const std::string& key,
                        const std::string& fallback) {
    auto it = attrs.find(key);
    return it == attrs.end() || it->second.empty() ? fallback : it->second;
}

void printResponse(const search::SearchResponse& response) {
    std::cout << fmt::format("Query: {}\n", response.query);
    std::cout << fmt::format("Constraints: {}\n", response.constraintSummary);
    if (response.hardFilter) {
        std::cout << fmt::format("Hard filter: {}={}\n", response.hardFilter->name(),
                                 response.hardFilter->value);
    } else {
        std::cout << "Hard filter: none\n";
    }
    std::cout << fmt::format("{} result(s) from {} candidate(s) in {:.3f}s\n\n",
                             response.totalResults, response.candidatesFetched,
                             response.processingTime);
    for (size_t i = 0; i < response.results.size(); ++i) {
        const auto& r = response.results[i];
        std::cout << fmt::format("{:>3}. {:.4f} (base {:.4f})  {}  [{}]\n", i + 1, r.score,
                                 r.baseSimilarity, r.id,
                                 attributeOr(r.attributes, "destination", "-"));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"Travel retrieval ranking and soft filtering", "tripsift"};
        app.require_subcommand(1);

        std::string corpusPath;
        std::string configOverride;
        std::string logLevel;
        size_t dimension = 384;

        // search
        auto* searchCmd = app.add_subcommand("search", "Rank corpus fragments for a query");
        std::string queryText;
        std::vector<std::string> constraintArgs;
        std::optional<size_t> limit;
        std::optional<float> threshold;
        bool jsonOutput = false;
        bool explain = false;
        searchCmd->add_option("--corpus", corpusPath, "Corpus JSON file")
            ->required()
            ->check(CLI::ExistingFile);
        searchCmd->add_option("-q,--query", queryText, "Free text query")->required();
        searchCmd->add_option("-c,--constraint", constraintArgs,
                              "Constraint as name=value (repeatable)");
        searchCmd->add_option("-l,--limit", limit, "Maximum results");
        searchCmd->add_option("-t,--threshold", threshold, "Minimum final score in [0, 1]");
        searchCmd->add_option("--config", configOverride, "Config file");
        searchCmd->add_flag("--json", jsonOutput, "Output in JSON format");
        searchCmd->add_flag("--explain", explain, "Show the penalty breakdown of each result");
        searchCmd->add_option("--dim", dimension, "Mock embedding dimension")
            ->check(CLI::PositiveNumber);
        searchCmd->add_option("--log-level", logLevel, "trace|debug|info|warn|error|off");

        // stats
        auto* statsCmd = app.add_subcommand("stats", "Show corpus statistics");
        bool statsJson = false;
        statsCmd->add_option("--corpus", corpusPath, "Corpus JSON file")
            ->required()
            ->check(CLI::ExistingFile);
        statsCmd->add_option("--dim", dimension, "Mock embedding dimension")
            ->check(CLI::PositiveNumber);
        statsCmd->add_flag("--json", statsJson, "Output in JSON format");
        statsCmd->add_option("--log-level", logLevel, "trace|debug|info|warn|error|off");

        CLI11_PARSE(app, argc, argv);

        const auto configPath = config::get_config_path(configOverride);
        applyLogLevel(logLevel, configPath);

        ml::MockEmbeddingProvider embedder(dimension);
        if (auto init = embedder.initialize(); !init) {
            spdlog::error("Embedding provider init failed: {}", init.error().message);
            return 1;
        }
        auto store = vector::createCandidateStore(vector::CandidateStoreType::InMemory);

        if (auto indexed = indexCorpus(corpusPath, embedder, *store); !indexed) {
            std::cerr << fmt::format("Error: {}\n", indexed.error().message);
            return 1;
        }

        if (*statsCmd) {
            auto stats = store->getStats();
            if (!stats) {
                std::cerr << fmt::format("Error: {}\n", stats.error().message);
                return 1;
            }
            const auto& s = stats.value();
            if (statsJson) {
                json out;
                out["total_fragments"] = s.total_fragments;
                out["embedding_dim"] = s.embedding_dim;
                out["categories"] = s.categories;
                out["destinations"] = s.destinations;
                out["sources"] = s.sources;
                std::cout << out.dump(2) << std::endl;
            } else {
                std::cout << "Corpus Statistics\n";
                std::cout << "=================\n";
                std::cout << fmt::format("Fragments:     {}\n", s.total_fragments);
                std::cout << fmt::format("Dimension:     {}\n", s.embedding_dim);
                std::cout << fmt::format("Destinations:  {}\n", fmt::join(s.destinations, ", "));
                std::cout << fmt::format("Categories:    {}\n", fmt::join(s.categories, ", "));
                std::cout << fmt::format("Sources:       {}\n", s.sources.size());
            }
            return 0;
        }

        auto raw = parseConstraintArgs(constraintArgs);
        if (!raw) {
            std::cerr << fmt::format("Error: {}\n", raw.error().message);
            return 1;
        }

        auto engineConfig = config::loadSearchEngineConfig(configPath);
        search::TravelSearchEngine engine(embedder, *store, engineConfig);

        search::SearchQuery query;
        query.text = queryText;
        query.constraints = raw.value();
        query.limit = limit.value_or(engineConfig.defaultLimit);
        query.threshold = threshold.value_or(engineConfig.defaultThreshold);

        auto response = engine.search(query);
        if (!response) {
            std::cerr << fmt::format("Error: {}\n", response.error().message);
            return 1;
        }
        const auto& resp = response.value();

        std::optional<search::ConstraintSet> constraints;
        if (explain) {
            // Already validated by the engine
            constraints = search::ConstraintSet::fromMap(query.constraints).value();
        }

        if (jsonOutput) {
            auto out = search::toJson(resp);
            if (constraints) {
                for (size_t i = 0; i < resp.results.size(); ++i) {
                    out["results"][i]["explanation"] = search::toJson(
                        engine.explain(resp.results[i], *constraints, resp.hardFilter));
                }
            }
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        printResponse(resp);
        if (constraints) {
            for (const auto& r : resp.results) {
                auto ex = engine.explain(r, *constraints, resp.hardFilter);
                std::cout << fmt::format("\n{}:\n", r.id);
                if (ex.penalties.empty()) {
                    std::cout << "  no soft constraints\n";
                }
                for (const auto& p : ex.penalties) {
                    std::cout << fmt::format("  {:<16} weight {:.2f} x fraction {:.2f} = {:.3f}\n",
                                             search::constraintName(p.kind), p.weight, p.fraction,
                                             p.penalty);
                }
            }
        }
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
