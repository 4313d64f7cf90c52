#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fstream>
#include <tripsift/search/search_json.h>

namespace tripsift::search {

namespace {

std::optional<std::string> scalarToString(const json& value) {
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_boolean())
        return value.get<bool>() ? std::string("true") : std::string("false");
    if (value.is_number_unsigned())
        return std::to_string(value.get<uint64_t>());
    if (value.is_number_integer())
        return std::to_string(value.get<int64_t>());
    if (value.is_number_float())
        return fmt::format("{}", value.get<double>());
    return std::nullopt;
}

} // namespace

json toJson(const SearchResultItem& item) {
    json j;
    j["id"] = item.id;
    j["text"] = item.body;
    j["source"] = item.source;
    j["metadata"] = item.attributes;
    j["score"] = item.score;
    j["base_similarity"] = item.baseSimilarity;
    return j;
}

json toJson(const SearchResponse& response) {
    json results = json::array();
    for (const auto& item : response.results) {
        results.push_back(toJson(item));
    }

    json j;
    j["query"] = response.query;
    j["results"] = std::move(results);
    j["total_results"] = response.totalResults;
    j["processing_time"] = response.processingTime;
    if (response.hardFilter) {
        j["hard_filter"] = {{"field", std::string(response.hardFilter->name())},
                            {"value", response.hardFilter->value}};
    } else {
        j["hard_filter"] = nullptr;
    }
    j["constraints"] = response.constraintSummary;
    return j;
}

json toJson(const ScoreExplanation& explanation) {
    json penalties = json::array();
    for (const auto& p : explanation.penalties) {
        penalties.push_back(json{{"constraint", std::string(constraintName(p.kind))},
                                 {"weight", p.weight},
                                 {"fraction", p.fraction},
                                 {"penalty", p.penalty}});
    }
    return {{"base_similarity", explanation.baseSimilarity},
            {"score", explanation.score},
            {"penalties", std::move(penalties)}};
}

Result<std::vector<vector::CandidateRecord>> parseCorpus(const json& doc) {
    if (!doc.is_array()) {
        return Error{ErrorCode::InvalidData, "Corpus must be a JSON array of fragments"};
    }

    std::vector<vector::CandidateRecord> records;
    records.reserve(doc.size());
    for (size_t i = 0; i < doc.size(); ++i) {
        const auto& entry = doc[i];
        if (!entry.is_object()) {
            return Error{ErrorCode::InvalidData, fmt::format("Corpus entry {} is not an object", i)};
        }

        vector::CandidateRecord record;
        record.id = entry.value("id", std::string{});
        record.body = entry.value("text", std::string{});
        record.source = entry.value("source", std::string{});
        if (record.id.empty()) {
            record.id = fmt::format("fragment-{}", i);
        }
        if (record.body.empty()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Corpus entry '{}' has no text", record.id)};
        }

        if (auto it = entry.find("metadata"); it != entry.end() && !it->is_null()) {
            if (!it->is_object()) {
                return Error{ErrorCode::InvalidData,
                             fmt::format("Metadata of '{}' must be an object", record.id)};
            }
            for (const auto& [key, value] : it->items()) {
                if (value.is_null())
                    continue;
                if (value.is_array()) {
                    // Amenity lists are stored comma separated
                    std::string joined;
                    for (const auto& element : value) {
                        if (auto s = scalarToString(element)) {
                            if (!joined.empty())
                                joined += ",";
                            joined += *s;
                        }
                    }
                    record.attributes[key] = std::move(joined);
                    continue;
                }
                auto s = scalarToString(value);
                if (!s) {
                    spdlog::debug("Skipping metadata '{}' of '{}': unsupported type", key,
                                  record.id);
                    continue;
                }
                record.attributes[key] = std::move(*s);
            }
        }
        records.push_back(std::move(record));
    }
    return records;
}

Result<std::vector<vector::CandidateRecord>> loadCorpusFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open corpus file: " + path.string()};
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Corpus {} is not valid JSON: {}", path.string(), e.what())};
    }

    auto records = parseCorpus(doc);
    if (records) {
        spdlog::debug("Loaded {} fragments from {}", records.value().size(), path.string());
    }
    return records;
}

} // namespace tripsift::search
