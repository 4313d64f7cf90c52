#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <tripsift/common/text_utils.h>
#include <tripsift/search/soft_scorer.h>

namespace tripsift::search {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

constexpr float kFullMismatch = 1.0f;

size_t slot(ConstraintKind kind) {
    return static_cast<size_t>(kind);
}

const std::string* lookup(const vector::Attributes& candidate, ConstraintKind kind) {
    auto it = candidate.find(std::string(constraintName(kind)));
    if (it == candidate.end() || common::trimCopy(it->second).empty())
        return nullptr;
    return &it->second;
}

float categoricalFraction(ConstraintKind kind, const std::string& wanted,
                          const vector::Attributes& candidate) {
    const std::string* actual = lookup(candidate, kind);
    if (!actual)
        return kFullMismatch;
    return common::equalsNormalized(wanted, *actual) ? 0.0f : kFullMismatch;
}

float priceRule(ConstraintKind kind, double queryPrice, const vector::Attributes& candidate) {
    auto candidatePrice = penalty::candidatePrice(candidate, kind);
    if (!candidatePrice) {
        spdlog::trace("No usable candidate price for {}", constraintName(kind));
        return kFullMismatch;
    }
    if (queryPrice <= 0.0)
        return kFullMismatch;
    double relative = std::abs(queryPrice - *candidatePrice) / queryPrice;
    return penalty::priceFraction(relative);
}

} // namespace

float PenaltyWeights::getWeight(ConstraintKind kind) const {
    float weight = defaultWeight;
    if (auto it = weights.find(std::string(constraintName(kind))); it != weights.end()) {
        weight = it->second;
    }
    return std::clamp(weight, 0.0f, 1.0f);
}

namespace penalty {

float durationFraction(double absoluteDiff) {
    absoluteDiff = std::abs(absoluteDiff);
    if (absoluteDiff == 0.0)
        return 0.0f;
    if (absoluteDiff <= 1.0)
        return 0.2f;
    if (absoluteDiff <= 2.0)
        return 0.5f;
    return kFullMismatch;
}

float priceFraction(double relativeDiff) {
    relativeDiff = std::abs(relativeDiff);
    if (relativeDiff == 0.0)
        return 0.0f;
    if (relativeDiff <= 0.10)
        return 0.2f;
    if (relativeDiff <= 0.25)
        return 0.5f;
    return kFullMismatch;
}

float monthFraction(int distance) {
    distance = std::abs(distance);
    switch (distance) {
        case 0: return 0.0f;
        case 1: return 0.3f;
        case 2: return 0.6f;
        default: return kFullMismatch;
    }
}

std::optional<double> candidatePrice(const vector::Attributes& candidate,
                                     ConstraintKind preferred) {
    const ConstraintKind other = preferred == ConstraintKind::PriceMax
                                     ? ConstraintKind::PriceRange
                                     : ConstraintKind::PriceMax;
    for (auto kind : {preferred, other}) {
        const std::string* raw = lookup(candidate, kind);
        if (!raw)
            continue;
        if (auto band = parsePriceBand(*raw))
            return priceBandValue(*band);
        if (auto amount = common::parseNumber(*raw); amount && *amount >= 0.0)
            return *amount;
        // Present but unparsable: a full mismatch rather than a fallback
        spdlog::trace("Unparsable candidate {} '{}'", constraintName(kind), *raw);
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace penalty

float PenaltyRegistry::builtinFraction(const Constraint& constraint,
                                       const vector::Attributes& candidate) {
    return std::visit(
        overloaded{
            [&](const Destination& c) {
                return categoricalFraction(ConstraintKind::Destination, c.name, candidate);
            },
            [&](const Category& c) {
                return categoricalFraction(ConstraintKind::Category, c.value, candidate);
            },
            [&](const PriceRange& c) {
                return priceRule(ConstraintKind::PriceRange, priceBandValue(c.band), candidate);
            },
            [&](const PriceMax& c) {
                return priceRule(ConstraintKind::PriceMax, c.amount, candidate);
            },
            [&](const TravelMonth& c) {
                const std::string* raw = lookup(candidate, ConstraintKind::TravelMonth);
                if (!raw)
                    return kFullMismatch;
                auto month = parseMonth(*raw);
                if (!month) {
                    spdlog::trace("Unparsable candidate travel_month '{}'", *raw);
                    return kFullMismatch;
                }
                return penalty::monthFraction(c.month - *month);
            },
            [&](const Season& c) {
                return categoricalFraction(ConstraintKind::Season, c.value, candidate);
            },
            [&](const DurationDays& c) {
                const std::string* raw = lookup(candidate, ConstraintKind::DurationDays);
                if (!raw)
                    return kFullMismatch;
                auto days = common::parseNumber(*raw);
                if (!days) {
                    spdlog::trace("Unparsable candidate duration_days '{}'", *raw);
                    return kFullMismatch;
                }
                return penalty::durationFraction(static_cast<double>(c.days) - *days);
            },
            [&](const FamilyFriendly& c) {
                const std::string* raw = lookup(candidate, ConstraintKind::FamilyFriendly);
                if (!raw)
                    return kFullMismatch;
                auto flag = common::parseBool(*raw);
                if (!flag) {
                    spdlog::trace("Unparsable candidate family_friendly '{}'", *raw);
                    return kFullMismatch;
                }
                return *flag == c.value ? 0.0f : kFullMismatch;
            },
            [&](const TransportType& c) {
                return categoricalFraction(ConstraintKind::TransportType, c.value, candidate);
            },
            [&](const Amenities& c) {
                const std::string* raw = lookup(candidate, ConstraintKind::Amenities);
                if (!raw)
                    return kFullMismatch;
                auto offered = common::splitList(*raw);
                std::unordered_set<std::string> available(offered.begin(), offered.end());
                for (const auto& wanted : c.items) {
                    if (!available.count(common::toLowerCopy(common::trimCopy(wanted))))
                        return kFullMismatch;
                }
                return 0.0f;
            },
            [&](const Subcategory& c) {
                return categoricalFraction(ConstraintKind::Subcategory, c.value, candidate);
            }},
        constraint);
}

float PenaltyRegistry::fraction(const Constraint& constraint,
                                const vector::Attributes& candidate) const {
    const auto& rule = overrides_[slot(kindOf(constraint))];
    float value = rule ? rule(constraint, candidate) : builtinFraction(constraint, candidate);
    if (!std::isfinite(value))
        return kFullMismatch;
    return std::clamp(value, 0.0f, 1.0f);
}

void PenaltyRegistry::setRule(ConstraintKind kind, PenaltyRule rule) {
    overrides_[slot(kind)] = std::move(rule);
}

void PenaltyRegistry::resetRule(ConstraintKind kind) {
    overrides_[slot(kind)] = nullptr;
}

bool PenaltyRegistry::hasCustomRule(ConstraintKind kind) const {
    return static_cast<bool>(overrides_[slot(kind)]);
}

SoftScorer::SoftScorer(PenaltyWeights weights, PenaltyRegistry registry)
    : weights_(std::move(weights)), registry_(std::move(registry)) {}

float SoftScorer::score(float baseSimilarity, const vector::Attributes& candidate,
                        const ConstraintSet& constraints,
                        const std::optional<HardFilter>& hardFilter) const {
    float multiplier = 1.0f;
    for (const auto& constraint : constraints.items()) {
        const auto kind = kindOf(constraint);
        if (hardFilter && hardFilter->kind == kind)
            continue;

        float fraction = registry_.fraction(constraint, candidate);
        if (fraction == 0.0f)
            continue;
        multiplier *= 1.0f - weights_.getWeight(kind) * fraction;
    }
    return std::max(0.0f, baseSimilarity * multiplier);
}

ScoreExplanation SoftScorer::explain(float baseSimilarity, const vector::Attributes& candidate,
                                     const ConstraintSet& constraints,
                                     const std::optional<HardFilter>& hardFilter) const {
    ScoreExplanation explanation;
    explanation.baseSimilarity = baseSimilarity;

    float multiplier = 1.0f;
    for (const auto& constraint : constraints.items()) {
        const auto kind = kindOf(constraint);
        if (hardFilter && hardFilter->kind == kind)
            continue;

        PenaltyBreakdown entry;
        entry.kind = kind;
        entry.weight = weights_.getWeight(kind);
        entry.fraction = registry_.fraction(constraint, candidate);
        entry.penalty = entry.weight * entry.fraction;
        multiplier *= 1.0f - entry.penalty;
        explanation.penalties.push_back(entry);
    }
    explanation.score = std::max(0.0f, baseSimilarity * multiplier);
    return explanation;
}

} // namespace tripsift::search
