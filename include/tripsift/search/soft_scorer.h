#pragma once

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <tripsift/search/filter_selector.h>
#include <tripsift/search/travel_constraints.h>
#include <tripsift/vector/candidate_store.h>

namespace tripsift::search {

/**
 * @brief Maximum fractional score loss per constraint when fully mismatched
 */
struct PenaltyWeights {
    std::unordered_map<std::string, float> weights = {
        {"price_range", 0.9f}, {"travel_month", 0.8f},    {"duration_days", 0.6f},
        {"category", 0.5f},    {"family_friendly", 0.3f}, {"transport_type", 0.2f}};

    // Used for every constraint not listed above
    float defaultWeight = 0.1f;

    /**
     * @brief Weight for a constraint, clamped to [0, 1]
     */
    float getWeight(ConstraintKind kind) const;

    void setWeight(ConstraintKind kind, float weight) {
        weights[std::string(constraintName(kind))] = weight;
    }
};

/**
 * Penalty rule: fraction of the field weight to apply, in [0, 1].
 * 0 means the candidate satisfies the constraint, 1 a full mismatch.
 */
using PenaltyRule =
    std::function<float(const Constraint& constraint, const vector::Attributes& candidate)>;

/**
 * Near-miss curves shared by the built-in rules
 */
namespace penalty {
/// |diff| 0 -> 0, <= 1 -> 0.2, <= 2 -> 0.5, otherwise 1
float durationFraction(double absoluteDiff);

/// relative diff 0 -> 0, <= 10% -> 0.2, <= 25% -> 0.5, otherwise 1
float priceFraction(double relativeDiff);

/// linear month distance 0 -> 0, 1 -> 0.3, 2 -> 0.6, otherwise 1
float monthFraction(int distance);

/**
 * Candidate price as a number: band names map to their representative value,
 * plain numbers are taken as-is. The attribute named after @p preferred is read
 * first, then the other price attribute.
 */
std::optional<double> candidatePrice(const vector::Attributes& candidate,
                                     ConstraintKind preferred);
} // namespace penalty

/**
 * @brief Maps each constraint kind to its penalty function
 *
 * Built-in rules are dispatched with std::visit over Constraint, so a new
 * constraint alternative does not compile until it has a rule. A rule can be
 * replaced per kind at runtime.
 */
class PenaltyRegistry {
public:
    PenaltyRegistry() = default;

    /**
     * @brief Penalty fraction for a constraint against a candidate, clamped to [0, 1]
     */
    float fraction(const Constraint& constraint, const vector::Attributes& candidate) const;

    void setRule(ConstraintKind kind, PenaltyRule rule);
    void resetRule(ConstraintKind kind);
    bool hasCustomRule(ConstraintKind kind) const;

    /**
     * @brief Built-in rule, ignoring any override
     */
    static float builtinFraction(const Constraint& constraint, const vector::Attributes& candidate);

private:
    std::array<PenaltyRule, kAllConstraintKinds.size()> overrides_;
};

/**
 * @brief Contribution of one constraint to a candidate's score
 */
struct PenaltyBreakdown {
    ConstraintKind kind;
    float weight = 0.0f;
    float fraction = 0.0f;
    float penalty = 0.0f; // weight * fraction
};

struct ScoreExplanation {
    float baseSimilarity = 0.0f;
    float score = 0.0f;
    std::vector<PenaltyBreakdown> penalties; // Evaluated constraints, in constraint order
};

/**
 * @brief Weighted soft-scoring engine
 *
 * score = base_similarity * prod(1 - weight_i * fraction_i) over every constraint
 * except the one used as hard filter, floored at 0. Stateless apart from its
 * configuration; safe to share between threads.
 */
class SoftScorer {
public:
    explicit SoftScorer(PenaltyWeights weights = {}, PenaltyRegistry registry = {});

    float score(float baseSimilarity, const vector::Attributes& candidate,
                const ConstraintSet& constraints, const std::optional<HardFilter>& hardFilter) const;

    ScoreExplanation explain(float baseSimilarity, const vector::Attributes& candidate,
                             const ConstraintSet& constraints,
                             const std::optional<HardFilter>& hardFilter) const;

    const PenaltyWeights& getWeights() const { return weights_; }
    void setWeights(PenaltyWeights weights) { weights_ = std::move(weights); }

    const PenaltyRegistry& getRegistry() const { return registry_; }
    PenaltyRegistry& getRegistry() { return registry_; }

private:
    PenaltyWeights weights_;
    PenaltyRegistry registry_;
};

} // namespace tripsift::search
