/**
 * @file soft_scorer_catch2_test.cpp
 * @brief Penalty curves, built-in rules, registry overrides and SoftScorer scoring
 */

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <tripsift/search/filter_selector.h>
#include <tripsift/search/soft_scorer.h>

#include <limits>

using namespace tripsift::search;
using tripsift::vector::Attributes;
using Catch::Approx;

namespace {

ConstraintSet constraintsOf(const RawConstraints& raw) {
    auto result = ConstraintSet::fromMap(raw);
    REQUIRE(result.has_value());
    return result.value();
}

} // namespace

// ────────────────────────────────────────────────────────────────────────────────
// Curves
// ────────────────────────────────────────────────────────────────────────────────

TEST_CASE("durationFraction steps at one and two days", "[search][scorer][catch2]") {
    CHECK(penalty::durationFraction(0.0) == 0.0f);
    CHECK(penalty::durationFraction(1.0) == Approx(0.2f));
    CHECK(penalty::durationFraction(-1.0) == Approx(0.2f));
    CHECK(penalty::durationFraction(2.0) == Approx(0.5f));
    CHECK(penalty::durationFraction(3.0) == 1.0f);
    CHECK(penalty::durationFraction(30.0) == 1.0f);
}

TEST_CASE("priceFraction is monotone in relative difference", "[search][scorer][catch2]") {
    CHECK(penalty::priceFraction(0.0) == 0.0f);
    CHECK(penalty::priceFraction(0.05) == Approx(0.2f));
    CHECK(penalty::priceFraction(0.10) == Approx(0.2f));
    CHECK(penalty::priceFraction(0.20) == Approx(0.5f));
    CHECK(penalty::priceFraction(0.25) == Approx(0.5f));
    CHECK(penalty::priceFraction(0.30) == 1.0f);

    float previous = 0.0f;
    for (int step = 0; step <= 300; ++step) {
        float current = penalty::priceFraction(step / 100.0);
        CHECK(current >= previous);
        previous = current;
    }
}

TEST_CASE("monthFraction uses linear distance", "[search][scorer][catch2]") {
    CHECK(penalty::monthFraction(0) == 0.0f);
    CHECK(penalty::monthFraction(1) == Approx(0.3f));
    CHECK(penalty::monthFraction(-2) == Approx(0.6f));
    CHECK(penalty::monthFraction(3) == 1.0f);
    // December and January are eleven months apart
    CHECK(penalty::monthFraction(12 - 1) == 1.0f);
}

TEST_CASE("candidatePrice reads bands, numbers and the sibling attribute",
          "[search][scorer][catch2]") {
    CHECK(penalty::candidatePrice({{"price_range", "moderate"}}, ConstraintKind::PriceRange) ==
          350.0);
    CHECK(penalty::candidatePrice({{"price_range", "420"}}, ConstraintKind::PriceRange) == 420.0);
    CHECK(penalty::candidatePrice({{"price_max", "200"}}, ConstraintKind::PriceRange) == 200.0);
    CHECK(penalty::candidatePrice({{"price_range", "luxury"}}, ConstraintKind::PriceMax) ==
          1000.0);
    CHECK_FALSE(penalty::candidatePrice({}, ConstraintKind::PriceRange).has_value());
    CHECK_FALSE(penalty::candidatePrice({{"price_range", "pricey"}, {"price_max", "200"}},
                                        ConstraintKind::PriceRange)
                    .has_value());
}

// ────────────────────────────────────────────────────────────────────────────────
// Weights
// ────────────────────────────────────────────────────────────────────────────────

TEST_CASE("PenaltyWeights defaults", "[search][scorer][catch2]") {
    PenaltyWeights weights;
    CHECK(weights.getWeight(ConstraintKind::PriceRange) == Approx(0.9f));
    CHECK(weights.getWeight(ConstraintKind::TravelMonth) == Approx(0.8f));
    CHECK(weights.getWeight(ConstraintKind::DurationDays) == Approx(0.6f));
    CHECK(weights.getWeight(ConstraintKind::Category) == Approx(0.5f));
    CHECK(weights.getWeight(ConstraintKind::FamilyFriendly) == Approx(0.3f));
    CHECK(weights.getWeight(ConstraintKind::TransportType) == Approx(0.2f));
    CHECK(weights.getWeight(ConstraintKind::Destination) == Approx(0.1f));
    CHECK(weights.getWeight(ConstraintKind::PriceMax) == Approx(0.1f));
    CHECK(weights.getWeight(ConstraintKind::Amenities) == Approx(0.1f));
}

TEST_CASE("PenaltyWeights clamps out of range weights", "[search][scorer][catch2]") {
    PenaltyWeights weights;
    weights.setWeight(ConstraintKind::Season, 1.7f);
    weights.setWeight(ConstraintKind::Category, -0.5f);
    CHECK(weights.getWeight(ConstraintKind::Season) == 1.0f);
    CHECK(weights.getWeight(ConstraintKind::Category) == 0.0f);
}

// ────────────────────────────────────────────────────────────────────────────────
// Built-in rules
// ────────────────────────────────────────────────────────────────────────────────

TEST_CASE("Categorical rules compare case-insensitively", "[search][scorer][catch2]") {
    Attributes candidate{{"category", "Tour"}, {"destination", "rome"}};
    CHECK(PenaltyRegistry::builtinFraction(Category{"tour"}, candidate) == 0.0f);
    CHECK(PenaltyRegistry::builtinFraction(Destination{"Rome"}, candidate) == 0.0f);
    CHECK(PenaltyRegistry::builtinFraction(Category{"restaurant"}, candidate) == 1.0f);
}

TEST_CASE("Missing or unparsable attributes are full mismatches", "[search][scorer][catch2]") {
    Attributes empty;
    CHECK(PenaltyRegistry::builtinFraction(Season{"summer"}, empty) == 1.0f);
    CHECK(PenaltyRegistry::builtinFraction(TravelMonth{8}, empty) == 1.0f);
    CHECK(PenaltyRegistry::builtinFraction(DurationDays{5}, empty) == 1.0f);
    CHECK(PenaltyRegistry::builtinFraction(PriceRange{PriceBand::Budget}, empty) == 1.0f);

    CHECK(PenaltyRegistry::builtinFraction(TravelMonth{8}, {{"travel_month", "soon"}}) == 1.0f);
    CHECK(PenaltyRegistry::builtinFraction(DurationDays{5}, {{"duration_days", "a week"}}) ==
          1.0f);
    CHECK(PenaltyRegistry::builtinFraction(FamilyFriendly{true},
                                           {{"family_friendly", "sometimes"}}) == 1.0f);
}

TEST_CASE("Near-miss rules use the curves", "[search][scorer][catch2]") {
    CHECK(PenaltyRegistry::builtinFraction(DurationDays{5}, {{"duration_days", "6"}}) ==
          Approx(0.2f));
    CHECK(PenaltyRegistry::builtinFraction(DurationDays{5}, {{"duration_days", "3"}}) ==
          Approx(0.5f));
    CHECK(PenaltyRegistry::builtinFraction(TravelMonth{8}, {{"travel_month", "october"}}) ==
          Approx(0.6f));
    CHECK(PenaltyRegistry::builtinFraction(TravelMonth{12}, {{"travel_month", "january"}}) ==
          1.0f);
    // 380 vs 350 is 8.6% off
    CHECK(PenaltyRegistry::builtinFraction(PriceRange{PriceBand::Moderate},
                                           {{"price_range", "380"}}) == Approx(0.2f));
    // 300 vs 250 is 20% off the requested maximum
    CHECK(PenaltyRegistry::builtinFraction(PriceMax{250.0}, {{"price_max", "300"}}) ==
          Approx(0.5f));
}

TEST_CASE("Amenities require every requested item", "[search][scorer][catch2]") {
    Attributes candidate{{"amenities", "WiFi, Pool, parking"}};
    CHECK(PenaltyRegistry::builtinFraction(Amenities{{"wifi", "pool"}}, candidate) == 0.0f);
    CHECK(PenaltyRegistry::builtinFraction(Amenities{{"wifi", "spa"}}, candidate) == 1.0f);
}

TEST_CASE("Family friendly compares booleans", "[search][scorer][catch2]") {
    CHECK(PenaltyRegistry::builtinFraction(FamilyFriendly{true}, {{"family_friendly", "Yes"}}) ==
          0.0f);
    CHECK(PenaltyRegistry::builtinFraction(FamilyFriendly{true}, {{"family_friendly", "false"}}) ==
          1.0f);
}

// ────────────────────────────────────────────────────────────────────────────────
// Registry overrides
// ────────────────────────────────────────────────────────────────────────────────

TEST_CASE("PenaltyRegistry rule overrides replace one kind", "[search][scorer][catch2]") {
    PenaltyRegistry registry;
    Attributes candidate{{"season", "winter"}, {"category", "restaurant"}};

    CHECK(registry.fraction(Season{"summer"}, candidate) == 1.0f);
    CHECK_FALSE(registry.hasCustomRule(ConstraintKind::Season));

    registry.setRule(ConstraintKind::Season,
                     [](const Constraint&, const Attributes&) { return 0.25f; });
    CHECK(registry.hasCustomRule(ConstraintKind::Season));
    CHECK(registry.fraction(Season{"summer"}, candidate) == Approx(0.25f));
    CHECK(registry.fraction(Category{"tour"}, candidate) == 1.0f);

    registry.resetRule(ConstraintKind::Season);
    CHECK_FALSE(registry.hasCustomRule(ConstraintKind::Season));
    CHECK(registry.fraction(Season{"summer"}, candidate) == 1.0f);
}

TEST_CASE("PenaltyRegistry clamps override output", "[search][scorer][catch2]") {
    PenaltyRegistry registry;
    registry.setRule(ConstraintKind::Season,
                     [](const Constraint&, const Attributes&) { return 4.0f; });
    CHECK(registry.fraction(Season{"x"}, {}) == 1.0f);

    registry.setRule(ConstraintKind::Season,
                     [](const Constraint&, const Attributes&) { return -1.0f; });
    CHECK(registry.fraction(Season{"x"}, {}) == 0.0f);

    registry.setRule(ConstraintKind::Season, [](const Constraint&, const Attributes&) {
        return std::numeric_limits<float>::quiet_NaN();
    });
    CHECK(registry.fraction(Season{"x"}, {}) == 1.0f);
}

// ────────────────────────────────────────────────────────────────────────────────
// SoftScorer
// ────────────────────────────────────────────────────────────────────────────────

TEST_CASE("SoftScorer ranks an exact match above a cheaper-looking luxury hit",
          "[search][scorer][catch2]") {
    SoftScorer scorer;
    auto constraints = constraintsOf(
        {{"destination", "Rome"}, {"price_range", "moderate"}, {"duration_days", "5"}});
    auto hardFilter = selectHardFilter(constraints);
    REQUIRE(hardFilter.has_value());
    REQUIRE(hardFilter->kind == ConstraintKind::Destination);

    Attributes a{{"destination", "Rome"}, {"price_range", "moderate"}, {"duration_days", "5"}};
    Attributes b{{"destination", "Rome"}, {"price_range", "luxury"}, {"duration_days", "5"}};

    float scoreA = scorer.score(0.80f, a, constraints, hardFilter);
    float scoreB = scorer.score(0.85f, b, constraints, hardFilter);

    CHECK(scoreA == Approx(0.80f));
    CHECK(scoreB == Approx(0.085f));
    CHECK(scoreA > scoreB);
}

TEST_CASE("SoftScorer applies the month near-miss penalty", "[search][scorer][catch2]") {
    SoftScorer scorer;
    auto constraints = constraintsOf({{"travel_month", "august"}});
    Attributes candidate{{"travel_month", "september"}};

    CHECK(scorer.score(0.70f, candidate, constraints, std::nullopt) == Approx(0.532f));
}

TEST_CASE("SoftScorer skips the hard-filtered constraint", "[search][scorer][catch2]") {
    SoftScorer scorer;
    auto constraints = constraintsOf({{"travel_month", "august"}});
    Attributes candidate{{"travel_month", "march"}};

    auto hardFilter = selectHardFilter(constraints);
    CHECK(scorer.score(0.6f, candidate, constraints, hardFilter) == Approx(0.6f));
    CHECK(scorer.score(0.6f, candidate, constraints, std::nullopt) == Approx(0.6f * 0.2f));
}

TEST_CASE("SoftScorer returns the base similarity without constraints",
          "[search][scorer][catch2]") {
    SoftScorer scorer;
    for (float base : {0.0f, 0.25f, 0.5f, 1.0f}) {
        CHECK(scorer.score(base, {{"destination", "Rome"}}, ConstraintSet{}, std::nullopt) ==
              base);
    }
}

TEST_CASE("SoftScorer never exceeds the base similarity", "[search][scorer][catch2]") {
    SoftScorer scorer;
    auto constraints = constraintsOf({{"category", "tour"},
                                      {"price_range", "budget"},
                                      {"duration_days", "3"},
                                      {"family_friendly", "true"},
                                      {"transport_type", "train"},
                                      {"season", "summer"}});

    const Attributes candidates[] = {
        {},
        {{"category", "tour"}, {"price_range", "budget"}, {"duration_days", "3"}},
        {{"category", "restaurant"}, {"price_range", "luxury"}, {"duration_days", "10"}},
        {{"family_friendly", "no"}, {"transport_type", "bus"}, {"season", "winter"}}};

    for (const auto& candidate : candidates) {
        float score = scorer.score(0.9f, candidate, constraints, std::nullopt);
        CHECK(score >= 0.0f);
        CHECK(score <= 0.9f);
    }
}

TEST_CASE("SoftScorer floors at zero with full weights", "[search][scorer][catch2]") {
    PenaltyWeights weights;
    weights.setWeight(ConstraintKind::Category, 1.0f);
    SoftScorer scorer(weights);

    auto constraints = constraintsOf({{"category", "tour"}});
    CHECK(scorer.score(0.7f, {{"category", "restaurant"}}, constraints, std::nullopt) == 0.0f);
}

TEST_CASE("SoftScorer::explain lists each evaluated constraint", "[search][scorer][catch2]") {
    SoftScorer scorer;
    auto constraints = constraintsOf(
        {{"destination", "Rome"}, {"price_range", "moderate"}, {"duration_days", "5"}});
    auto hardFilter = selectHardFilter(constraints);
    Attributes candidate{{"destination", "Rome"}, {"price_range", "luxury"}, {"duration_days", "6"}};

    auto explanation = scorer.explain(0.85f, candidate, constraints, hardFilter);
    REQUIRE(explanation.penalties.size() == 2);
    CHECK(explanation.penalties[0].kind == ConstraintKind::PriceRange);
    CHECK(explanation.penalties[0].weight == Approx(0.9f));
    CHECK(explanation.penalties[0].fraction == 1.0f);
    CHECK(explanation.penalties[1].kind == ConstraintKind::DurationDays);
    CHECK(explanation.penalties[1].penalty == Approx(0.6f * 0.2f));
    CHECK(explanation.score ==
          Approx(scorer.score(0.85f, candidate, constraints, hardFilter)));
}
