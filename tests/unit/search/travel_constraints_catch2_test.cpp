#include <catch2/catch_test_macros.hpp>
#include <tripsift/search/travel_constraints.h>

#include <string>
#include <variant>

using namespace tripsift;
using namespace tripsift::search;

namespace {

ConstraintSet parse(const RawConstraints& raw) {
    auto result = ConstraintSet::fromMap(raw);
    REQUIRE(result.has_value());
    return result.value();
}

} // namespace

TEST_CASE("constraintName and constraintKindFromName round trip every kind",
          "[search][constraints][catch2]") {
    for (auto kind : kAllConstraintKinds) {
        auto parsed = constraintKindFromName(constraintName(kind));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == kind);
    }
    CHECK(constraintKindFromName(" Price_Range ") == ConstraintKind::PriceRange);
    CHECK_FALSE(constraintKindFromName("star_rating").has_value());
}

TEST_CASE("parsePriceBand accepts the four bands case-insensitively",
          "[search][constraints][catch2]") {
    CHECK(parsePriceBand("budget") == PriceBand::Budget);
    CHECK(parsePriceBand("Moderate") == PriceBand::Moderate);
    CHECK(parsePriceBand(" EXPENSIVE ") == PriceBand::Expensive);
    CHECK(parsePriceBand("luxury") == PriceBand::Luxury);
    CHECK_FALSE(parsePriceBand("cheap").has_value());

    CHECK(priceBandValue(PriceBand::Budget) == 150.0);
    CHECK(priceBandValue(PriceBand::Moderate) == 350.0);
    CHECK(priceBandValue(PriceBand::Expensive) == 600.0);
    CHECK(priceBandValue(PriceBand::Luxury) == 1000.0);
}

TEST_CASE("priceBandForAmount buckets amounts", "[search][constraints][catch2]") {
    CHECK(priceBandForAmount(50.0) == PriceBand::Budget);
    CHECK(priceBandForAmount(100.0) == PriceBand::Moderate);
    CHECK(priceBandForAmount(299.0) == PriceBand::Moderate);
    CHECK(priceBandForAmount(300.0) == PriceBand::Expensive);
    CHECK(priceBandForAmount(600.0) == PriceBand::Luxury);
}

TEST_CASE("parseMonth accepts names, abbreviations and numbers", "[search][constraints][catch2]") {
    CHECK(parseMonth("August") == 8);
    CHECK(parseMonth("aug") == 8);
    CHECK(parseMonth("12") == 12);
    CHECK(parseMonth(" january ") == 1);
    CHECK_FALSE(parseMonth("13").has_value());
    CHECK_FALSE(parseMonth("0").has_value());
    CHECK_FALSE(parseMonth("2.5").has_value());
    CHECK_FALSE(parseMonth("summer").has_value());
    CHECK_FALSE(parseMonth("").has_value());

    CHECK(monthName(9) == "september");
    CHECK(monthName(13).empty());
}

TEST_CASE("ConstraintSet::fromMap builds typed constraints", "[search][constraints][catch2]") {
    auto set = parse({{"destination", "rome"},
                      {"price_range", "Moderate"},
                      {"duration_days", "5"},
                      {"family_friendly", "yes"},
                      {"amenities", "WiFi, pool"}});

    REQUIRE(set.size() == 5);

    const auto* destination = set.find(ConstraintKind::Destination);
    REQUIRE(destination != nullptr);
    CHECK(std::get<Destination>(*destination).name == "Rome");

    const auto* price = set.find(ConstraintKind::PriceRange);
    REQUIRE(price != nullptr);
    CHECK(std::get<PriceRange>(*price).band == PriceBand::Moderate);

    const auto* duration = set.find(ConstraintKind::DurationDays);
    REQUIRE(duration != nullptr);
    CHECK(std::get<DurationDays>(*duration).days == 5u);

    const auto* family = set.find(ConstraintKind::FamilyFriendly);
    REQUIRE(family != nullptr);
    CHECK(std::get<FamilyFriendly>(*family).value);

    const auto* amenities = set.find(ConstraintKind::Amenities);
    REQUIRE(amenities != nullptr);
    CHECK(std::get<Amenities>(*amenities).items == std::vector<std::string>{"wifi", "pool"});
}

TEST_CASE("ConstraintSet::fromMap drops unknown keys and blank values",
          "[search][constraints][catch2]") {
    auto set = parse({{"destination", "none"},
                      {"category", ""},
                      {"season", "  "},
                      {"subcategory", "NULL"},
                      {"star_rating", "5"}});
    CHECK(set.empty());
    CHECK(set.summary() == "no constraints");
}

TEST_CASE("ConstraintSet::fromMap maps destination and category aliases",
          "[search][constraints][catch2]") {
    SECTION("country names map to the corpus city") {
        auto set = parse({{"destination", "Italy"}});
        CHECK(std::get<Destination>(*set.find(ConstraintKind::Destination)).name == "Rome");

        set = parse({{"destination", "netherlands"}});
        CHECK(std::get<Destination>(*set.find(ConstraintKind::Destination)).name == "Amsterdam");
    }

    SECTION("unknown destinations are title-cased") {
        auto set = parse({{"destination", "new york"}});
        CHECK(std::get<Destination>(*set.find(ConstraintKind::Destination)).name == "New York");
    }

    SECTION("lodging categories map to tour") {
        auto set = parse({{"category", "Hotel"}});
        CHECK(std::get<Category>(*set.find(ConstraintKind::Category)).value == "tour");
    }
}

TEST_CASE("ConstraintSet::fromMap drops values of the wrong shape",
          "[search][constraints][catch2]") {
    auto check = [](const std::string& key, const std::string& value) {
        INFO(key << " = " << value);
        auto set = parse({{key, value}});
        CHECK(set.empty());
        CHECK(set.summary() == "no constraints");
    };

    check("price_range", "cheap");
    check("price_max", "-20");
    check("price_max", "abc");
    check("travel_month", "smarch");
    check("travel_month", "summer");
    check("duration_days", "0");
    check("duration_days", "2.5");
    check("duration_days", "400");
    check("duration_days", "a week");
    check("family_friendly", "maybe");
    check("amenities", ",,");
}

TEST_CASE("ConstraintSet::fromMap keeps valid constraints next to malformed ones",
          "[search][constraints][catch2]") {
    auto set = parse({{"destination", "Rome"},
                      {"travel_month", "summer"},
                      {"duration_days", "a week"},
                      {"price_range", "budget"}});

    REQUIRE(set.size() == 2);
    CHECK(set.contains(ConstraintKind::Destination));
    CHECK(set.contains(ConstraintKind::PriceRange));
    CHECK_FALSE(set.contains(ConstraintKind::TravelMonth));
    CHECK_FALSE(set.contains(ConstraintKind::DurationDays));
    CHECK(set.summary() == "destination=Rome, price_range=budget");
}

TEST_CASE("ConstraintSet keeps one constraint per kind in kind order",
          "[search][constraints][catch2]") {
    ConstraintSet set;
    set.set(DurationDays{7});
    set.set(Destination{"Rome"});
    set.set(PriceRange{PriceBand::Budget});
    set.set(DurationDays{3});

    REQUIRE(set.size() == 3);
    CHECK(kindOf(set.items()[0]) == ConstraintKind::Destination);
    CHECK(kindOf(set.items()[1]) == ConstraintKind::PriceRange);
    CHECK(kindOf(set.items()[2]) == ConstraintKind::DurationDays);
    CHECK(std::get<DurationDays>(set.items()[2]).days == 3u);

    set.erase(ConstraintKind::PriceRange);
    CHECK_FALSE(set.contains(ConstraintKind::PriceRange));
    CHECK(set.summary() == "destination=Rome, duration_days=3");
}

TEST_CASE("valueString renders normalized values", "[search][constraints][catch2]") {
    CHECK(valueString(Destination{"  san marino "}) == "San Marino");
    CHECK(valueString(Category{"Tour"}) == "tour");
    CHECK(valueString(PriceRange{PriceBand::Luxury}) == "luxury");
    CHECK(valueString(PriceMax{250.0}) == "250");
    CHECK(valueString(PriceMax{99.5}) == "99.5");
    CHECK(valueString(PriceMax{1e30}) == "1e+30");
    CHECK(valueString(TravelMonth{8}) == "august");
    CHECK(valueString(FamilyFriendly{false}) == "false");
    CHECK(valueString(Amenities{{"WiFi", "Pool"}}) == "wifi,pool");
}

TEST_CASE("price_max amounts beyond the integer range keep their sign",
          "[search][constraints][catch2]") {
    auto set = parse({{"price_max", "1e30"}});
    REQUIRE(set.contains(ConstraintKind::PriceMax));
    CHECK(std::get<PriceMax>(*set.find(ConstraintKind::PriceMax)).amount == 1e30);
    CHECK(set.summary() == "price_max=1e+30");

    CHECK(valueString(PriceMax{12345678901234567890.0}).front() != '-');
}
