#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <tripsift/core/types.h>

namespace tripsift::search {

/**
 * @brief Constraint vocabulary understood by the ranking engine
 *
 * The enumerator order is also the order in which a ConstraintSet stores
 * and evaluates its entries.
 */
enum class ConstraintKind {
    Destination,
    Category,
    PriceRange,
    PriceMax,
    TravelMonth,
    Season,
    DurationDays,
    FamilyFriendly,
    TransportType,
    Amenities,
    Subcategory
};

inline constexpr std::array<ConstraintKind, 11> kAllConstraintKinds = {
    ConstraintKind::Destination,  ConstraintKind::Category,       ConstraintKind::PriceRange,
    ConstraintKind::PriceMax,     ConstraintKind::TravelMonth,    ConstraintKind::Season,
    ConstraintKind::DurationDays, ConstraintKind::FamilyFriendly, ConstraintKind::TransportType,
    ConstraintKind::Amenities,    ConstraintKind::Subcategory};

/// Attribute / constraint name as it appears in query mappings and stored metadata
std::string_view constraintName(ConstraintKind kind);
std::optional<ConstraintKind> constraintKindFromName(std::string_view name);

enum class PriceBand { Budget, Moderate, Expensive, Luxury };

std::string_view priceBandName(PriceBand band);
std::optional<PriceBand> parsePriceBand(std::string_view raw);

/// Representative price used for point-to-point comparison (budget=150 ... luxury=1000)
double priceBandValue(PriceBand band);

/// Band a maximum price falls into (<100 budget, <300 moderate, <600 expensive, else luxury)
PriceBand priceBandForAmount(double amount);

/// Month name, abbreviation or number to 1..12
std::optional<int> parseMonth(std::string_view raw);
std::string_view monthName(int month);

struct Destination {
    std::string name;
};
struct Category {
    std::string value;
};
struct PriceRange {
    PriceBand band;
};
struct PriceMax {
    double amount;
};
struct TravelMonth {
    int month; // 1..12
};
struct Season {
    std::string value;
};
struct DurationDays {
    uint32_t days;
};
struct FamilyFriendly {
    bool value;
};
struct TransportType {
    std::string value;
};
struct Amenities {
    std::vector<std::string> items;
};
struct Subcategory {
    std::string value;
};

using Constraint = std::variant<Destination, Category, PriceRange, PriceMax, TravelMonth, Season,
                                DurationDays, FamilyFriendly, TransportType, Amenities,
                                Subcategory>;

ConstraintKind kindOf(const Constraint& constraint);

/**
 * @brief Normalized string form of a constraint value
 *
 * Destinations are title-cased, everything else lower-case. This is the value pushed
 * to the candidate store as an equality filter and shown in summaries.
 */
std::string valueString(const Constraint& constraint);

/// Plain name -> value mapping produced by the query parsing layer
using RawConstraints = std::map<std::string, std::string>;

/**
 * @brief Typed set of query constraints, at most one per kind
 */
class ConstraintSet {
public:
    ConstraintSet() = default;

    /**
     * @brief Build a set from a raw mapping
     *
     * Unknown keys are ignored, empty / "none" / "null" values are dropped and
     * destination and category aliases are mapped to their canonical names.
     * Values of the wrong shape are dropped with a warning.
     */
    static Result<ConstraintSet> fromMap(const RawConstraints& raw);

    /**
     * @brief Insert or replace the constraint of the same kind
     */
    void set(Constraint constraint);

    void erase(ConstraintKind kind);

    const Constraint* find(ConstraintKind kind) const;
    bool contains(ConstraintKind kind) const { return find(kind) != nullptr; }

    const std::vector<Constraint>& items() const { return items_; }
    bool empty() const { return items_.empty(); }
    size_t size() const { return items_.size(); }

    /**
     * @brief One line, human readable rendering ("destination=Rome, price_range=moderate")
     */
    std::string summary() const;

private:
    std::vector<Constraint> items_;
};

} // namespace tripsift::search
