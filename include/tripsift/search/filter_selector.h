#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <tripsift/search/travel_constraints.h>

namespace tripsift::search {

/**
 * @brief Equality predicate pushed down to the candidate store
 */
struct HardFilter {
    ConstraintKind kind;
    std::string value; // Normalized (title-case destination, lower-case otherwise)

    std::string_view name() const { return constraintName(kind); }

    bool operator==(const HardFilter& other) const {
        return kind == other.kind && value == other.value;
    }
};

/**
 * Precedence used when choosing the hard filter. Destination and the time window
 * come first; price and category mismatches are left to soft scoring when a
 * stronger constraint is present.
 */
inline constexpr std::array<ConstraintKind, 6> kHardFilterPrecedence = {
    ConstraintKind::Destination, ConstraintKind::TravelMonth, ConstraintKind::Season,
    ConstraintKind::Category,    ConstraintKind::PriceRange,  ConstraintKind::Subcategory};

/**
 * @brief Pick the single constraint to use as a store pre-filter
 *
 * Returns the first constraint in kHardFilterPrecedence that is present with a
 * non-empty value, or nullopt for an unfiltered similarity search. Never fails.
 */
std::optional<HardFilter> selectHardFilter(const ConstraintSet& constraints);

} // namespace tripsift::search
