#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <tripsift/common/text_utils.h>
#include <tripsift/search/travel_constraints.h>

namespace tripsift::search {

static_assert(std::variant_size_v<Constraint> == kAllConstraintKinds.size(),
              "every ConstraintKind needs a Constraint alternative");

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

constexpr std::array<std::string_view, 12> kMonthNames = {
    "january", "february", "march",     "april",   "may",      "june",
    "july",    "august",   "september", "october", "november", "december"};

// Canonical destination spellings used by the corpus
const std::unordered_map<std::string, std::string>& destinationAliases() {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"rome", "Rome"},           {"roma", "Rome"},           {"italy", "Rome"},
        {"istanbul", "Istanbul"},   {"turkey", "Istanbul"},     {"amsterdam", "Amsterdam"},
        {"netherlands", "Amsterdam"}, {"holland", "Amsterdam"}, {"greece", "Greece"},
        {"athens", "Athens"}};
    return aliases;
}

// Lodging and package requests map onto the "tour" category of the corpus
const std::unordered_map<std::string, std::string>& categoryAliases() {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"hotel", "tour"},   {"accommodation", "tour"}, {"apartment", "tour"},
        {"villa", "tour"},   {"resort", "tour"},        {"package", "tour"},
        {"trip", "tour"},    {"tour", "tour"},          {"restaurant", "restaurant"},
        {"attraction", "attraction"}};
    return aliases;
}

bool isBlankValue(const std::string& trimmed) {
    if (trimmed.empty())
        return true;
    auto lower = common::toLowerCopy(trimmed);
    return lower == "none" || lower == "null";
}

std::string formatAmount(double amount) {
    return fmt::format("{}", amount);
}

Error invalidValue(std::string_view name, const std::string& value) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value '" + value + "' for constraint '" + std::string(name) + "'"};
}

Result<Constraint> parseConstraint(ConstraintKind kind, const std::string& value) {
    const auto name = constraintName(kind);
    switch (kind) {
        case ConstraintKind::Destination: {
            auto it = destinationAliases().find(common::toLowerCopy(value));
            if (it != destinationAliases().end())
                return Constraint{Destination{it->second}};
            return Constraint{Destination{common::toTitleCase(value)}};
        }
        case ConstraintKind::Category: {
            auto lower = common::toLowerCopy(value);
            auto it = categoryAliases().find(lower);
            if (it != categoryAliases().end()) {
                if (it->second != lower)
                    spdlog::debug("Mapped category '{}' -> '{}'", lower, it->second);
                return Constraint{Category{it->second}};
            }
            return Constraint{Category{std::move(lower)}};
        }
        case ConstraintKind::PriceRange: {
            auto band = parsePriceBand(value);
            if (!band)
                return invalidValue(name, value);
            return Constraint{PriceRange{*band}};
        }
        case ConstraintKind::PriceMax: {
            auto amount = common::parseNumber(value);
            if (!amount || *amount <= 0.0)
                return invalidValue(name, value);
            return Constraint{PriceMax{*amount}};
        }
        case ConstraintKind::TravelMonth: {
            auto month = parseMonth(value);
            if (!month)
                return invalidValue(name, value);
            return Constraint{TravelMonth{*month}};
        }
        case ConstraintKind::Season:
            return Constraint{Season{common::toLowerCopy(value)}};
        case ConstraintKind::DurationDays: {
            auto days = common::parseNumber(value);
            if (!days || *days < 1.0 || std::floor(*days) != *days || *days > 365.0)
                return invalidValue(name, value);
            return Constraint{DurationDays{static_cast<uint32_t>(*days)}};
        }
        case ConstraintKind::FamilyFriendly: {
            auto flag = common::parseBool(value);
            if (!flag)
                return invalidValue(name, value);
            return Constraint{FamilyFriendly{*flag}};
        }
        case ConstraintKind::TransportType:
            return Constraint{TransportType{common::toLowerCopy(value)}};
        case ConstraintKind::Amenities: {
            auto items = common::splitList(value);
            if (items.empty())
                return invalidValue(name, value);
            return Constraint{Amenities{std::move(items)}};
        }
        case ConstraintKind::Subcategory:
            return Constraint{Subcategory{common::toLowerCopy(value)}};
    }
    return Error{ErrorCode::InternalError, "Unhandled constraint kind"};
}

} // namespace

std::string_view constraintName(ConstraintKind kind) {
    switch (kind) {
        case ConstraintKind::Destination: return "destination";
        case ConstraintKind::Category: return "category";
        case ConstraintKind::PriceRange: return "price_range";
        case ConstraintKind::PriceMax: return "price_max";
        case ConstraintKind::TravelMonth: return "travel_month";
        case ConstraintKind::Season: return "season";
        case ConstraintKind::DurationDays: return "duration_days";
        case ConstraintKind::FamilyFriendly: return "family_friendly";
        case ConstraintKind::TransportType: return "transport_type";
        case ConstraintKind::Amenities: return "amenities";
        case ConstraintKind::Subcategory: return "subcategory";
    }
    return "unknown";
}

std::optional<ConstraintKind> constraintKindFromName(std::string_view name) {
    auto key = common::toLowerCopy(common::trimCopy(name));
    for (auto kind : kAllConstraintKinds) {
        if (constraintName(kind) == key)
            return kind;
    }
    return std::nullopt;
}

std::string_view priceBandName(PriceBand band) {
    switch (band) {
        case PriceBand::Budget: return "budget";
        case PriceBand::Moderate: return "moderate";
        case PriceBand::Expensive: return "expensive";
        case PriceBand::Luxury: return "luxury";
    }
    return "unknown";
}

std::optional<PriceBand> parsePriceBand(std::string_view raw) {
    auto text = common::toLowerCopy(common::trimCopy(raw));
    if (text == "budget")
        return PriceBand::Budget;
    if (text == "moderate")
        return PriceBand::Moderate;
    if (text == "expensive")
        return PriceBand::Expensive;
    if (text == "luxury")
        return PriceBand::Luxury;
    return std::nullopt;
}

double priceBandValue(PriceBand band) {
    switch (band) {
        case PriceBand::Budget: return 150.0;
        case PriceBand::Moderate: return 350.0;
        case PriceBand::Expensive: return 600.0;
        case PriceBand::Luxury: return 1000.0;
    }
    return 0.0;
}

PriceBand priceBandForAmount(double amount) {
    if (amount < 100.0)
        return PriceBand::Budget;
    if (amount < 300.0)
        return PriceBand::Moderate;
    if (amount < 600.0)
        return PriceBand::Expensive;
    return PriceBand::Luxury;
}

std::optional<int> parseMonth(std::string_view raw) {
    auto text = common::toLowerCopy(common::trimCopy(raw));
    if (text.empty())
        return std::nullopt;
    if (auto number = common::parseNumber(text)) {
        if (std::floor(*number) != *number || *number < 1.0 || *number > 12.0)
            return std::nullopt;
        return static_cast<int>(*number);
    }
    for (size_t i = 0; i < kMonthNames.size(); ++i) {
        if (text == kMonthNames[i] || (text.size() == 3 && kMonthNames[i].substr(0, 3) == text))
            return static_cast<int>(i) + 1;
    }
    return std::nullopt;
}

std::string_view monthName(int month) {
    if (month < 1 || month > 12)
        return "";
    return kMonthNames[static_cast<size_t>(month - 1)];
}

ConstraintKind kindOf(const Constraint& constraint) {
    return static_cast<ConstraintKind>(constraint.index());
}

std::string valueString(const Constraint& constraint) {
    return std::visit(
        overloaded{
            [](const Destination& c) { return common::toTitleCase(common::trimCopy(c.name)); },
            [](const Category& c) { return common::toLowerCopy(common::trimCopy(c.value)); },
            [](const PriceRange& c) { return std::string(priceBandName(c.band)); },
            [](const PriceMax& c) { return formatAmount(c.amount); },
            [](const TravelMonth& c) { return std::string(monthName(c.month)); },
            [](const Season& c) { return common::toLowerCopy(common::trimCopy(c.value)); },
            [](const DurationDays& c) { return std::to_string(c.days); },
            [](const FamilyFriendly& c) { return std::string(c.value ? "true" : "false"); },
            [](const TransportType& c) { return common::toLowerCopy(common::trimCopy(c.value)); },
            [](const Amenities& c) {
                std::string joined;
                for (const auto& item : c.items) {
                    if (!joined.empty())
                        joined += ",";
                    joined += common::toLowerCopy(item);
                }
                return joined;
            },
            [](const Subcategory& c) { return common::toLowerCopy(common::trimCopy(c.value)); }},
        constraint);
}

Result<ConstraintSet> ConstraintSet::fromMap(const RawConstraints& raw) {
    ConstraintSet set;
    for (const auto& [key, rawValue] : raw) {
        auto kind = constraintKindFromName(key);
        if (!kind) {
            spdlog::debug("Ignoring unknown constraint '{}'", key);
            continue;
        }
        auto value = common::trimCopy(rawValue);
        if (isBlankValue(value))
            continue;

        auto parsed = parseConstraint(*kind, value);
        if (!parsed) {
            spdlog::warn("Dropping constraint '{}': {}", key, parsed.error().message);
            continue;
        }
        set.set(std::move(parsed).value());
    }
    return set;
}

void ConstraintSet::set(Constraint constraint) {
    const auto kind = kindOf(constraint);
    auto it = std::find_if(items_.begin(), items_.end(),
                           [kind](const Constraint& c) { return kindOf(c) >= kind; });
    if (it != items_.end() && kindOf(*it) == kind) {
        *it = std::move(constraint);
        return;
    }
    items_.insert(it, std::move(constraint));
}

void ConstraintSet::erase(ConstraintKind kind) {
    items_.erase(std::remove_if(items_.begin(), items_.end(),
                                [kind](const Constraint& c) { return kindOf(c) == kind; }),
                 items_.end());
}

const Constraint* ConstraintSet::find(ConstraintKind kind) const {
    for (const auto& c : items_) {
        if (kindOf(c) == kind)
            return &c;
    }
    return nullptr;
}

std::string ConstraintSet::summary() const {
    if (items_.empty())
        return "no constraints";
    std::string out;
    for (const auto& c : items_) {
        if (!out.empty())
            out += ", ";
        out += constraintName(kindOf(c));
        out += "=";
        out += valueString(c);
    }
    return out;
}

} // namespace tripsift::search
