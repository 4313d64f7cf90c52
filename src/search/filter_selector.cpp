#include <spdlog/spdlog.h>
#include <tripsift/search/filter_selector.h>

namespace tripsift::search {

std::optional<HardFilter> selectHardFilter(const ConstraintSet& constraints) {
    for (auto kind : kHardFilterPrecedence) {
        const Constraint* constraint = constraints.find(kind);
        if (!constraint)
            continue;

        auto value = valueString(*constraint);
        if (value.empty())
            continue;

        spdlog::debug("Hard filter selected: {}={}", constraintName(kind), value);
        return HardFilter{kind, std::move(value)};
    }

    spdlog::debug("No hard filter applicable, running unfiltered similarity search");
    return std::nullopt;
}

} // namespace tripsift::search
