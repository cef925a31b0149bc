#include "tabfit/layout/layout_options.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace tabfit::layout
{
namespace
{

int integerOption(const config::OptionRegistry &registry, const char *key, int fallback)
{
    const std::int64_t value = registry.getInteger(key, fallback);
    const std::int64_t lo = std::numeric_limits<int>::min();
    const std::int64_t hi = std::numeric_limits<int>::max();
    return static_cast<int>(std::clamp(value, lo, hi));
}

bool inRange(int value, int lo) noexcept
{
    return value >= lo && value <= kMaxColumns;
}

} // namespace

bool withinBounds(const LayoutConfig &layout) noexcept
{
    return inRange(layout.minWidth, kMinTabWidth) && inRange(layout.maxWidth, kMinTabWidth) &&
           inRange(layout.fixedOverhead, kMinOverhead) && inRange(layout.perTabOverhead, kMinOverhead);
}

LayoutConfig clampToBounds(LayoutConfig layout) noexcept
{
    layout.minWidth = std::clamp(layout.minWidth, kMinTabWidth, kMaxColumns);
    layout.maxWidth = std::clamp(layout.maxWidth, kMinTabWidth, kMaxColumns);
    layout.fixedOverhead = std::clamp(layout.fixedOverhead, kMinOverhead, kMaxColumns);
    layout.perTabOverhead = std::clamp(layout.perTabOverhead, kMinOverhead, kMaxColumns);
    return layout;
}

void registerLayoutOptions(config::OptionRegistry &registry)
{
    const LayoutConfig defaults;
    registry.registerOption({kOptionMinWidth, config::OptionKind::Integer,
                             config::OptionValue(static_cast<std::int64_t>(defaults.minWidth)), "Minimum Tab Width",
                             "Narrowest width, in columns, a tab is given before overhead."});
    registry.registerOption({kOptionMaxWidth, config::OptionKind::Integer,
                             config::OptionValue(static_cast<std::int64_t>(defaults.maxWidth)), "Maximum Tab Width",
                             "Widest width, in columns, a tab is given before overhead."});
    registry.registerOption({kOptionFixedOverhead, config::OptionKind::Integer,
                             config::OptionValue(static_cast<std::int64_t>(defaults.fixedOverhead)), "Fixed Overhead",
                             "Columns of the tab bar not available to any tab."});
    registry.registerOption({kOptionPerTabOverhead, config::OptionKind::Integer,
                             config::OptionValue(static_cast<std::int64_t>(defaults.perTabOverhead)),
                             "Per-Tab Overhead", "Columns each tab spends on separators and buttons."});
}

LayoutConfig layoutConfigFrom(const config::OptionRegistry &registry)
{
    const LayoutConfig defaults;
    LayoutConfig layout;
    layout.minWidth = integerOption(registry, kOptionMinWidth, defaults.minWidth);
    layout.maxWidth = integerOption(registry, kOptionMaxWidth, defaults.maxWidth);
    layout.fixedOverhead = integerOption(registry, kOptionFixedOverhead, defaults.fixedOverhead);
    layout.perTabOverhead = integerOption(registry, kOptionPerTabOverhead, defaults.perTabOverhead);
    return clampToBounds(layout);
}

void storeLayoutConfig(config::OptionRegistry &registry, const LayoutConfig &layout)
{
    registry.set(kOptionMinWidth, config::OptionValue(static_cast<std::int64_t>(layout.minWidth)));
    registry.set(kOptionMaxWidth, config::OptionValue(static_cast<std::int64_t>(layout.maxWidth)));
    registry.set(kOptionFixedOverhead, config::OptionValue(static_cast<std::int64_t>(layout.fixedOverhead)));
    registry.set(kOptionPerTabOverhead, config::OptionValue(static_cast<std::int64_t>(layout.perTabOverhead)));
}

} // namespace tabfit::layout
