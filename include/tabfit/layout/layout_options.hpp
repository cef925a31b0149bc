#pragma once

#include "tabfit/layout/tab_layout.hpp"
#include "tabfit/options.hpp"

namespace tabfit::layout
{

inline constexpr char kAppId[] = "tabfit";

inline constexpr char kOptionMinWidth[] = "minWidth";
inline constexpr char kOptionMaxWidth[] = "maxWidth";
inline constexpr char kOptionFixedOverhead[] = "fixedOverhead";
inline constexpr char kOptionPerTabOverhead[] = "perTabOverhead";

// Widest coordinate a Turbo Vision view can address.
inline constexpr int kMaxColumns = 65535;
inline constexpr int kMinTabWidth = 1;
inline constexpr int kMinOverhead = 0;

// Per-field bounds only; the fields are not checked against each other.
bool withinBounds(const LayoutConfig &layout) noexcept;
LayoutConfig clampToBounds(LayoutConfig layout) noexcept;

void registerLayoutOptions(config::OptionRegistry &registry);

LayoutConfig layoutConfigFrom(const config::OptionRegistry &registry);
void storeLayoutConfig(config::OptionRegistry &registry, const LayoutConfig &layout);

} // namespace tabfit::layout
