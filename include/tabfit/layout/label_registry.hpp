#pragma once

#include "tabfit/layout/tab_layout.hpp"

#include <functional>
#include <optional>
#include <string>

namespace tabfit::layout
{

enum class TabKind
{
    Regular,
    Current
};

struct Tab
{
    TabKind kind = TabKind::Regular;
    // Set when a user renamed the tab rather than the host deriving a name.
    std::optional<std::string> explicitName;
    DisplayName displayedName;
};

// Live query for the label of whatever buffer currently has focus.
using CurrentLabelSource = std::function<std::string()>;

std::string trueLabel(const Tab &tab, const CurrentLabelSource &currentLabel);

} // namespace tabfit::layout
