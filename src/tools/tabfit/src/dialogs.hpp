#pragma once

#include "tabfit/layout/tab_layout.hpp"

#include <optional>
#include <string>

namespace tabfit::tool
{

std::optional<std::string> promptForText(const char *title, const char *label, const std::string &initial);

bool editLayoutConfig(layout::LayoutConfig &config);

} // namespace tabfit::tool
