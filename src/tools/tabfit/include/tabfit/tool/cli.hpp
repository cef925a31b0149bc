#pragma once

#include "tabfit/layout/tab_layout.hpp"
#include "tabfit/options.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace tabfit::tool
{

struct CliOptions
{
    bool showHelp = false;
    bool showMarkers = false;
    bool saveDefaults = false;
    std::optional<int> width;
    std::optional<int> minWidth;
    std::optional<int> maxWidth;
    std::optional<int> fixedOverhead;
    std::optional<int> perTabOverhead;
    std::optional<std::size_t> current;
    std::optional<std::filesystem::path> optionsFile;
    std::vector<std::string> labels;
};

struct ParseResult
{
    CliOptions options;
    std::string error;

    bool ok() const noexcept { return error.empty(); }
};

std::optional<int> parseIntegerArgument(std::string_view text) noexcept;

ParseResult parseArguments(const std::vector<std::string_view> &args);

// False when the invocation asks for nothing but the interactive interface.
bool wantsCommandLine(const CliOptions &options) noexcept;

layout::LayoutConfig applyOverrides(layout::LayoutConfig config, const CliOptions &options) noexcept;

void printUsage(std::ostream &out);

int runCommandLine(const CliOptions &options, config::OptionRegistry &registry, std::ostream &out,
                   std::ostream &err);

} // namespace tabfit::tool
