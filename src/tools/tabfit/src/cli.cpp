#include "tabfit/tool/cli.hpp"

#include "tabfit/layout/layout_options.hpp"
#include "tabfit/layout/tab_names.hpp"

#include <charconv>
#include <system_error>
#include <utility>

namespace tabfit::tool
{

namespace
{

constexpr std::string_view kToolName = "tabfit";

struct IntegerFlag
{
    std::string_view name;
    std::optional<int> CliOptions::*field;
    int minimum;
};

constexpr IntegerFlag kIntegerFlags[] = {
    {"--width", &CliOptions::width, 0},
    {"--min-width", &CliOptions::minWidth, layout::kMinTabWidth},
    {"--max-width", &CliOptions::maxWidth, layout::kMinTabWidth},
    {"--fixed-overhead", &CliOptions::fixedOverhead, layout::kMinOverhead},
    {"--per-tab-overhead", &CliOptions::perTabOverhead, layout::kMinOverhead},
};

// Accepts "--flag VALUE" and "--flag=VALUE"; returns the value when `arg`
// names `flag`.
std::optional<std::string_view> flagValue(std::string_view flag, const std::vector<std::string_view> &args,
                                          std::size_t &index, std::string &error)
{
    std::string_view arg = args[index];
    if (arg == flag)
    {
        if (index + 1 >= args.size())
        {
            error = std::string(flag) + " requires a value";
            return std::nullopt;
        }
        return args[++index];
    }
    if (arg.size() > flag.size() && arg.substr(0, flag.size()) == flag && arg[flag.size()] == '=')
        return arg.substr(flag.size() + 1);
    return std::nullopt;
}

} // namespace

std::optional<int> parseIntegerArgument(std::string_view text) noexcept
{
    if (text.empty())
        return std::nullopt;
    int value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last)
        return std::nullopt;
    return value;
}

ParseResult parseArguments(const std::vector<std::string_view> &args)
{
    ParseResult result;
    CliOptions &options = result.options;
    bool labelsOnly = false;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        std::string_view arg = args[i];

        if (labelsOnly || arg.empty() || arg.front() != '-')
        {
            options.labels.emplace_back(arg);
            continue;
        }
        if (arg == "--")
        {
            labelsOnly = true;
            continue;
        }
        if (arg == "--help" || arg == "-h")
        {
            options.showHelp = true;
            continue;
        }
        if (arg == "--markers")
        {
            options.showMarkers = true;
            continue;
        }
        if (arg == "--save-defaults")
        {
            options.saveDefaults = true;
            continue;
        }

        bool matched = false;
        for (const IntegerFlag &flag : kIntegerFlags)
        {
            auto value = flagValue(flag.name, args, i, result.error);
            if (!result.ok())
                return result;
            if (!value)
                continue;
            auto parsed = parseIntegerArgument(*value);
            if (!parsed)
            {
                result.error = "invalid value '" + std::string(*value) + "' for " + std::string(flag.name);
                return result;
            }
            if (*parsed < flag.minimum || *parsed > layout::kMaxColumns)
            {
                result.error = std::string(flag.name) + " must be between " + std::to_string(flag.minimum) +
                               " and " + std::to_string(layout::kMaxColumns);
                return result;
            }
            options.*(flag.field) = *parsed;
            matched = true;
            break;
        }
        if (matched)
            continue;

        if (auto value = flagValue("--current", args, i, result.error))
        {
            auto parsed = parseIntegerArgument(*value);
            if (!parsed || *parsed < 0)
            {
                result.error = "invalid tab index '" + std::string(*value) + "' for --current";
                return result;
            }
            options.current = static_cast<std::size_t>(*parsed);
            continue;
        }
        if (!result.ok())
            return result;

        if (auto value = flagValue("--load-options", args, i, result.error))
        {
            options.optionsFile = std::filesystem::path(std::string(*value));
            continue;
        }
        if (!result.ok())
            return result;

        result.error = "unknown option '" + std::string(arg) + "'";
        return result;
    }

    if (!options.width && !options.labels.empty())
        result.error = "--width is required when labels are given";
    else if (options.showMarkers && !options.width)
        result.error = "--markers requires --width";
    else if (options.current && options.labels.empty())
        result.error = "--current requires at least one label";
    else if (options.current && *options.current >= options.labels.size())
        result.error = "--current index is out of range";
    return result;
}

bool wantsCommandLine(const CliOptions &options) noexcept
{
    return options.showHelp || options.saveDefaults || options.width || options.minWidth || options.maxWidth ||
           options.fixedOverhead || options.perTabOverhead || options.optionsFile || !options.labels.empty();
}

layout::LayoutConfig applyOverrides(layout::LayoutConfig config, const CliOptions &options) noexcept
{
    if (options.minWidth)
        config.minWidth = *options.minWidth;
    if (options.maxWidth)
        config.maxWidth = *options.maxWidth;
    if (options.fixedOverhead)
        config.fixedOverhead = *options.fixedOverhead;
    if (options.perTabOverhead)
        config.perTabOverhead = *options.perTabOverhead;
    return config;
}

void printUsage(std::ostream &out)
{
    out << kToolName << " - fit tab names to the width of a tab bar\n\n"
        << "Usage: " << kToolName << " [options] [LABEL...]\n"
        << "  --width N               Columns available to the tab bar\n"
        << "  --min-width N           Narrowest tab width before overhead\n"
        << "  --max-width N           Widest tab width before overhead\n"
        << "  --fixed-overhead N      Columns of the bar not given to any tab\n"
        << "  --per-tab-overhead N    Columns each tab spends on chrome\n"
        << "  --current I             Index of the current tab (default 0)\n"
        << "  --load-options FILE     Read layout settings from FILE\n"
        << "  --save-defaults         Store the resulting settings as defaults\n"
        << "  --markers               Print the recovered label after each tab\n"
        << "  --help                  Show this help message\n"
        << "\nWithout options the interactive tab strip is started." << std::endl;
}

int runCommandLine(const CliOptions &options, config::OptionRegistry &registry, std::ostream &out,
                   std::ostream &err)
{
    if (options.showHelp)
    {
        printUsage(out);
        return 0;
    }

    if (options.optionsFile && !registry.loadFromFile(*options.optionsFile))
    {
        err << kToolName << ": failed to load options from '" << options.optionsFile->string() << "'" << std::endl;
        return 2;
    }

    const layout::LayoutConfig config = applyOverrides(layout::layoutConfigFrom(registry), options);
    layout::storeLayoutConfig(registry, config);

    if (options.saveDefaults && !registry.saveDefaults())
    {
        err << kToolName << ": failed to save defaults to " << registry.defaultOptionsPath() << std::endl;
        return 2;
    }

    if (!options.width)
        return 0;

    const std::size_t currentIndex = options.current.value_or(0);
    std::vector<layout::Tab> tabs;
    tabs.reserve(options.labels.size());
    for (std::size_t i = 0; i < options.labels.size(); ++i)
    {
        layout::Tab tab;
        tab.kind = i == currentIndex ? layout::TabKind::Current : layout::TabKind::Regular;
        tab.displayedName = layout::DisplayName(options.labels[i]);
        tabs.push_back(std::move(tab));
    }

    const std::string currentLabel = currentIndex < options.labels.size() ? options.labels[currentIndex] : std::string();
    const layout::RecomputeResult result =
        layout::recompute(std::move(tabs), *options.width, config, [&currentLabel]() { return currentLabel; });

    for (const layout::Tab &tab : result.tabs)
    {
        out << (tab.kind == layout::TabKind::Current ? '*' : ' ') << '[' << tab.displayedName.visible << ']';
        if (options.showMarkers)
            out << '\t' << tab.displayedName.original.value_or(std::string());
        out << '\n';
    }
    out.flush();
    return 0;
}

} // namespace tabfit::tool
