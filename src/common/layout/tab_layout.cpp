#include "tabfit/layout/tab_layout.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace tabfit::layout
{

namespace
{

bool isContinuationByte(char ch) noexcept
{
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

std::string spaces(int count)
{
    return std::string(static_cast<std::size_t>(std::max(count, 0)), ' ');
}

} // namespace

std::size_t columnCount(std::string_view text) noexcept
{
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char ch) { return !isContinuationByte(ch); }));
}

std::string_view leadingColumns(std::string_view text, std::size_t columns) noexcept
{
    std::size_t seen = 0;
    for (std::size_t pos = 0; pos < text.size(); ++pos)
    {
        if (isContinuationByte(text[pos]))
            continue;
        if (seen == columns)
            return text.substr(0, pos);
        ++seen;
    }
    return text;
}

int allocateWidth(int totalWidth, int tabCount, const LayoutConfig &config) noexcept
{
    // Widened so that any int configuration stays free of overflow.
    const std::int64_t count = std::max(tabCount, 1);
    const std::int64_t available = std::max<std::int64_t>(std::int64_t{totalWidth} - config.fixedOverhead, 1);
    const std::int64_t computed = available / count;

    std::int64_t clamped = computed;
    if (computed < config.minWidth)
        clamped = config.minWidth;
    else if (computed > config.maxWidth)
        clamped = config.maxWidth;

    const std::int64_t target = clamped - config.perTabOverhead;
    return static_cast<int>(std::clamp<std::int64_t>(target, std::numeric_limits<int>::min(),
                                                     std::numeric_limits<int>::max()));
}

DisplayName padLabel(const std::string &label, int targetWidth)
{
    const int length = static_cast<int>(columnCount(label));

    DisplayName result;
    result.original = label;

    if (length + 2 > targetWidth)
    {
        // The kept prefix is two short of the target: one column goes to the
        // leading pad and one to the ellipsis.
        const int kept = std::max(targetWidth - 2, 0);
        result.visible = spaces(1);
        result.visible += leadingColumns(label, static_cast<std::size_t>(kept));
        result.visible += kEllipsis;
        result.leadingPad = 1;
        result.trailingPad = 0;
        return result;
    }

    const int slack = targetWidth - length;
    const int left = slack / 2;
    const int right = slack - left;

    result.visible = spaces(left);
    result.visible += label;
    result.visible += spaces(right);
    result.leadingPad = left;
    result.trailingPad = right;
    return result;
}

} // namespace tabfit::layout
