#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tabfit::layout
{

// Width limits for a single tab and the columns taken by tab bar chrome.
// Read on every recompute; combinations are not validated against each other.
struct LayoutConfig
{
    int minWidth = 20;
    int maxWidth = 300;
    int fixedOverhead = 1;
    int perTabOverhead = 1;

    bool operator==(const LayoutConfig &other) const noexcept = default;
};

// A tab name as the host shows it. `original` is the label the padding was
// built from; it travels with the text so a later recompute can start from
// the true label instead of the padded one.
struct DisplayName
{
    std::string visible;
    std::optional<std::string> original;
    // Column widths of the leading and trailing padding runs, for renderers
    // that stretch a single space instead of drawing the literal run.
    int leadingPad = 0;
    int trailingPad = 0;

    DisplayName() = default;
    DisplayName(std::string text)
        : visible(std::move(text))
    {
    }

    bool hasMarker() const noexcept { return original.has_value(); }

    bool operator==(const DisplayName &other) const noexcept = default;
};

inline constexpr std::string_view kEllipsis = "\xE2\x80\xA6";

// One display column per code point.
std::size_t columnCount(std::string_view text) noexcept;

// Prefix of `text` holding at most `columns` code points.
std::string_view leadingColumns(std::string_view text, std::size_t columns) noexcept;

int allocateWidth(int totalWidth, int tabCount, const LayoutConfig &config) noexcept;

DisplayName padLabel(const std::string &label, int targetWidth);

} // namespace tabfit::layout
