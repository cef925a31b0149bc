#include <gtest/gtest.h>

#include "tabfit/layout/tab_layout.hpp"

#include <limits>
#include <string>

using tabfit::layout::allocateWidth;
using tabfit::layout::columnCount;
using tabfit::layout::LayoutConfig;
using tabfit::layout::padLabel;

namespace
{

LayoutConfig makeConfig(int minWidth, int maxWidth, int fixedOverhead, int perTabOverhead)
{
    LayoutConfig config;
    config.minWidth = minWidth;
    config.maxWidth = maxWidth;
    config.fixedOverhead = fixedOverhead;
    config.perTabOverhead = perTabOverhead;
    return config;
}

} // namespace

TEST(AllocateWidth, DividesAvailableColumnsEvenly)
{
    EXPECT_EQ(allocateWidth(80, 3, makeConfig(20, 300, 1, 1)), 25);
    EXPECT_EQ(allocateWidth(81, 4, makeConfig(1, 300, 1, 0)), 20);
}

TEST(AllocateWidth, ClampsToConfiguredBounds)
{
    EXPECT_EQ(allocateWidth(30, 3, makeConfig(20, 300, 1, 1)), 19);
    EXPECT_EQ(allocateWidth(1000, 1, makeConfig(20, 300, 0, 0)), 300);
    EXPECT_EQ(allocateWidth(1000, 1, makeConfig(20, 300, 0, 4)), 296);
}

TEST(AllocateWidth, ToleratesDegenerateConfiguration)
{
    // Overhead larger than the frame leaves one column to share out.
    EXPECT_EQ(allocateWidth(5, 1, makeConfig(1, 300, 10, 0)), 1);
    EXPECT_EQ(allocateWidth(0, 7, makeConfig(1, 300, 0, 0)), 1);
    // Per-tab overhead above the clamped width passes through as non-positive.
    EXPECT_EQ(allocateWidth(10, 1, makeConfig(1, 2, 0, 5)), -3);
    // A zero tab count is treated as a single tab.
    EXPECT_EQ(allocateWidth(41, 0, makeConfig(1, 300, 1, 0)), 40);
}

TEST(AllocateWidth, ExtremeOverheadsDoNotOverflow)
{
    constexpr int kIntMin = std::numeric_limits<int>::min();
    constexpr int kIntMax = std::numeric_limits<int>::max();

    // 80 - INT_MIN leaves far more than the maximum per tab.
    EXPECT_EQ(allocateWidth(80, 3, makeConfig(20, 300, kIntMin, 1)), 299);
    EXPECT_EQ(allocateWidth(80, 3, makeConfig(20, 300, 1, kIntMin)), kIntMax);
    EXPECT_EQ(allocateWidth(80, 3, makeConfig(-5, -5, 1, kIntMax)), kIntMin);
    EXPECT_EQ(allocateWidth(kIntMin, 1, makeConfig(1, 300, kIntMax, 0)), 1);
    EXPECT_EQ(allocateWidth(kIntMax, 1, makeConfig(1, kIntMax, kIntMin, 0)), kIntMax);
}

TEST(AllocateWidth, ConservesWidthWhenUnclamped)
{
    const LayoutConfig config = makeConfig(1, 1000, 3, 2);
    for (int width = 4; width <= 240; ++width)
    {
        for (int count = 1; count <= 8; ++count)
        {
            const int computed = (width - config.fixedOverhead) / count;
            if (computed < config.minWidth || computed > config.maxWidth)
                continue;
            const int target = allocateWidth(width, count, config);
            EXPECT_LE(target * count + config.fixedOverhead, width) << width << "/" << count;
            EXPECT_LE((target + config.perTabOverhead) * count + config.fixedOverhead, width)
                << width << "/" << count;
        }
    }
}

TEST(AllocateWidth, ClampingToMinimumOverflowsTheFrame)
{
    const LayoutConfig config = makeConfig(20, 300, 1, 1);
    const int target = allocateWidth(40, 4, config);
    EXPECT_EQ(target, 19);
    EXPECT_GT((target + config.perTabOverhead) * 4 + config.fixedOverhead, 40);
}

TEST(PadLabel, CentersShortLabel)
{
    auto name = padLabel("main.rs", 25);
    EXPECT_EQ(name.visible, std::string(9, ' ') + "main.rs" + std::string(9, ' '));
    ASSERT_TRUE(name.original.has_value());
    EXPECT_EQ(*name.original, "main.rs");
    EXPECT_EQ(name.leadingPad, 9);
    EXPECT_EQ(name.trailingPad, 9);
}

TEST(PadLabel, RightSideTakesOddColumn)
{
    auto name = padLabel("abcd", 9);
    EXPECT_EQ(name.visible, "  abcd   ");
    EXPECT_EQ(name.leadingPad, 2);
    EXPECT_EQ(name.trailingPad, 3);
}

TEST(PadLabel, PaddingFillsTargetExactly)
{
    const std::string labels[] = {"", "a", "main.rs", "Cargo.toml", "src/lib.rs"};
    for (const std::string &label : labels)
    {
        const int length = static_cast<int>(label.size());
        for (int width = length + 2; width <= length + 30; ++width)
        {
            auto name = padLabel(label, width);
            EXPECT_EQ(name.leadingPad + length + name.trailingPad, width);
            EXPECT_EQ(static_cast<int>(columnCount(name.visible)), width);
            const int difference = name.trailingPad - name.leadingPad;
            EXPECT_TRUE(difference == 0 || difference == 1) << label << " at " << width;
        }
    }
}

TEST(PadLabel, TruncatesLongLabelWithEllipsis)
{
    auto name = padLabel("a-very-long-buffer-name.txt", 10);
    EXPECT_EQ(name.visible, " a-very-l\xE2\x80\xA6");
    EXPECT_EQ(columnCount(name.visible), 10u);
    ASSERT_TRUE(name.original.has_value());
    EXPECT_EQ(*name.original, "a-very-long-buffer-name.txt");
    EXPECT_EQ(name.leadingPad, 1);
    EXPECT_EQ(name.trailingPad, 0);
}

TEST(PadLabel, BoundaryBelongsToPadding)
{
    // length + 2 == width pads; one column less truncates.
    EXPECT_EQ(padLabel("abc", 5).visible, " abc ");
    EXPECT_EQ(padLabel("abc", 4).visible, " ab\xE2\x80\xA6");
    EXPECT_EQ(padLabel("abcdef", 8).visible, " abcdef ");
    EXPECT_EQ(padLabel("abcdef", 7).visible, " abcde\xE2\x80\xA6");
}

TEST(PadLabel, TinyTargetsStillProduceText)
{
    EXPECT_EQ(padLabel("hello", 3).visible, " h\xE2\x80\xA6");
    EXPECT_EQ(padLabel("hello", 2).visible, " \xE2\x80\xA6");
    EXPECT_EQ(padLabel("hello", 1).visible, " \xE2\x80\xA6");
    EXPECT_EQ(padLabel("hello", 0).visible, " \xE2\x80\xA6");
    EXPECT_EQ(padLabel("hello", -5).visible, " \xE2\x80\xA6");
    EXPECT_EQ(padLabel("", -5).visible, " \xE2\x80\xA6");
    EXPECT_EQ(*padLabel("hello", -5).original, "hello");
}

TEST(PadLabel, CountsCodePointsNotBytes)
{
    auto padded = padLabel("\xC3\xBC" "ber", 8);
    EXPECT_EQ(padded.visible, "  \xC3\xBC" "ber  ");

    auto truncated = padLabel("\xC3\xBC" "berlange-name", 6);
    EXPECT_EQ(truncated.visible, " \xC3\xBC" "ber\xE2\x80\xA6");
    EXPECT_EQ(columnCount(truncated.visible), 6u);
}

TEST(ColumnHelpers, TakeWholeCodePoints)
{
    EXPECT_EQ(columnCount(""), 0u);
    EXPECT_EQ(columnCount("\xE2\x80\xA6"), 1u);
    EXPECT_EQ(tabfit::layout::leadingColumns("\xC3\xA9t\xC3\xA9", 2), "\xC3\xA9t");
    EXPECT_EQ(tabfit::layout::leadingColumns("abc", 0), "");
    EXPECT_EQ(tabfit::layout::leadingColumns("abc", 10), "abc");
}
