#include <gtest/gtest.h>

#include "tabfit/layout/tab_names.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

using tabfit::layout::allocateWidth;
using tabfit::layout::DisplayName;
using tabfit::layout::LayoutConfig;
using tabfit::layout::padLabel;
using tabfit::layout::recompute;
using tabfit::layout::Tab;
using tabfit::layout::TabKind;

namespace
{

LayoutConfig exampleConfig()
{
    LayoutConfig config;
    config.minWidth = 20;
    config.maxWidth = 300;
    config.fixedOverhead = 1;
    config.perTabOverhead = 1;
    return config;
}

LayoutConfig narrowConfig()
{
    LayoutConfig config;
    config.minWidth = 1;
    config.maxWidth = 300;
    config.fixedOverhead = 1;
    config.perTabOverhead = 1;
    return config;
}

std::vector<Tab> makeTabs(const std::vector<std::string> &labels, std::size_t current)
{
    std::vector<Tab> tabs;
    for (std::size_t i = 0; i < labels.size(); ++i)
    {
        Tab tab;
        tab.kind = i == current ? TabKind::Current : TabKind::Regular;
        tab.displayedName = DisplayName(labels[i]);
        tabs.push_back(tab);
    }
    return tabs;
}

class FakeHost : public tabfit::layout::TabHost
{
public:
    int columns = 80;
    std::vector<Tab> entries;
    std::string focused;
    int writes = 0;
    std::function<void()> onWrite;

    int frameColumns() const override { return columns; }
    std::vector<Tab> tabs() const override { return entries; }
    std::string currentBufferName() const override { return focused; }

    void setTabName(std::size_t index, const DisplayName &name) override
    {
        if (index >= entries.size())
            throw std::out_of_range("no such tab");
        entries[index].displayedName = name;
        ++writes;
        if (onWrite)
            onWrite();
    }
};

} // namespace

TEST(Recompute, SubstitutesCurrentTabForEmptyList)
{
    auto result = recompute({}, 40, exampleConfig(), []() { return std::string("*scratch*"); });
    EXPECT_TRUE(result.synthesized);
    ASSERT_EQ(result.tabs.size(), 1u);
    EXPECT_EQ(result.tabs[0].kind, TabKind::Current);
    ASSERT_TRUE(result.current.has_value());
    EXPECT_EQ(*result.current, padLabel("*scratch*", allocateWidth(40, 1, exampleConfig())));
}

TEST(Recompute, SharesOneTargetAcrossTabs)
{
    auto tabs = makeTabs({"main.rs", "lib.rs", "Cargo.toml"}, 1);
    auto result = recompute(tabs, 80, exampleConfig(), []() { return std::string("lib.rs"); });

    EXPECT_FALSE(result.synthesized);
    ASSERT_EQ(result.tabs.size(), 3u);
    for (const Tab &tab : result.tabs)
        EXPECT_EQ(tabfit::layout::columnCount(tab.displayedName.visible), 25u);
    EXPECT_EQ(result.tabs[0].displayedName.visible, std::string(9, ' ') + "main.rs" + std::string(9, ' '));
    ASSERT_TRUE(result.current.has_value());
    EXPECT_EQ(*result.current, result.tabs[1].displayedName);
    EXPECT_EQ(result.current->original.value_or(""), "lib.rs");
}

TEST(Recompute, RepeatedCallsAreStable)
{
    auto focused = []() { return std::string("lib.rs"); };
    auto first = recompute(makeTabs({"main.rs", "lib.rs", "Cargo.toml"}, 1), 80, exampleConfig(), focused);
    auto second = recompute(first.tabs, 80, exampleConfig(), focused);

    ASSERT_EQ(first.tabs.size(), second.tabs.size());
    for (std::size_t i = 0; i < first.tabs.size(); ++i)
        EXPECT_EQ(first.tabs[i].displayedName, second.tabs[i].displayedName);
    EXPECT_EQ(first.current, second.current);
}

TEST(Recompute, ShrinkingAndGrowingDoesNotDrift)
{
    auto focused = []() { return std::string("main.rs"); };
    auto wide = recompute(makeTabs({"main.rs", "lib.rs", "Cargo.toml"}, 0), 80, narrowConfig(), focused);
    auto narrow = recompute(wide.tabs, 20, narrowConfig(), focused);

    EXPECT_EQ(narrow.tabs[2].displayedName.visible, " Car\xE2\x80\xA6");
    EXPECT_EQ(narrow.tabs[2].displayedName.original.value_or(""), "Cargo.toml");

    auto restored = recompute(narrow.tabs, 80, narrowConfig(), focused);
    for (std::size_t i = 0; i < wide.tabs.size(); ++i)
        EXPECT_EQ(restored.tabs[i].displayedName, wide.tabs[i].displayedName);
}

TEST(Recompute, CurrentTabTracksFocusedBuffer)
{
    std::string focused = "main.rs";
    auto source = [&focused]() { return focused; };
    auto first = recompute(makeTabs({"main.rs", "notes.md"}, 0), 61, narrowConfig(), source);

    focused = "parser.rs";
    auto second = recompute(first.tabs, 61, narrowConfig(), source);
    EXPECT_EQ(second.current->original.value_or(""), "parser.rs");
    EXPECT_EQ(second.tabs[1].displayedName, first.tabs[1].displayedName);
}

TEST(Recompute, ListWithoutCurrentTabReportsNone)
{
    auto result = recompute(makeTabs({"a", "b"}, 5), 40, exampleConfig(), nullptr);
    EXPECT_FALSE(result.current.has_value());
    EXPECT_EQ(result.tabs[0].displayedName.original.value_or(""), "a");
}

TEST(TabNameSynchronizer, WritesEveryTabBackToHost)
{
    FakeHost host;
    host.entries = makeTabs({"main.rs", "lib.rs", "Cargo.toml"}, 2);
    host.focused = "Cargo.toml";

    tabfit::layout::TabNameSynchronizer names(host, exampleConfig);
    DisplayName current = names.recomputeAll();

    EXPECT_EQ(host.writes, 3);
    EXPECT_EQ(current, host.entries[2].displayedName);
    EXPECT_EQ(host.entries[0].displayedName.original.value_or(""), "main.rs");
    EXPECT_EQ(names.currentTabName(), current.visible);
}

TEST(TabNameSynchronizer, ReadsConfigurationOnEveryCall)
{
    FakeHost host;
    host.entries = makeTabs({"main.rs"}, 0);
    host.focused = "main.rs";

    LayoutConfig config = exampleConfig();
    int reads = 0;
    tabfit::layout::TabNameSynchronizer names(host, [&]() {
        ++reads;
        return config;
    });

    EXPECT_EQ(tabfit::layout::columnCount(names.recomputeAll().visible), 78u);
    config.maxWidth = 30;
    EXPECT_EQ(tabfit::layout::columnCount(names.recomputeAll().visible), 29u);
    EXPECT_EQ(reads, 2);
}

TEST(TabNameSynchronizer, EmptyHostIsNotWrittenTo)
{
    FakeHost host;
    host.focused = "*scratch*";
    tabfit::layout::TabNameSynchronizer names(host, exampleConfig);

    EXPECT_EQ(names.recomputeAll().original.value_or(""), "*scratch*");
    EXPECT_EQ(host.writes, 0);
}

TEST(TabNameSynchronizer, ReentrantCallReturnsDisplayedName)
{
    FakeHost host;
    host.entries = makeTabs({"main.rs", "lib.rs"}, 0);
    host.focused = "main.rs";

    int reads = 0;
    tabfit::layout::TabNameSynchronizer names(host, [&]() {
        ++reads;
        return exampleConfig();
    });

    std::vector<std::string> nested;
    host.onWrite = [&]() {
        EXPECT_TRUE(names.recomputing());
        nested.push_back(names.currentTabName());
    };

    DisplayName current = names.recomputeAll();
    EXPECT_EQ(reads, 1);
    ASSERT_EQ(nested.size(), 2u);
    EXPECT_EQ(nested.back(), current.visible);
    EXPECT_FALSE(names.recomputing());
}
