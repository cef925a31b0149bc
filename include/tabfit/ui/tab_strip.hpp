#pragma once

#include "tabfit/layout/tab_names.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#define Uses_TView
#define Uses_TGroup
#define Uses_TPoint
#define Uses_TDrawBuffer
#define Uses_TEvent
#define Uses_TRect
#define Uses_TKeys
#include <tvision/tv.h>

namespace tabfit::ui
{

class TabPageView : public TGroup
{
public:
    TabPageView(const TRect &bounds, std::string bufferName) noexcept;

    const std::string &bufferName() const noexcept { return m_bufferName; }
    void setBufferName(std::string bufferName);

    void draw() override;

private:
    std::string m_bufferName;
};

// Tab row plus page area. The tab row shows names fitted to the strip width;
// every event that changes the tabs or the width refits all of them.
class TabStrip : public TGroup, public layout::TabHost
{
public:
    TabStrip(const TRect &bounds, layout::LayoutConfigSource configSource);

    ~TabStrip() override;

    TabPageView *createTab(const std::string &bufferName);
    void closeTab(std::size_t index);
    void renameTab(std::size_t index, const std::string &name);
    void switchBuffer(const std::string &bufferName);
    void refreshNames();

    void selectTab(std::size_t index);
    void nextTab();
    void previousTab();
    std::size_t currentIndex() const noexcept;
    std::size_t tabCount() const noexcept;
    std::optional<std::string> explicitName(std::size_t index) const;

    int frameColumns() const override;
    std::vector<layout::Tab> tabs() const override;
    std::string currentBufferName() const override;
    void setTabName(std::size_t index, const layout::DisplayName &name) override;

    void handleEvent(TEvent &event) override;
    void draw() override;
    void changeBounds(const TRect &bounds) override;
    void shutDown() override;

private:
    struct Entry
    {
        layout::DisplayName name;
        std::optional<std::string> explicitName;
        TabPageView *page = nullptr;
    };

    void layoutPage(TabPageView &page);
    void updatePagesBounds();

    std::vector<Entry> m_tabs;
    std::size_t m_current = 0;
    layout::LayoutConfigSource m_configSource;
    layout::TabNameSynchronizer m_names;
};

} // namespace tabfit::ui
