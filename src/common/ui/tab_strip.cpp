#include "tabfit/ui/tab_strip.hpp"

#include "tabfit/commands/tab_strip.hpp"

#include <algorithm>
#include <utility>

namespace tabfit::ui
{

namespace
{

constexpr int kTabRows = 2;

TRect pageBoundsFor(const TRect &bounds)
{
    TRect pageBounds = bounds;
    pageBounds.a.y = std::min(pageBounds.a.y + kTabRows, pageBounds.b.y);
    return pageBounds;
}

} // namespace

TabPageView::TabPageView(const TRect &bounds, std::string bufferName) noexcept
    : TGroup(bounds),
      m_bufferName(std::move(bufferName))
{
    growMode = gfGrowHiX | gfGrowHiY;
}

void TabPageView::setBufferName(std::string bufferName)
{
    m_bufferName = std::move(bufferName);
    drawView();
}

void TabPageView::draw()
{
    const int width = size.x;
    const int height = size.y;

    TDrawBuffer buffer;
    const ushort color = getColor(1);
    for (int row = 0; row < height; ++row)
    {
        buffer.moveChar(0, ' ', color, width);
        if (row == 1 && width > 2)
        {
            const std::string caption = "Buffer: " + m_bufferName;
            buffer.moveStr(2, caption.c_str(), color, width - 2);
        }
        writeLine(0, row, width, 1, buffer);
    }

    TGroup::draw();
}

TabStrip::TabStrip(const TRect &bounds, layout::LayoutConfigSource configSource)
    : TGroup(bounds),
      m_configSource(configSource),
      m_names(*this, std::move(configSource))
{
    growMode = gfGrowHiX | gfGrowHiY;
    options |= ofSelectable;
}

TabStrip::~TabStrip() = default;

TabPageView *TabStrip::createTab(const std::string &bufferName)
{
    auto *page = new TabPageView(pageBoundsFor(getExtent()), bufferName);
    layoutPage(*page);
    insert(page);
    page->hide();

    m_tabs.push_back(Entry{layout::DisplayName(bufferName), std::nullopt, page});
    selectTab(m_tabs.size() - 1);
    return page;
}

void TabStrip::closeTab(std::size_t index)
{
    if (index >= m_tabs.size())
        return;

    TabPageView *page = m_tabs[index].page;
    m_tabs.erase(m_tabs.begin() + static_cast<std::ptrdiff_t>(index));
    if (page)
    {
        remove(page);
        TObject::destroy(page);
    }

    if (m_tabs.empty())
    {
        m_current = 0;
        refreshNames();
        return;
    }

    if (m_current > index || m_current >= m_tabs.size())
        m_current = m_current == 0 ? 0 : m_current - 1;

    Entry &current = m_tabs[m_current];
    if (current.page)
    {
        layoutPage(*current.page);
        current.page->show();
        setCurrent(current.page, enterSelect);
    }
    refreshNames();
}

void TabStrip::renameTab(std::size_t index, const std::string &name)
{
    if (index >= m_tabs.size())
        return;

    Entry &entry = m_tabs[index];
    if (name.empty())
    {
        entry.explicitName.reset();
        entry.name = layout::DisplayName(entry.page ? entry.page->bufferName() : std::string());
    }
    else
    {
        entry.explicitName = name;
        entry.name = layout::DisplayName(name);
    }
    refreshNames();
}

void TabStrip::switchBuffer(const std::string &bufferName)
{
    if (m_current >= m_tabs.size() || !m_tabs[m_current].page)
        return;
    m_tabs[m_current].page->setBufferName(bufferName);
    refreshNames();
}

void TabStrip::refreshNames()
{
    m_names.recomputeAll();
    drawView();
}

void TabStrip::selectTab(std::size_t index)
{
    if (index >= m_tabs.size())
        return;

    if (m_current < m_tabs.size() && m_current != index)
    {
        if (TabPageView *page = m_tabs[m_current].page)
            page->hide();
    }

    m_current = index;

    if (TabPageView *page = m_tabs[m_current].page)
    {
        layoutPage(*page);
        page->show();
        setCurrent(page, enterSelect);
    }
    refreshNames();
}

void TabStrip::nextTab()
{
    if (m_tabs.empty())
        return;
    selectTab((m_current + 1) % m_tabs.size());
}

void TabStrip::previousTab()
{
    if (m_tabs.empty())
        return;
    selectTab(m_current == 0 ? m_tabs.size() - 1 : m_current - 1);
}

std::size_t TabStrip::currentIndex() const noexcept
{
    return m_current;
}

std::size_t TabStrip::tabCount() const noexcept
{
    return m_tabs.size();
}

std::optional<std::string> TabStrip::explicitName(std::size_t index) const
{
    if (index >= m_tabs.size())
        return std::nullopt;
    return m_tabs[index].explicitName;
}

int TabStrip::frameColumns() const
{
    return size.x;
}

std::vector<layout::Tab> TabStrip::tabs() const
{
    std::vector<layout::Tab> result;
    result.reserve(m_tabs.size());
    for (std::size_t i = 0; i < m_tabs.size(); ++i)
    {
        layout::Tab tab;
        tab.kind = i == m_current ? layout::TabKind::Current : layout::TabKind::Regular;
        tab.explicitName = m_tabs[i].explicitName;
        tab.displayedName = m_tabs[i].name;
        result.push_back(std::move(tab));
    }
    return result;
}

std::string TabStrip::currentBufferName() const
{
    if (m_current >= m_tabs.size() || !m_tabs[m_current].page)
        return std::string();
    return m_tabs[m_current].page->bufferName();
}

void TabStrip::setTabName(std::size_t index, const layout::DisplayName &name)
{
    if (index < m_tabs.size())
        m_tabs[index].name = name;
}

void TabStrip::handleEvent(TEvent &event)
{
    if (event.what == evCommand)
    {
        switch (event.message.command)
        {
        case commands::TabNext:
            nextTab();
            clearEvent(event);
            return;
        case commands::TabPrevious:
            previousTab();
            clearEvent(event);
            return;
        case commands::TabClose:
            closeTab(m_current);
            clearEvent(event);
            return;
        default:
            break;
        }
    }
    else if (event.what == evKeyDown)
    {
        if (event.keyDown.keyCode == kbCtrlTab)
        {
            nextTab();
            clearEvent(event);
            return;
        }
        if (event.keyDown.keyCode == (kbCtrlShift | kbTab))
        {
            previousTab();
            clearEvent(event);
            return;
        }
    }

    TGroup::handleEvent(event);
}

void TabStrip::draw()
{
    const int width = size.x;
    const layout::LayoutConfig config = m_configSource ? m_configSource() : layout::LayoutConfig{};

    TDrawBuffer buffer;
    const ushort baseColor = getColor(1);
    const ushort highlightColor = getColor(2);

    buffer.moveChar(0, ' ', baseColor, width);
    int x = std::max(config.fixedOverhead, 0);
    for (std::size_t i = 0; i < m_tabs.size() && x < width; ++i)
    {
        const std::string &text = m_tabs[i].name.visible;
        const ushort color = i == m_current ? highlightColor : baseColor;
        buffer.moveStr(x, text.c_str(), color, width - x);
        x += static_cast<int>(layout::columnCount(text));

        if (config.perTabOverhead > 0 && x < width)
            buffer.moveChar(x, '\xB3', baseColor, 1);
        x += std::max(config.perTabOverhead, 0);
    }
    writeLine(0, 0, width, 1, buffer);

    buffer.moveChar(0, '\xCD', baseColor, width);
    writeLine(0, 1, width, 1, buffer);

    TGroup::draw();
}

void TabStrip::changeBounds(const TRect &bounds)
{
    TGroup::changeBounds(bounds);
    updatePagesBounds();
    refreshNames();
}

void TabStrip::shutDown()
{
    m_tabs.clear();
    TGroup::shutDown();
}

void TabStrip::layoutPage(TabPageView &page)
{
    page.locate(pageBoundsFor(getExtent()));
}

void TabStrip::updatePagesBounds()
{
    for (auto &tab : m_tabs)
    {
        if (tab.page)
            layoutPage(*tab.page);
    }
}

} // namespace tabfit::ui
