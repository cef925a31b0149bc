#include "tabfit/layout/tab_names.hpp"

#include <algorithm>
#include <utility>

namespace tabfit::layout
{

RecomputeResult recompute(std::vector<Tab> tabs, int width, const LayoutConfig &config,
                          const CurrentLabelSource &currentLabel)
{
    RecomputeResult result;
    if (tabs.empty())
    {
        Tab current;
        current.kind = TabKind::Current;
        tabs.push_back(std::move(current));
        result.synthesized = true;
    }

    std::vector<std::string> labels;
    labels.reserve(tabs.size());
    for (const Tab &tab : tabs)
        labels.push_back(trueLabel(tab, currentLabel));

    const int target = allocateWidth(width, static_cast<int>(tabs.size()), config);

    for (std::size_t i = 0; i < tabs.size(); ++i)
    {
        tabs[i].displayedName = padLabel(labels[i], target);
        if (tabs[i].kind == TabKind::Current && !result.current)
            result.current = tabs[i].displayedName;
    }

    result.tabs = std::move(tabs);
    return result;
}

TabNameSynchronizer::TabNameSynchronizer(TabHost &host, LayoutConfigSource configSource)
    : m_host(host),
      m_configSource(std::move(configSource))
{
}

DisplayName TabNameSynchronizer::recomputeAll()
{
    if (m_recomputing)
        return displayedCurrent();

    struct Guard
    {
        bool &flag;
        explicit Guard(bool &f) : flag(f) { flag = true; }
        ~Guard() { flag = false; }
    } guard(m_recomputing);

    const LayoutConfig config = m_configSource ? m_configSource() : LayoutConfig{};
    RecomputeResult result = recompute(m_host.tabs(), m_host.frameColumns(), config,
                                       [this]() { return m_host.currentBufferName(); });

    if (!result.synthesized)
    {
        for (std::size_t i = 0; i < result.tabs.size(); ++i)
            m_host.setTabName(i, result.tabs[i].displayedName);
    }

    return result.current.value_or(DisplayName());
}

std::string TabNameSynchronizer::currentTabName()
{
    return recomputeAll().visible;
}

DisplayName TabNameSynchronizer::displayedCurrent() const
{
    const std::vector<Tab> tabs = m_host.tabs();
    auto it = std::find_if(tabs.begin(), tabs.end(), [](const Tab &tab) { return tab.kind == TabKind::Current; });
    if (it == tabs.end())
        return DisplayName(m_host.currentBufferName());
    return it->displayedName;
}

} // namespace tabfit::layout
