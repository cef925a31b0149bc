#pragma once

#include "tabfit/layout/label_registry.hpp"
#include "tabfit/layout/tab_layout.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tabfit::layout
{

struct RecomputeResult
{
    std::vector<Tab> tabs;
    std::optional<DisplayName> current;
    // True when an empty tab list was replaced by the untracked current tab.
    bool synthesized = false;
};

RecomputeResult recompute(std::vector<Tab> tabs, int width, const LayoutConfig &config,
                          const CurrentLabelSource &currentLabel);

// What the core needs from the environment that owns the tabs.
class TabHost
{
public:
    virtual ~TabHost() = default;

    virtual int frameColumns() const = 0;
    virtual std::vector<Tab> tabs() const = 0;
    virtual std::string currentBufferName() const = 0;
    virtual void setTabName(std::size_t index, const DisplayName &name) = 0;
};

using LayoutConfigSource = std::function<LayoutConfig()>;

// Entry points a host wires into its resize, rename and naming hooks.
class TabNameSynchronizer
{
public:
    TabNameSynchronizer(TabHost &host, LayoutConfigSource configSource);

    DisplayName recomputeAll();
    std::string currentTabName();

    bool recomputing() const noexcept { return m_recomputing; }

private:
    DisplayName displayedCurrent() const;

    TabHost &m_host;
    LayoutConfigSource m_configSource;
    bool m_recomputing = false;
};

} // namespace tabfit::layout
