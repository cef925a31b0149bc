#pragma once

#include "tabfit/options.hpp"
#include "tabfit/ui/tab_strip.hpp"

#define Uses_TApplication
#define Uses_TMenuBar
#define Uses_TStatusLine
#define Uses_TWindow
#include <tvision/tv.h>

#include <memory>

namespace tabfit::tool
{

class TabWindow : public TWindow
{
public:
    TabWindow(const TRect &bounds, layout::LayoutConfigSource configSource);

    ui::TabStrip &strip() noexcept { return *m_strip; }

private:
    ui::TabStrip *m_strip = nullptr;
};

class TabfitApp : public TApplication
{
public:
    TabfitApp(int argc, char **argv);

    void handleEvent(TEvent &event) override;

    static TMenuBar *initMenuBar(TRect r);
    static TStatusLine *initStatusLine(TRect r);

private:
    void newTab();
    void renameTab();
    void switchBuffer();
    void editLayoutSettings();

    std::shared_ptr<config::OptionRegistry> m_registry;
    TabWindow *m_window = nullptr;
    int m_nextBuffer = 1;
};

} // namespace tabfit::tool
