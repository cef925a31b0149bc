#include "tabfit_app.hpp"

#include "dialogs.hpp"

#include "tabfit/commands/tab_strip.hpp"
#include "tabfit/layout/layout_options.hpp"

#define Uses_TDeskTop
#define Uses_TKeys
#define Uses_TMenu
#define Uses_TMenuItem
#define Uses_TStatusDef
#define Uses_TStatusItem
#define Uses_TSubMenu
#define Uses_MsgBox
#include <tvision/tv.h>

#include <string>
#include <utility>

namespace tabfit::tool
{

namespace
{

std::string bufferLabel(int number)
{
    if (number == 1)
        return "*scratch*";
    return "buffer-" + std::to_string(number) + ".txt";
}

} // namespace

TabWindow::TabWindow(const TRect &bounds, layout::LayoutConfigSource configSource)
    : TWindowInit(&TWindow::initFrame),
      TWindow(bounds, "Tabs", wnNoNumber)
{
    TRect interior = getExtent();
    interior.grow(-1, -1);
    m_strip = new ui::TabStrip(interior, std::move(configSource));
    insert(m_strip);
}

TabfitApp::TabfitApp(int argc, char **argv)
    : TProgInit(&TabfitApp::initStatusLine, &TabfitApp::initMenuBar, &TApplication::initDeskTop),
      m_registry(std::make_shared<config::OptionRegistry>(layout::kAppId))
{
    (void)argc;
    (void)argv;

    layout::registerLayoutOptions(*m_registry);
    m_registry->loadDefaults();

    TRect bounds = deskTop->getExtent();
    std::shared_ptr<config::OptionRegistry> registry = m_registry;
    m_window = new TabWindow(bounds, [registry]() { return layout::layoutConfigFrom(*registry); });
    deskTop->insert(m_window);

    newTab();
    newTab();
    newTab();
    m_window->strip().selectTab(0);
}

void TabfitApp::handleEvent(TEvent &event)
{
    TApplication::handleEvent(event);
    if (event.what != evCommand)
        return;

    switch (event.message.command)
    {
    case commands::TabNew:
        newTab();
        clearEvent(event);
        break;
    case commands::TabRename:
        renameTab();
        clearEvent(event);
        break;
    case commands::SwitchBuffer:
        switchBuffer();
        clearEvent(event);
        break;
    case commands::LayoutSettings:
        editLayoutSettings();
        clearEvent(event);
        break;
    case commands::TabNext:
    case commands::TabPrevious:
    case commands::TabClose:
        if (m_window)
            m_window->strip().handleEvent(event);
        break;
    default:
        break;
    }
}

TMenuBar *TabfitApp::initMenuBar(TRect r)
{
    r.b.y = r.a.y + 1;
    return new TMenuBar(r,
                        *new TSubMenu("~T~abs", kbAltT) +
                            *new TMenuItem("~N~ew Tab", commands::TabNew, kbCtrlN, hcNoContext, "Ctrl-N") +
                            *new TMenuItem("~C~lose Tab", commands::TabClose, kbCtrlW, hcNoContext, "Ctrl-W") +
                            *new TMenuItem("~R~ename Tab...", commands::TabRename, kbF2, hcNoContext, "F2") +
                            *new TMenuItem("Switch ~B~uffer...", commands::SwitchBuffer, kbCtrlB, hcNoContext,
                                           "Ctrl-B") +
                            newLine() +
                            *new TMenuItem("Nex~t~ Tab", commands::TabNext, kbNoKey, hcNoContext, "Ctrl-Tab") +
                            *new TMenuItem("~P~revious Tab", commands::TabPrevious, kbNoKey) +
                            newLine() +
                            *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext, "Alt-X") +
                        *new TSubMenu("~O~ptions", kbAltO) +
                            *new TMenuItem("~L~ayout...", commands::LayoutSettings, kbNoKey));
}

TStatusLine *TabfitApp::initStatusLine(TRect r)
{
    r.a.y = r.b.y - 1;
    return new TStatusLine(r,
                           *new TStatusDef(0, 0xFFFF) +
                               *new TStatusItem("~Alt-X~ Exit", kbAltX, cmQuit) +
                               *new TStatusItem("~Ctrl-N~ New", kbCtrlN, commands::TabNew) +
                               *new TStatusItem("~F2~ Rename", kbF2, commands::TabRename) +
                               *new TStatusItem("~Ctrl-W~ Close", kbCtrlW, commands::TabClose));
}

void TabfitApp::newTab()
{
    if (!m_window)
        return;
    m_window->strip().createTab(bufferLabel(m_nextBuffer++));
}

void TabfitApp::renameTab()
{
    if (!m_window || m_window->strip().tabCount() == 0)
        return;
    ui::TabStrip &strip = m_window->strip();
    const std::size_t index = strip.currentIndex();
    auto name = promptForText("Rename Tab", "~N~ame (empty to reset):", strip.explicitName(index).value_or(std::string()));
    if (name)
        strip.renameTab(index, *name);
}

void TabfitApp::switchBuffer()
{
    if (!m_window || m_window->strip().tabCount() == 0)
        return;
    ui::TabStrip &strip = m_window->strip();
    auto name = promptForText("Switch Buffer", "~B~uffer:", strip.currentBufferName());
    if (!name)
        return;
    if (name->empty())
    {
        messageBox("Buffer name cannot be empty", mfError | mfOKButton);
        return;
    }
    strip.switchBuffer(*name);
}

void TabfitApp::editLayoutSettings()
{
    layout::LayoutConfig current = layout::layoutConfigFrom(*m_registry);
    if (!editLayoutConfig(current))
        return;

    layout::storeLayoutConfig(*m_registry, current);
    if (!m_registry->saveDefaults())
        messageBox("Could not save layout defaults", mfWarning | mfOKButton);
    if (m_window)
        m_window->strip().refreshNames();
}

} // namespace tabfit::tool
