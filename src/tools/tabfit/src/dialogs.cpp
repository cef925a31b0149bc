#include "dialogs.hpp"

#include "tabfit/layout/layout_options.hpp"
#include "tabfit/tool/cli.hpp"

#include <cstdio>
#include <string>

#define Uses_TButton
#define Uses_TDialog
#define Uses_TInputLine
#define Uses_TLabel
#define Uses_TProgram
#define Uses_TStaticText
#define Uses_MsgBox
#include <tvision/tv.h>

namespace tabfit::tool
{

std::optional<std::string> promptForText(const char *title, const char *label, const std::string &initial)
{
    struct Data
    {
        char text[256]{};
    } data{};
    std::snprintf(data.text, sizeof(data.text), "%s", initial.c_str());

    auto *dialog = new TDialog(TRect(0, 0, 50, 8), title);
    dialog->options |= ofCentered;

    auto *input = new TInputLine(TRect(3, 3, 47, 4), sizeof(data.text) - 1);
    dialog->insert(new TLabel(TRect(2, 2, 47, 3), label, input));
    dialog->insert(input);

    dialog->insert(new TButton(TRect(13, 5, 23, 7), "O~K~", cmOK, bfDefault));
    dialog->insert(new TButton(TRect(26, 5, 36, 7), "Cancel", cmCancel, bfNormal));
    dialog->selectNext(false);

    unsigned short result = TProgram::application->executeDialog(dialog, &data);
    if (result != cmOK)
        return std::nullopt;
    return std::string(data.text);
}

bool editLayoutConfig(layout::LayoutConfig &config)
{
    struct Data
    {
        char minWidth[16]{};
        char maxWidth[16]{};
        char fixedOverhead[16]{};
        char perTabOverhead[16]{};
    } data{};
    std::snprintf(data.minWidth, sizeof(data.minWidth), "%d", config.minWidth);
    std::snprintf(data.maxWidth, sizeof(data.maxWidth), "%d", config.maxWidth);
    std::snprintf(data.fixedOverhead, sizeof(data.fixedOverhead), "%d", config.fixedOverhead);
    std::snprintf(data.perTabOverhead, sizeof(data.perTabOverhead), "%d", config.perTabOverhead);

    auto *dialog = new TDialog(TRect(0, 0, 46, 15), "Tab Layout");
    dialog->options |= ofCentered;

    // Fields are inserted in the order of Data so executeDialog can fill them.
    constexpr int kFieldLength = sizeof(Data::minWidth) - 1;
    auto addField = [&](int row, const char *caption) {
        auto *input = new TInputLine(TRect(24, row, 36, row + 1), kFieldLength);
        dialog->insert(input);
        dialog->insert(new TLabel(TRect(3, row, 23, row + 1), caption, input));
    };
    addField(2, "M~i~nimum width:");
    addField(4, "M~a~ximum width:");
    addField(6, "~F~ixed overhead:");
    addField(8, "~P~er-tab overhead:");

    dialog->insert(new TStaticText(TRect(3, 10, 43, 11), "Widths and overheads are in columns."));
    dialog->insert(new TButton(TRect(10, 12, 20, 14), "O~K~", cmOK, bfDefault));
    dialog->insert(new TButton(TRect(24, 12, 34, 14), "Cancel", cmCancel, bfNormal));
    dialog->selectNext(false);

    unsigned short result = TProgram::application->executeDialog(dialog, &data);
    if (result != cmOK)
        return false;

    auto minWidth = parseIntegerArgument(data.minWidth);
    auto maxWidth = parseIntegerArgument(data.maxWidth);
    auto fixedOverhead = parseIntegerArgument(data.fixedOverhead);
    auto perTabOverhead = parseIntegerArgument(data.perTabOverhead);
    if (!minWidth || !maxWidth || !fixedOverhead || !perTabOverhead)
    {
        messageBox("Every layout setting must be a whole number.", mfError | mfOKButton);
        return false;
    }

    layout::LayoutConfig edited;
    edited.minWidth = *minWidth;
    edited.maxWidth = *maxWidth;
    edited.fixedOverhead = *fixedOverhead;
    edited.perTabOverhead = *perTabOverhead;
    if (!layout::withinBounds(edited))
    {
        messageBox("Widths must be at least 1 and overheads at least 0 (at most 65535 columns).",
                   mfError | mfOKButton);
        return false;
    }

    config = edited;
    return true;
}

} // namespace tabfit::tool
