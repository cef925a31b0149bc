#include "tabfit/layout/label_registry.hpp"

namespace tabfit::layout
{

namespace
{

std::string markedOrVerbatim(const DisplayName &name)
{
    if (name.original)
        return *name.original;
    return name.visible;
}

} // namespace

std::string trueLabel(const Tab &tab, const CurrentLabelSource &currentLabel)
{
    // A renamed tab keeps the name as last typed, even once the host's own
    // copy has gone stale.
    if (tab.explicitName)
        return markedOrVerbatim(tab.displayedName);

    // The current tab's label is a view of the focused buffer and is fetched
    // again on every pass.
    if (tab.kind == TabKind::Current)
        return currentLabel ? currentLabel() : std::string();

    return markedOrVerbatim(tab.displayedName);
}

} // namespace tabfit::layout
