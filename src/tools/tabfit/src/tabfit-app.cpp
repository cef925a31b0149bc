#include "tabfit_app.hpp"

#include "tabfit/layout/layout_options.hpp"
#include "tabfit/tool/cli.hpp"

#include <iostream>
#include <string_view>
#include <vector>

int main(int argc, char **argv)
{
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    tabfit::tool::ParseResult parsed = tabfit::tool::parseArguments(args);
    if (!parsed.ok())
    {
        std::cerr << "tabfit: " << parsed.error << std::endl;
        std::cerr << "Try 'tabfit --help' for more information." << std::endl;
        return 1;
    }

    if (tabfit::tool::wantsCommandLine(parsed.options))
    {
        tabfit::config::OptionRegistry registry(tabfit::layout::kAppId);
        tabfit::layout::registerLayoutOptions(registry);
        registry.loadDefaults();
        return tabfit::tool::runCommandLine(parsed.options, registry, std::cout, std::cerr);
    }

    tabfit::tool::TabfitApp app(argc, argv);
    app.run();
    app.shutDown();
    return 0;
}
