#include <iostream>
#include <string>

#include "app/RefSifterApp.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace refsifter;

int main(int argc, char* argv[]) {
    std::string error;
    auto options = app::RefSifterApp::ParseArguments(argc, argv, error);
    if (!options) {
        std::cerr << "refsifter: " << error << "\n" << app::RefSifterApp::Usage(argv[0]);
        return 1;
    }
    if (options->showHelp) {
        std::cout << app::RefSifterApp::Usage(argv[0]);
        return 0;
    }

    auto settings = infrastructure::ConfigLoader::Load(options->configPath);
    settings = app::RefSifterApp::ApplyOverrides(settings, *options);

    app::RefSifterApp application(settings);
    return application.run(*options);
}
