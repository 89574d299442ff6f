#include "app/CommandLine.hpp"
#include "gui_sdl/Application.hpp"
#include "gui_sdl/PlayScreen.hpp"

#include <cstdio>
#include <exception>
#include <memory>

int main(int argc, char** argv) {
    blockfall::app::CommandLine options;
    try {
        options = blockfall::app::parseCommandLine(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "blockfall_sdl: %s\n\n%s", e.what(),
                     blockfall::app::usage(argv[0]).c_str());
        return 1;
    }

    if (options.showHelp) {
        std::printf("%s", blockfall::app::usage(argv[0]).c_str());
        return 0;
    }

    blockfall::gui_sdl::Application app;
    if (!app.init("Blockfall", 420, 760)) {
        return 1;
    }

    try {
        app.setScreen(std::make_unique<blockfall::gui_sdl::PlayScreen>(options.config));
        return app.run();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "blockfall_sdl: %s\n", e.what());
        return 1;
    }
}
