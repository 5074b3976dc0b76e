// main.cpp - ScreenMu Capture entry point
// Screen, mic and camera in, chunks and pointer signals out.
//
//  ___  ___ _ __ ___  ___ _ __  _ __ ___  _   _
// / __|/ __| '__/ _ \/ _ \ '_ \| '_ ` _ \| | | |
// \__ \ (__| | |  __/  __/ | | | | | | | | |_| |
// |___/\___|_|  \___|\___|_| |_|_| |_| |_|\__,_|
//

#include "core/Application.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        smu::Application app(argc, argv);

        auto optsResult = app.parseArgs();
        if (!optsResult) {
            std::cerr << "Error: " << optsResult.error().message << "\n";
            std::cerr << "Try --help for usage information.\n";
            return 1;
        }

        auto opts = std::move(*optsResult);

        auto initResult = app.init(opts);
        if (!initResult) {
            std::cerr << "Initialization failed: " << initResult.error().message
                      << "\n";
            return 1;
        }

        return app.exec();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
