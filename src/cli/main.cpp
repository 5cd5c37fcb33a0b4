// File: src/cli/main.cpp
//
// Entry point of the LREC lifecycle simulator

#include "cli/lifecycle_cli.hpp"
#include "cli/cli_config.hpp"
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    lrec::CliConfig config = lrec::CliConfig::Default();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            auto loaded = lrec::CliConfig::LoadFromFile(argv[++i]);
            if (!loaded) {
                return 1;
            }
            config = *loaded;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [--config <file.yaml>]\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    try {
        lrec::LifecycleCli cli(config);
        cli.Run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
