#include "commands.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace salvo::cli;

void print_version() {
    std::cout << "Salvo CLI v" << SALVO_VERSION << "\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return static_cast<int>(Result::InvalidArgs);
    }

    std::string command = argv[1];

    if (command == "--version" || command == "-v") {
        print_version();
        return 0;
    }

    if (command == "help" || command == "--help" || command == "-h") {
        cmd_help();
        return 0;
    }

    if (command == "run") {
        if (argc < 3) {
            std::cerr << "Error: 'salvo run' requires a scenario file\n";
            std::cerr << "Usage: salvo run <scenario.json> [--ticks <n>] [--verbose]\n";
            return static_cast<int>(Result::InvalidArgs);
        }

        RunOptions options;
        for (int i = 3; i < argc; ++i) {
            if (std::strcmp(argv[i], "--ticks") == 0 && i + 1 < argc) {
                char* end = nullptr;
                long ticks = std::strtol(argv[++i], &end, 10);
                if (!end || *end != '\0' || ticks < 0) {
                    std::cerr << "Error: --ticks expects a non-negative integer\n";
                    return static_cast<int>(Result::InvalidArgs);
                }
                options.max_ticks = static_cast<uint32_t>(ticks);
            } else if (std::strcmp(argv[i], "--verbose") == 0) {
                options.verbose = true;
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                return static_cast<int>(Result::InvalidArgs);
            }
        }

        return static_cast<int>(cmd_run(argv[2], options));
    }

    if (command == "decode") {
        if (argc < 3) {
            std::cerr << "Error: 'salvo decode' requires an event file\n";
            return static_cast<int>(Result::InvalidArgs);
        }
        return static_cast<int>(cmd_decode(argv[2]));
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'salvo help' for usage information.\n";
    return static_cast<int>(Result::InvalidArgs);
}
