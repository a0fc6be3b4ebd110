#pragma once

#include <cstdint>
#include <string>

namespace salvo::cli {

// Command result codes
enum class Result {
    Success = 0,
    InvalidArgs = 1,
    FileError = 2,
    ParseError = 3,
    RuntimeError = 4
};

struct RunOptions {
    uint32_t max_ticks = 0;     // 0 = until the scenario ends
    bool verbose = false;       // Print every damage event
};

// salvo run <scenario.json> [--ticks N] [--verbose]
// Runs a headless scenario and prints what happened
Result cmd_run(const std::string& scenario_path, const RunOptions& options);

// salvo decode <event.json>
// Validates a spawn event and prints it in normalized form
Result cmd_decode(const std::string& event_path);

// salvo help
// Prints help information
void cmd_help();

} // namespace salvo::cli
