#pragma once
#include <string>

namespace core {

enum class OutputFormat { Text, Json };

// Process-wide run options for the console tools.
struct Config {
    bool verbose = false;
    int threads = 0;                          // 0 = hardware concurrency
    OutputFormat output = OutputFormat::Text;
};

// Snapshot of the current options, initialised once from the environment
// (VOICECHECK_DEBUG, VOICECHECK_THREADS).
Config get_config();

// Command-line overrides.
void set_config(const Config& config);

// Parses "text" / "json". Returns false for anything else.
bool parse_output_format(const std::string& s, OutputFormat& out);
}
