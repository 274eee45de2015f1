#include "core/config.hpp"
#include "core/logging.hpp"
#include <cstdlib>
#include <mutex>

namespace core {
namespace {
Config from_environment() {
    Config c;
    c.verbose = std::getenv("VOICECHECK_DEBUG") != nullptr;
    if (const char* t = std::getenv("VOICECHECK_THREADS")) {
        int n = std::atoi(t);
        if (n > 0) c.threads = n;
        else log_warn(std::string("ignoring VOICECHECK_THREADS=") + t);
    }
    return c;
}

std::mutex g_config_mutex;
Config& instance() {
    static Config config = from_environment();
    return config;
}
} // namespace

Config get_config() {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    return instance();
}

void set_config(const Config& config) {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    instance() = config;
    set_verbose(config.verbose);
}

bool parse_output_format(const std::string& s, OutputFormat& out) {
    if (s == "text") { out = OutputFormat::Text; return true; }
    if (s == "json") { out = OutputFormat::Json; return true; }
    return false;
}
}
