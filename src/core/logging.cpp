#include "core/logging.hpp"
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace core {
namespace {
std::mutex g_log_mutex;
std::atomic<bool> g_verbose{std::getenv("VOICECHECK_DEBUG") != nullptr};

// Worker threads log concurrently; keep each line whole.
void write_line(std::ostream& os, const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    os << tag << ' ' << msg << std::endl;
}
} // namespace

void set_verbose(bool on) { g_verbose.store(on); }
bool is_verbose() { return g_verbose.load(); }

void log_debug(const std::string& msg) { if (is_verbose()) write_line(std::cerr, "[DEBUG]", msg); }
void log_info(const std::string& msg) { write_line(std::cerr, "[INFO]", msg); }
void log_warn(const std::string& msg) { write_line(std::cerr, "[WARN]", msg); }
void log_error(const std::string& msg) { write_line(std::cerr, "[ERROR]", msg); }
}
