#include "core/logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace core {

namespace {
std::atomic<int> g_min_level{static_cast<int>(LogLevel::INFO)};
std::mutex g_log_mutex;

void write_line(LogLevel level, const char* tag, const std::string& msg) {
    if (static_cast<int>(level) < g_min_level.load()) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ostream& os = (level >= LogLevel::WARN) ? std::cerr : std::cout;
    os << "[" << tag << "] " << msg << std::endl;
}
} // namespace

void set_log_level(LogLevel level) { g_min_level.store(static_cast<int>(level)); }
LogLevel get_log_level() { return static_cast<LogLevel>(g_min_level.load()); }

void log_debug(const std::string& msg) { write_line(LogLevel::DEBUG, "DEBUG", msg); }
void log_info(const std::string& msg) { write_line(LogLevel::INFO, "INFO", msg); }
void log_warn(const std::string& msg) { write_line(LogLevel::WARN, "WARN", msg); }
void log_error(const std::string& msg) { write_line(LogLevel::ERROR, "ERROR", msg); }
}
