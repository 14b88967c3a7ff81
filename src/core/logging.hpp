#pragma once
#include <string>

namespace core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Messages below this level are dropped. Default: INFO.
void set_log_level(LogLevel level);
LogLevel get_log_level();

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

}
