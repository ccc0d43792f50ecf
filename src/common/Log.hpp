#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace wsm::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;

// Tags every line written by the calling thread, e.g. "live" or "http-2". Threads without
// a name are tagged with their id.
void setThreadName(std::string name);
const std::string& threadName();

Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

}  // namespace wsm::log

#define WSM_LOG_IMPL(level, expr)                                                          \
    do {                                                                                   \
        if (::wsm::log::shouldLog(level)) {                                                \
            std::ostringstream wsm_log_stream__;                                           \
            wsm_log_stream__ << expr;                                                      \
            ::wsm::log::log(level, wsm_log_stream__.str());                                \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) WSM_LOG_IMPL(::wsm::log::Level::Debug, expr)
#define LOG_INFO(expr) WSM_LOG_IMPL(::wsm::log::Level::Info, expr)
#define LOG_WARN(expr) WSM_LOG_IMPL(::wsm::log::Level::Warn, expr)
#define LOG_ERR(expr) WSM_LOG_IMPL(::wsm::log::Level::Error, expr)
