#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace tinydep::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

// Replaces console output; an empty sink restores it. Receives the bare message, without header.
// Called on the logging thread with no logger lock held, so it may log itself.
using Sink = std::function<void(Level, const std::string&)>;
void setSink(Sink sink);

}  // namespace tinydep::log

#define TINYDEP_LOG_IMPL(level, expr)                                                      \
    do {                                                                                   \
        if (::tinydep::log::shouldLog(level)) {                                            \
            std::ostringstream tinydep_log_stream__;                                       \
            tinydep_log_stream__ << expr;                                                  \
            ::tinydep::log::log(level, tinydep_log_stream__.str());                        \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) TINYDEP_LOG_IMPL(::tinydep::log::Level::Debug, expr)
#define LOG_INFO(expr) TINYDEP_LOG_IMPL(::tinydep::log::Level::Info, expr)
#define LOG_WARN(expr) TINYDEP_LOG_IMPL(::tinydep::log::Level::Warn, expr)
#define LOG_ERR(expr) TINYDEP_LOG_IMPL(::tinydep::log::Level::Error, expr)
