#include "common/Log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace tinydep::log {
namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_outputMutex;
// Guards g_sink only; never held while the sink runs, so a sink may log or call setSink.
std::mutex g_sinkMutex;
Sink g_sink;

const char* kLevelLabels[] = {"DEBUG", "INFO", "WARN", "ERROR"};

std::ostream& streamFor(Level level) {
    if (level == Level::Warn || level == Level::Error) {
        return std::cerr;
    }
    return std::cout;
}

std::tm safeLocaltime(std::time_t time) {
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    return tm;
}

Sink currentSink() {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    return g_sink;
}

// [2024-01-01 12:00:00.000] [INFO] [thread 1234] message
std::string formatLine(Level level, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const auto milliseconds =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto tm = safeLocaltime(std::chrono::system_clock::to_time_t(now));

    std::ostringstream line;
    line << '[' << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
         << milliseconds.count() << std::setfill(' ') << "] [" << levelToString(level) << "] [thread "
         << std::this_thread::get_id() << "] " << message;
    return line.str();
}

}  // namespace

void setLevel(Level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

Level getLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(getLevel());
}

void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    g_sink = std::move(sink);
}

void log(Level level, const std::string& message) {
    if (const auto sink = currentSink()) {
        sink(level, message);
        return;
    }

    const auto line = formatLine(level, message);
    std::lock_guard<std::mutex> lock(g_outputMutex);
    streamFor(level) << line << std::endl;
}

const char* levelToString(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index < (sizeof(kLevelLabels) / sizeof(kLevelLabels[0]))) {
        return kLevelLabels[index];
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    std::string lower{text};
    for (auto& ch : lower) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    if (lower == "debug" || lower == "trace") {
        return Level::Debug;
    }
    if (lower == "info") {
        return Level::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "err" || lower == "error") {
        return Level::Error;
    }

    throw std::invalid_argument("Nivel de log desconocido: " + std::string{text});
}

}  // namespace tinydep::log
