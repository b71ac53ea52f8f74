#include "cmlink/util/Logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace cmlink::util {
namespace {
std::mutex& logMutex() {
    static std::mutex m;
    return m;
}

std::atomic<LogLevel>& globalLevel() {
    static std::atomic<LogLevel> level{LogLevel::info};
    return level;
}

const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::trace: return "TRACE";
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info:  return "INFO";
    case LogLevel::warn:  return "WARN";
    case LogLevel::error: return "ERROR";
    }
    return "INFO";
}
}

void initLogging(LogLevel level) {
    globalLevel() = level;
}

bool isLogEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(globalLevel().load());
}

void log(LogLevel level, const std::string& message) {
    if (!isLogEnabled(level)) return;

    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto sec_tp = floor<seconds>(now);
    const auto ms = duration_cast<milliseconds>(now - sec_tp).count();

    std::time_t t = system_clock::to_time_t(sec_tp);
    std::tm tmBuf{};
    localtime_r(&t, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms;

    std::lock_guard lk(logMutex());
    std::clog << oss.str() << " [" << toString(level) << "] " << message << '\n';
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "trace") return LogLevel::trace;
    if (lowered == "debug") return LogLevel::debug;
    if (lowered == "info") return LogLevel::info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::warn;
    if (lowered == "error") return LogLevel::error;
    return std::nullopt;
}

} // namespace cmlink::util
