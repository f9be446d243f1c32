#pragma once
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace st {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Accepts the level names in any case; "WARNING" is an alias of WARN.
inline LogLevel parseLogLevel(std::string name, LogLevel fallback = LogLevel::Info) {
    for (auto &c : name)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (name == "DEBUG")
        return LogLevel::Debug;
    if (name == "INFO")
        return LogLevel::Info;
    if (name == "WARN" || name == "WARNING")
        return LogLevel::Warn;
    if (name == "ERROR")
        return LogLevel::Error;
    return fallback;
}

inline const char *levelTag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

struct LogSettings {
    LogLevel level = LogLevel::Info;
    // When set, every record goes here instead of stdout/stderr.
    std::ostream *sink = nullptr;
};

inline LogSettings &logSettings() {
    static LogSettings settings = [] {
        LogSettings s;
        if (const char *env = std::getenv("ST_LOG_LEVEL"))
            s.level = parseLogLevel(env);
        return s;
    }();
    return settings;
}

inline void setLogLevel(LogLevel level) { logSettings().level = level; }
inline void setLogSink(std::ostream *sink) { logSettings().sink = sink; }

inline bool logEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(logSettings().level);
}

// Local time as "YYYY-MM-DD HH:MM:SS.mmm".
inline std::string timestampNow() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%F %T") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

inline const char *sourceName(const char *path) {
    const char *slash = std::strrchr(path, '/');
#ifdef _WIN32
    if (const char *back = std::strrchr(path, '\\'))
        slash = (!slash || back > slash) ? back : slash;
#endif
    return slash ? slash + 1 : path;
}

inline void log(LogLevel level, const std::string &msg,
                const char *file = nullptr, int line = 0) {
    if (!logEnabled(level))
        return;
    std::ostringstream record;
    record << '[' << levelTag(level) << "] " << timestampNow();
    if (file)
        record << ' ' << sourceName(file) << ':' << line;
    record << ' ' << msg << '\n';

    LogSettings &settings = logSettings();
    std::ostream &out = settings.sink ? *settings.sink
                                      : (level == LogLevel::Error ? std::cerr : std::cout);
    out << record.str() << std::flush;
}

} // namespace st

#define ST_LOG(level, msg) ::st::log(level, msg, __FILE__, __LINE__)
