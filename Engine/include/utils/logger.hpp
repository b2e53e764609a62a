#pragma once

#include <atomic>
#include <iostream>
#include <string>
#include <mutex>

namespace Cadis {

/**
 * @brief Thread-safe console logger shared by the loader and the engine.
 *
 * Messages below the configured threshold are dropped before the lock is taken.
 */
class Logger {
public:
    enum class Level {
        Debug = 0,
        Info,
        Step,
        Success,
        Warning,
        Error,
        Off
    };

    static void set_threshold(Level level) { threshold().store(level); }
    static Level get_threshold() { return threshold().load(); }

    static bool enabled(Level level) {
        return level != Level::Off && static_cast<int>(level) >= static_cast<int>(threshold().load());
    }

    static void log(Level level, const std::string& message) {
        if (!enabled(level)) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "[debug] "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break;     // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break;     // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break;     // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break;     // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break;     // Red
            case Level::Off:     return;
        }

        std::cerr << color << "[cadis] " << prefix << message << "\033[0m" << std::endl;
    }

    /**
     * @brief Parse a level name ("debug", "info", "warn", ...). Unknown names map to Info.
     */
    static Level parse_level(const std::string& name) {
        if (name == "debug") return Level::Debug;
        if (name == "info") return Level::Info;
        if (name == "step") return Level::Step;
        if (name == "success") return Level::Success;
        if (name == "warn" || name == "warning") return Level::Warning;
        if (name == "error") return Level::Error;
        if (name == "off" || name == "none") return Level::Off;
        return Level::Info;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& threshold() {
        static std::atomic<Level> value{Level::Info};
        return value;
    }
};

} // namespace Cadis
