#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace ogmo::core {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

std::string_view ToString(LogLevel level);

// Process-wide log sink. Messages carry a "[Component]" tag by convention and
// go to stderr, an optional log file and every registered listener.
class Logger {
public:
    using Listener = std::function<void(LogLevel, const std::string&)>;
    using ListenerId = std::size_t;

    template <typename... Args>
    static void Debug(fmt::format_string<Args...> format, Args&&... args) {
        if (IsDebugEnabled()) {
            Write(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void Info(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void Warning(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Warning, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void Error(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }

    // Debug lines are off until enabled here or by OGMO_LOG_DEBUG=1 in the environment.
    static void SetDebugEnabled(bool enabled);
    static bool IsDebugEnabled();

    static void SetConsoleEnabled(bool enabled);

    // Appends to `path`, creating its directory. An empty path closes the file.
    static void SetLogFile(const std::filesystem::path& path);

    // Returns 0 for an empty listener; RemoveListener(0) is a no-op.
    static ListenerId AddListener(Listener listener);
    static void RemoveListener(ListenerId id);

    static void Write(LogLevel level, const std::string& message);
};

// Keeps a listener registered for the lifetime of the object.
class ScopedLogListener {
public:
    explicit ScopedLogListener(Logger::Listener listener)
        : m_id(Logger::AddListener(std::move(listener))) {}
    ~ScopedLogListener() { Logger::RemoveListener(m_id); }

    ScopedLogListener(const ScopedLogListener&) = delete;
    ScopedLogListener& operator=(const ScopedLogListener&) = delete;

    Logger::ListenerId Id() const { return m_id; }

private:
    Logger::ListenerId m_id = 0;
};

} // namespace ogmo::core
