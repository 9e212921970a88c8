#include "ogmo/core/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <mutex>
#include <system_error>
#include <vector>

#include <fmt/chrono.h>

namespace ogmo::core {

namespace {

struct LogSinks {
    std::mutex mutex;
    std::ofstream file;
    std::vector<std::pair<Logger::ListenerId, Logger::Listener>> listeners;
    Logger::ListenerId nextId = 1;
    std::atomic<bool> console{true};
    std::atomic<bool> debug{false};
    std::once_flag environmentRead;
};

LogSinks& Sinks() {
    static LogSinks sinks;
    return sinks;
}

void ReadDebugFromEnvironment(LogSinks& sinks) {
    std::call_once(sinks.environmentRead, [&sinks] {
        const char* env = std::getenv("OGMO_LOG_DEBUG");
        if (!env) {
            return;
        }
        std::string value(env);
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (value == "1" || value == "true" || value == "on") {
            sinks.debug.store(true);
        }
    });
}

std::string Timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03}",
                       fmt::localtime(std::chrono::system_clock::to_time_t(now)), millis);
}

} // namespace

std::string_view ToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "Debug";
        case LogLevel::Info:    return "Info";
        case LogLevel::Warning: return "Warning";
        case LogLevel::Error:   return "Error";
    }
    return "Unknown";
}

void Logger::SetDebugEnabled(bool enabled) {
    LogSinks& sinks = Sinks();
    ReadDebugFromEnvironment(sinks);
    sinks.debug.store(enabled);
}

bool Logger::IsDebugEnabled() {
    LogSinks& sinks = Sinks();
    ReadDebugFromEnvironment(sinks);
    return sinks.debug.load();
}

void Logger::SetConsoleEnabled(bool enabled) {
    Sinks().console.store(enabled);
}

void Logger::SetLogFile(const std::filesystem::path& path) {
    LogSinks& sinks = Sinks();
    std::lock_guard<std::mutex> lock(sinks.mutex);
    sinks.file.close();
    sinks.file.clear();
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    sinks.file.open(path, std::ios::out | std::ios::app);
    if (!sinks.file.is_open()) {
        fmt::print(stderr, "[Logger] Failed to open log file '{}'\n", path.string());
    }
}

Logger::ListenerId Logger::AddListener(Listener listener) {
    if (!listener) {
        return 0;
    }
    LogSinks& sinks = Sinks();
    std::lock_guard<std::mutex> lock(sinks.mutex);
    const ListenerId id = sinks.nextId++;
    sinks.listeners.emplace_back(id, std::move(listener));
    return id;
}

void Logger::RemoveListener(ListenerId id) {
    if (id == 0) {
        return;
    }
    LogSinks& sinks = Sinks();
    std::lock_guard<std::mutex> lock(sinks.mutex);
    std::erase_if(sinks.listeners, [id](const auto& entry) { return entry.first == id; });
}

void Logger::Write(LogLevel level, const std::string& message) {
    LogSinks& sinks = Sinks();
    const std::string line = fmt::format("[{}] [{}] {}", Timestamp(), ToString(level), message);

    if (sinks.console.load()) {
        fmt::print(stderr, "{}\n", line);
    }

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(sinks.mutex);
        if (sinks.file.is_open()) {
            sinks.file << line << '\n';
            sinks.file.flush();
        }
        listeners.reserve(sinks.listeners.size());
        for (const auto& entry : sinks.listeners) {
            listeners.push_back(entry.second);
        }
    }

    // Listeners run outside the lock so they may log themselves.
    for (const auto& listener : listeners) {
        listener(level, line);
    }
}

} // namespace ogmo::core
