#include "pt_api/core/debug.hpp"

#include <iostream>
#include <chrono>
#include <ctime>

namespace pt_api {
    namespace {
        const char* levelTag(LogLevel level) {
            switch (level) {
                case LogLevel::Debug:   return "DEBUG";
                case LogLevel::Info:    return "INFO";
                case LogLevel::Success: return "OK";
                case LogLevel::Warn:    return "WARN";
                case LogLevel::Error:   return "ERROR";
            }
            return "?";
        }

        const char* levelColor(LogLevel level) {
            switch (level) {
                case LogLevel::Debug:   return "\033[90m";
                case LogLevel::Info:    return "\033[37m";
                case LogLevel::Success: return "\033[32m";
                case LogLevel::Warn:    return "\033[33m";
                case LogLevel::Error:   return "\033[31m";
            }
            return "";
        }
    }

    void Debug::SetColorEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_colorEnabled = enabled;
    }

    void Debug::SetMinimumLevel(LogLevel level) {
        g_minLevel.store(level, std::memory_order_relaxed);
    }

    LogLevel Debug::GetMinimumLevel() {
        return g_minLevel.load(std::memory_order_relaxed);
    }

    void Debug::SetAutoFlush(bool enabled) {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_autoFlush = enabled;
    }

    void Debug::SetLogFile(const std::string& filepath) {
        auto file = std::make_unique<std::ofstream>(filepath, std::ios::out | std::ios::app);
        if (!file->is_open())
            throw std::runtime_error(fmt::format("Failed to open log file '{}'", filepath));

        std::lock_guard<std::mutex> lock(g_mutex);
        g_fileStream = std::move(file);
        g_outputStream = g_fileStream.get();
        // cores ANSI não fazem sentido em arquivo
        g_colorEnabled = false;
    }

    void Debug::ResetOutputToConsole() {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_outputStream = nullptr;
        g_fileStream.reset();
    }

    LogLevel Debug::ParseLevel(const std::string& name) {
        if (name == "debug")   return LogLevel::Debug;
        if (name == "info")    return LogLevel::Info;
        if (name == "success") return LogLevel::Success;
        if (name == "warn")    return LogLevel::Warn;
        if (name == "error")   return LogLevel::Error;
        throw std::runtime_error(fmt::format("Unknown log level '{}'", name));
    }

    void Debug::Print(LogLevel level, const std::string& message) {
        const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        localtime_r(&now, &tm);
        char stamp[16];
        std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm);

        std::lock_guard<std::mutex> lock(g_mutex);
        std::ostream& out = g_outputStream ? *g_outputStream
                                           : (level == LogLevel::Error ? std::cerr : std::cout);

        if (g_colorEnabled)
            out << levelColor(level) << '[' << stamp << "] [" << levelTag(level) << "] " << message << "\033[0m\n";
        else
            out << '[' << stamp << "] [" << levelTag(level) << "] " << message << '\n';

        if (g_autoFlush)
            out.flush();
    }
}
