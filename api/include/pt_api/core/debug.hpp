#pragma once

#include <string>
#include <fmt/core.h>
#include <fmt/std.h>
#include <ostream>
#include <fstream>
#include <memory>
#include <mutex>
#include <atomic>
#include <stdexcept>

namespace pt_api {
    /**
    * @enum LogLevel
    * @brief Níveis de severidade, do mais ao menos verboso.
    */
    enum class LogLevel {
        Debug,
        Info,
        Success,
        Warn,
        Error
    };

    /**
     * @class Debug
     * @brief Classe utilitária para logging com cores, níveis e saída configurável.
     *
     * - Em Debug: Info e acima são exibidos por padrão; em Release, Warn e acima.
     * - O nível mínimo pode ser alterado via SetMinimumLevel().
     * - Suporte a cores ANSI (opcional).
     * - Thread-safe para uso pelos workers de renderização.
     */
    class Debug {
    public:
        /// Ativa ou desativa cores ANSI.
        static void SetColorEnabled(bool enabled);

        /// Define o nível mínimo exibido nos logs.
        static void SetMinimumLevel(LogLevel level);
        static LogLevel GetMinimumLevel();

        /// Define se deve dar flush após cada log.
        static void SetAutoFlush(bool enabled);

        /// Define saída para arquivo (substitui stdout). Lança exceção se não abrir.
        static void SetLogFile(const std::string& filepath);

        /// Reseta saída para console padrão.
        static void ResetOutputToConsole();

        /// Converte "debug", "info", "success", "warn" ou "error". Lança exceção nos demais.
        static LogLevel ParseLevel(const std::string& name);

        template <typename... Args>
        static void Log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
            if (level < g_minLevel.load(std::memory_order_relaxed)) return;

            const std::string msg = fmt::format(format, std::forward<Args>(args)...);
            Print(level, msg);
        }

        static void Print(LogLevel level, const std::string& message);

    private:
        static inline bool g_colorEnabled = true;
        static inline bool g_autoFlush = true;
        // lido sem lock pelos workers a cada mensagem
        static inline std::atomic<LogLevel> g_minLevel{
    #ifndef NDEBUG
            LogLevel::Info
    #else
            LogLevel::Warn
    #endif
        };

        static inline std::unique_ptr<std::ofstream> g_fileStream;
        static inline std::ostream* g_outputStream = nullptr;
        static inline std::mutex g_mutex;
    };
}

// ------------------- Macros para uso simplificado -------------------
#define PT_LOG_DEBUG(fmt_str, ...)   ::pt_api::Debug::Log(::pt_api::LogLevel::Debug, fmt_str, ##__VA_ARGS__)
#define PT_LOG_INFO(fmt_str, ...)    ::pt_api::Debug::Log(::pt_api::LogLevel::Info, fmt_str, ##__VA_ARGS__)
#define PT_LOG_SUCCESS(fmt_str, ...) ::pt_api::Debug::Log(::pt_api::LogLevel::Success, fmt_str, ##__VA_ARGS__)
#define PT_LOG_WARN(fmt_str, ...)    ::pt_api::Debug::Log(::pt_api::LogLevel::Warn, fmt_str, ##__VA_ARGS__)
#define PT_LOG_ERROR(fmt_str, ...)   ::pt_api::Debug::Log(::pt_api::LogLevel::Error, fmt_str, ##__VA_ARGS__)

// Loga a mensagem como erro e lança std::runtime_error
#define PT_LOG_THROW(fmt_str, ...)                                                   \
    do {                                                                             \
        const std::string _pt_msg = ::fmt::format(fmt_str, ##__VA_ARGS__);           \
        ::pt_api::Debug::Print(::pt_api::LogLevel::Error, _pt_msg);                  \
        throw std::runtime_error(_pt_msg);                                           \
    } while (0)
