// =================================================================
// include/Parley/Logger.hpp
// =================================================================
// Header for structured logging of routing, streaming and call sessions.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <mutex>
#include <thread>

namespace Parley {

struct RoutingDecision;

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief One log record, stamped on the thread that produced it
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;
    LogLevel level;
    std::string component;     ///< Emitting class, e.g. "TurnPipeline"
    std::string message;
    std::string context;       ///< Call id or key/value details

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), thread_id(std::this_thread::get_id()),
          level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger shared by every call session
 *
 * Console entries go to stderr with a coloured level tag. File entries go to
 * `<dir>/parley.log`, which rolls over to `parley.1.log`, `parley.2.log` and
 * so on once it reaches the size limit. All public methods may be called from
 * any thread.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Open the active log file, creating the directory if needed
     * @param log_dir Directory for log files
     * @param max_log_size Size in bytes at which the active file rolls over
     * @param max_log_files Rolled-over files kept next to the active one
     */
    void initialize(const std::string& log_dir = ".parley/logs",
                    size_t max_log_size = 10 * 1024 * 1024,
                    size_t max_log_files = 5);

    void setConsoleLogLevel(LogLevel level);
    void setFileLogLevel(LogLevel level);
    void setConsoleLogging(bool enabled);

    /**
     * @brief Record one entry at the given level
     * @param context Call id or key/value details, printed after the message
     */
    void log(LogLevel level, const std::string& component, const std::string& message,
             const std::string& context = "");

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the routing decision made for a turn
     * @param call_id Call session identifier
     * @param decision Decision produced by the selector
     */
    void logRoutingDecision(const std::string& call_id, const RoutingDecision& decision);

    /**
     * @brief Log one generation attempt against a model/region pair
     * @param attempt Attempt number (1-based)
     * @param detail Error text or extra context
     */
    void logGenerationAttempt(const std::string& model_id, const std::string& region,
                              size_t attempt, bool success, const std::string& detail = "");

    /**
     * @brief Log a circuit breaker state transition; opening is a warning
     */
    void logBreakerTransition(const std::string& target, const std::string& from, const std::string& to);

    /**
     * @brief Log turn completion metrics
     * @param outcome Outcome name
     * @param segments Number of segments delivered to the sink
     * @param first_token_ms First-token latency (negative if none)
     * @param duration_ms Total turn duration
     */
    void logTurnCompleted(const std::string& call_id, const std::string& outcome,
                          size_t segments, long first_token_ms, long duration_ms);

    void logSessionStart(const std::string& call_id, const std::string& tenant_id);
    void logSessionEnd(const std::string& call_id, size_t turns, long duration_ms);

    void flush();

    /**
     * @brief Path of the file currently written to (empty before initialize)
     */
    std::string currentLogFile() const;

    /**
     * @brief Fixed-width tag printed for a level, e.g. "WARN "
     */
    static const char* levelTag(LogLevel level);

    /**
     * @brief Parse a level name (debug, info, warning, error, critical)
     * @param name Level name, case-insensitive
     * @param fallback Level returned when the name is unknown
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_initialized = false;

    std::ofstream m_file;
    size_t m_file_size = 0;

    mutable std::mutex m_mutex;

    // Callers hold m_mutex
    void openUnlocked(const std::string& log_dir, size_t max_log_size, size_t max_log_files);
    void write(const LogEntry& entry);
    void rollOver();
    std::string activePath() const;
    std::string rolledPath(size_t index) const;
};

} // namespace Parley
