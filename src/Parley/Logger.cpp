// =================================================================
// src/Parley/Logger.cpp
// =================================================================
// Console and rolling-file log output.

#include "Parley/Logger.hpp"
#include "Parley/ModelSelector.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace Parley {

namespace {

const char* const kResetColor = "\033[0m";

const char* levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";
        case LogLevel::INFO: return "\033[36m";
        case LogLevel::WARNING: return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::CRITICAL: return "\033[1;91m";
    }
    return kResetColor;
}

// UTC with milliseconds so files from different hosts line up
std::string utcTimestamp(std::chrono::system_clock::time_point time_point) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return out.str();
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        openUnlocked(log_dir, max_log_size, max_log_files);
        path = activePath();
    }
    debug("Logger", "Writing log file", path);
}

void Logger::openUnlocked(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_initialized = true;

    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[parley] cannot create log directory " << m_log_dir << ": " << ec.message()
                  << ", logging to the working directory" << std::endl;
        m_log_dir = ".";
    }

    if (m_file.is_open()) {
        m_file.close();
    }
    m_file.clear();
    m_file.open(activePath(), std::ios::app);
    if (!m_file.is_open()) {
        std::cerr << "[parley] cannot open log file " << activePath() << std::endl;
        m_file_size = 0;
        return;
    }

    m_file_size = static_cast<size_t>(std::filesystem::file_size(activePath(), ec));
    if (ec) {
        m_file_size = 0;
    }
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& context) {
    LogEntry entry(level, component, message, context);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) {
        openUnlocked(".parley/logs", m_max_log_size, m_max_log_files);
    }
    write(entry);
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::INFO, component, message, context);
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::WARNING, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::ERROR, component, message, context);
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::CRITICAL, component, message, context);
}

void Logger::logRoutingDecision(const std::string& call_id, const RoutingDecision& decision) {
    std::ostringstream details;
    details << "call=" << call_id
            << " rule=" << decision.rule_name
            << " complexity=" << std::fixed << std::setprecision(3) << decision.complexity
            << " reasoning_budget=" << decision.reasoning_budget;

    const std::string target = decision.model_id + "@" + decision.region;
    if (decision.degraded) {
        warning("ModelSelector", "Routed to " + target + " with no healthy region", details.str());
    } else {
        info("ModelSelector", "Routed to " + target, details.str());
    }
}

void Logger::logGenerationAttempt(const std::string& model_id, const std::string& region,
                                  size_t attempt, bool success, const std::string& detail) {
    std::string details = "attempt=" + std::to_string(attempt);
    if (!detail.empty()) {
        details += " " + detail;
    }

    const std::string target = model_id + "@" + (region.empty() ? "-" : region);
    log(success ? LogLevel::DEBUG : LogLevel::WARNING, "Resilience",
        (success ? "Generation succeeded on " : "Generation failed on ") + target, details);
}

void Logger::logBreakerTransition(const std::string& target, const std::string& from, const std::string& to) {
    log(to == "open" ? LogLevel::WARNING : LogLevel::INFO, "CircuitBreaker",
        target + " " + from + " -> " + to);
}

void Logger::logTurnCompleted(const std::string& call_id, const std::string& outcome,
                              size_t segments, long first_token_ms, long duration_ms) {
    std::ostringstream details;
    details << "call=" << call_id << " segments=" << segments << " first_token=";
    if (first_token_ms >= 0) {
        details << first_token_ms << "ms";
    } else {
        details << "none";
    }
    details << " duration=" << duration_ms << "ms";

    LogLevel level = LogLevel::ERROR;
    if (outcome == "completed" || outcome == "degraded" || outcome == "cancelled") {
        level = LogLevel::INFO;
    }
    log(level, "TurnPipeline", "Turn " + outcome, details.str());

    // Voice turns slower than this are noticeable to the caller
    if (duration_ms > 10000) {
        warning("TurnPipeline", "Slow turn", details.str());
    }
}

void Logger::logSessionStart(const std::string& call_id, const std::string& tenant_id) {
    info("CallSession", "Call started", "call=" + call_id + " tenant=" + tenant_id);
}

void Logger::logSessionEnd(const std::string& call_id, size_t turns, long duration_ms) {
    info("CallSession", "Call ended",
         "call=" + call_id + " turns=" + std::to_string(turns) + " duration=" + std::to_string(duration_ms) + "ms");
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.flush();
    }
}

std::string Logger::currentLogFile() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_initialized ? activePath() : std::string();
}

const char* Logger::levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO ";
        case LogLevel::WARNING: return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT ";
    }
    return "?????";
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string normalized = name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (normalized == "debug") return LogLevel::DEBUG;
    if (normalized == "info") return LogLevel::INFO;
    if (normalized == "warning" || normalized == "warn") return LogLevel::WARNING;
    if (normalized == "error") return LogLevel::ERROR;
    if (normalized == "critical") return LogLevel::CRITICAL;
    return fallback;
}

void Logger::write(const LogEntry& entry) {
    std::ostringstream body;
    body << entry.component << ": " << entry.message;
    if (!entry.context.empty()) {
        body << " | " << entry.context;
    }

    const std::string timestamp = utcTimestamp(entry.timestamp);

    if (m_console_enabled && entry.level >= m_console_level) {
        std::cerr << timestamp << ' ' << levelColor(entry.level) << levelTag(entry.level) << kResetColor
                  << ' ' << body.str() << std::endl;
    }

    if (!m_file.is_open() || entry.level < m_file_level) {
        return;
    }

    // Thread id separates concurrent calls in the file
    std::ostringstream line;
    line << timestamp << ' ' << levelTag(entry.level) << " [" << entry.thread_id << "] " << body.str() << '\n';
    const std::string text = line.str();

    if (m_file_size > 0 && m_file_size + text.size() > m_max_log_size) {
        rollOver();
        if (!m_file.is_open()) {
            return;
        }
    }

    m_file << text;
    m_file_size += text.size();
    if (entry.level >= LogLevel::ERROR) {
        m_file.flush();
    }
}

// parley.log -> parley.1.log -> parley.2.log ...; the oldest beyond the limit is removed
void Logger::rollOver() {
    m_file.close();
    m_file.clear();

    std::error_code ec;
    if (m_max_log_files == 0) {
        std::filesystem::remove(activePath(), ec);
    } else {
        std::filesystem::remove(rolledPath(m_max_log_files), ec);
        for (size_t index = m_max_log_files; index > 1; --index) {
            if (std::filesystem::exists(rolledPath(index - 1), ec)) {
                std::filesystem::rename(rolledPath(index - 1), rolledPath(index), ec);
            }
        }
        std::filesystem::rename(activePath(), rolledPath(1), ec);
    }
    if (ec) {
        std::cerr << "[parley] log rollover incomplete: " << ec.message() << std::endl;
    }

    m_file.open(activePath(), std::ios::trunc);
    m_file_size = 0;
    if (!m_file.is_open()) {
        std::cerr << "[parley] cannot reopen log file " << activePath() << std::endl;
    }
}

std::string Logger::activePath() const {
    return (std::filesystem::path(m_log_dir) / "parley.log").string();
}

std::string Logger::rolledPath(size_t index) const {
    return (std::filesystem::path(m_log_dir) / ("parley." + std::to_string(index) + ".log")).string();
}

} // namespace Parley
