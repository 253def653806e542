// =================================================================
// include/Maestro/Logger.hpp
// =================================================================
// Header for structured logging shared by every orchestration component.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace Maestro {

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
 * @brief One record, stamped with the thread that produced it
 */
struct LogRecord {
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;
};

/**
 * @brief Process-wide logger for the orchestrator, its workers and the CLI
 *
 * Records go to two sinks: the terminal and a size-rotated file under the
 * log directory. Each sink has its own switch and threshold. Worker threads
 * log concurrently, so every line carries a short thread tag (t1, t2, ...)
 * assigned in order of first use.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Point the file sink at a directory and set rotation limits
     * @param log_dir Directory for log files
     * @param max_log_size Bytes written to one file before a new one starts
     * @param max_log_files Number of log files kept after rotation
     */
    void initialize(const std::string& log_dir = ".maestro/logs",
                    size_t max_log_size = 10 * 1024 * 1024,
                    size_t max_log_files = 5);

    void setConsoleLogLevel(LogLevel level);
    void setFileLogLevel(LogLevel level);
    void setConsoleLogging(bool enabled);

    /**
     * @brief Enable or disable the file sink
     *
     * Disabling closes the current file. Re-enabling opens a fresh one
     * on the next record.
     */
    void setFileLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log a task stage transition
     * @param task_id Task identifier
     * @param stage Stage name the task entered
     * @param detail Optional detail text
     */
    void logTaskLifecycle(const std::string& task_id, const std::string& stage,
                          const std::string& detail = "");

    /**
     * @brief Log one fallback handler attempt
     *
     * Successes go out at DEBUG, failures at WARNING.
     */
    void logFallbackAttempt(const std::string& chain, const std::string& handler,
                            bool success, double latency_ms, const std::string& error = "");

    void logMessageDropped(const std::string& message_id, const std::string& recipient,
                           const std::string& reason);

    void logSessionStart(const std::string& command, const std::string& description);
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    void flush();

    /**
     * @brief Parse a level name ("debug", "INFO", "warn", ...)
     * @param name Level name
     * @return Parsed level, INFO when unrecognized
     */
    static LogLevel parseLevel(const std::string& name);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    struct Sink {
        bool enabled;
        LogLevel threshold;

        bool accepts(LogLevel level) const { return enabled && level >= threshold; }
    };

    Sink m_console{true, LogLevel::INFO};
    Sink m_file{true, LogLevel::DEBUG};

    std::string m_log_dir = ".maestro/logs";
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;

    std::unique_ptr<std::ofstream> m_stream;
    size_t m_bytes_written = 0;
    unsigned m_file_sequence = 0;

    std::unordered_map<std::thread::id, unsigned> m_thread_tags;

    // Recursive: initialize() logs while holding it
    std::recursive_mutex m_mutex;

    void log(LogLevel level, const std::string& component, const std::string& message,
             const std::string& context);
    void emitConsole(const LogRecord& record);
    void emitFile(const LogRecord& record);
    std::string render(const LogRecord& record, bool colored);
    unsigned threadTag(std::thread::id thread);

    bool openNextFile();
    void pruneOldFiles();
};

} // namespace Maestro

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Maestro::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Maestro::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Maestro::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Maestro::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Maestro::Logger::getInstance().critical(component, message)
