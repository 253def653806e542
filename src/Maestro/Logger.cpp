// =================================================================
// src/Maestro/Logger.cpp
// =================================================================
// Implementation for the structured logging system.

#include "Maestro/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <vector>
#include <cctype>
#include <ctime>

namespace Maestro {

namespace {

const char* const LOG_FILE_PREFIX = "maestro_";
const char* const COLOR_RESET = "\033[0m";

struct LevelStyle {
    const char* label;
    const char* color;
};

// Indexed by LogLevel
const LevelStyle LEVEL_STYLES[] = {
    {"DEBUG", "\033[90m"},
    {"INFO ", "\033[36m"},
    {"WARN ", "\033[33m"},
    {"ERROR", "\033[31m"},
    {"CRIT ", "\033[1;31m"},
};

const LevelStyle& styleOf(LogLevel level) {
    return LEVEL_STYLES[static_cast<size_t>(level)];
}

std::tm toLocalTime(std::chrono::system_clock::time_point time_point) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
    std::tm local{};
    localtime_r(&seconds, &local);
    return local;
}

} // anonymous namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_log_dir = log_dir;
    m_max_log_size = std::max<size_t>(max_log_size, 1);
    m_max_log_files = std::max<size_t>(max_log_files, 1);

    // The next file record opens a file in the new directory
    m_stream.reset();
    log(LogLevel::DEBUG, "Logger", "Log directory set", m_log_dir);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console.threshold = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_file.threshold = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console.enabled = enabled;
}

void Logger::setFileLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_file.enabled = enabled;
    if (!enabled && m_stream) {
        m_stream->flush();
        m_stream.reset();
    }
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

void Logger::logTaskLifecycle(const std::string& task_id, const std::string& stage,
                              const std::string& detail) {
    std::string context = "task=" + task_id;
    if (!detail.empty()) {
        context += " " + detail;
    }
    debug("Orchestrator", "Task entered " + stage, context);
}

void Logger::logFallbackAttempt(const std::string& chain, const std::string& handler,
                                bool success, double latency_ms, const std::string& error) {
    std::ostringstream context;
    context << "chain=" << chain << " latency=" << std::fixed << std::setprecision(1) << latency_ms << "ms";

    if (success) {
        debug("FallbackChain", handler + " answered", context.str());
        return;
    }
    context << " error=\"" << error << "\"";
    warning("FallbackChain", handler + " failed", context.str());
}

void Logger::logMessageDropped(const std::string& message_id, const std::string& recipient,
                               const std::string& reason) {
    warning("MessageBus", "Dropped message " + message_id + ": " + reason, "recipient=" + recipient);
}

void Logger::logSessionStart(const std::string& command, const std::string& description) {
    info("Session", "Started '" + command + "'",
         "description_chars=" + std::to_string(description.size()));
    if (!description.empty()) {
        debug("Session", "Task: " + description);
    }
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::string context = "exit=" + std::to_string(exit_code) + " duration=" + std::to_string(duration_ms) + "ms";
    if (exit_code == 0) {
        info("Session", "Finished '" + command + "'", context);
    } else {
        error("Session", "Finished '" + command + "' with errors", context);
    }
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_stream) {
        m_stream->flush();
    }
    std::cout.flush();
    std::cerr.flush();
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (unsigned char c : name) {
        lower.push_back(static_cast<char>(std::tolower(c)));
    }

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "crit" || lower == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& context) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_console.accepts(level) && !m_file.accepts(level)) {
        return;
    }

    LogRecord record{std::chrono::system_clock::now(), std::this_thread::get_id(),
                     level, component, message, context};
    emitConsole(record);
    emitFile(record);
}

void Logger::emitConsole(const LogRecord& record) {
    if (!m_console.accepts(record.level)) {
        return;
    }
    std::ostream& out = record.level >= LogLevel::WARNING ? std::cerr : std::cout;
    out << render(record, true) << '\n';
    if (record.level >= LogLevel::ERROR) {
        out.flush();
    }
}

void Logger::emitFile(const LogRecord& record) {
    if (!m_file.accepts(record.level)) {
        return;
    }
    if ((!m_stream || m_bytes_written >= m_max_log_size) && !openNextFile()) {
        return;
    }

    std::string line = render(record, false);
    *m_stream << line << '\n';
    m_bytes_written += line.size() + 1;

    if (record.level >= LogLevel::ERROR) {
        m_stream->flush();
    }
}

std::string Logger::render(const LogRecord& record, bool colored) {
    std::tm local = toLocalTime(record.timestamp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()).count() % 1000;

    const LevelStyle& style = styleOf(record.level);

    std::ostringstream line;
    line << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis << ' ';
    if (colored) {
        line << style.color << style.label << COLOR_RESET;
    } else {
        line << std::put_time(&local, "%Y-%m-%d") << ' ' << style.label;
    }
    line << " t" << threadTag(record.thread) << ' ' << record.component << " | " << record.message;
    if (!record.context.empty()) {
        line << " [" << record.context << ']';
    }
    return line.str();
}

unsigned Logger::threadTag(std::thread::id thread) {
    auto it = m_thread_tags.find(thread);
    if (it != m_thread_tags.end()) {
        return it->second;
    }
    unsigned tag = static_cast<unsigned>(m_thread_tags.size()) + 1;
    m_thread_tags.emplace(thread, tag);
    return tag;
}

bool Logger::openNextFile() {
    m_stream.reset();
    m_bytes_written = 0;

    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        // Keep the console going; stop trying the file sink
        m_file.enabled = false;
        std::cerr << "Logger: cannot create " << m_log_dir << ": " << ec.message() << std::endl;
        return false;
    }

    // Several files may open within one second; the sequence keeps names unique and ordered
    std::tm local = toLocalTime(std::chrono::system_clock::now());
    std::ostringstream name;
    name << LOG_FILE_PREFIX << std::put_time(&local, "%Y%m%d_%H%M%S")
         << '_' << std::setfill('0') << std::setw(3) << (m_file_sequence++ % 1000) << ".log";

    auto path = std::filesystem::path(m_log_dir) / name.str();
    auto stream = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!stream->is_open()) {
        m_file.enabled = false;
        std::cerr << "Logger: cannot open " << path.string() << std::endl;
        return false;
    }
    m_stream = std::move(stream);

    pruneOldFiles();
    return true;
}

void Logger::pruneOldFiles() {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(m_log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() == ".log" && path.filename().string().rfind(LOG_FILE_PREFIX, 0) == 0) {
            files.push_back(path);
        }
    }
    if (files.size() <= m_max_log_files) {
        return;
    }

    // Timestamped names sort oldest first
    std::sort(files.begin(), files.end());
    size_t excess = files.size() - m_max_log_files;
    for (size_t i = 0; i < excess; ++i) {
        std::filesystem::remove(files[i], ec);
        if (ec) {
            std::cerr << "Logger: cannot remove " << files[i].string() << ": " << ec.message() << std::endl;
        }
    }
}

} // namespace Maestro
