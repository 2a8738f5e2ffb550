// =================================================================
// src/Renamarion/Logger.cpp
// =================================================================
// Implementation for the logging system.

#include "Renamarion/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <vector>

namespace Renamarion {

namespace fs = std::filesystem;

namespace {

const char* const LOG_FILE_PREFIX = "renamarion_";
const char* const LOG_FILE_EXTENSION = ".log";
const char* const COLOR_RESET = "\033[0m";

const char* levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";
        case LogLevel::INFO: return "\033[36m";
        case LogLevel::WARNING: return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::CRITICAL: return "\033[91m";
    }
    return COLOR_RESET;
}

// "%Y-%m-%d %H:%M:%S.mmm", or the compact file-name form "%Y%m%d_%H%M%S_mmm"
std::string formatTime(const std::chrono::system_clock::time_point& time_point, bool compact) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()).count() % 1000;

    std::ostringstream out;
    out << std::put_time(std::localtime(&seconds), compact ? "%Y%m%d_%H%M%S" : "%Y-%m-%d %H:%M:%S")
        << (compact ? "_" : ".") << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

bool isRenamarionLogFile(const fs::path& path) {
    std::string name = path.filename().string();
    return name.compare(0, std::string(LOG_FILE_PREFIX).size(), LOG_FILE_PREFIX) == 0 &&
           path.extension() == LOG_FILE_EXTENSION;
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : m_console(&std::cerr) {}

Logger::~Logger() {
    disableFileLogging();
}

bool Logger::enableFileLogging(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    disableFileLogging();

    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = std::max<size_t>(max_log_files, 1);
    m_log_file_sequence = 0;

    std::error_code ec;
    fs::create_directories(m_log_dir, ec);
    if (ec) {
        warning("Logger", "Cannot create log directory " + m_log_dir, ec.message());
        return false;
    }
    if (!openLogFile()) {
        return false;
    }

    info("Logger", "File logging enabled", m_log_file_path);
    return true;
}

void Logger::disableFileLogging() {
    if (m_log_file) {
        m_log_file->flush();
        m_log_file.reset();
    }
    m_log_file_path.clear();
    m_log_file_size = 0;
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

void Logger::setColorOutput(bool enabled) {
    m_color_enabled = enabled;
}

void Logger::setConsoleStream(std::ostream& stream) {
    m_console = &stream;
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

void Logger::logScanSummary(size_t files, size_t directories,
                            size_t invalid_files, size_t invalid_directories) {
    std::ostringstream context;
    context << files << " files (" << invalid_files << " invalid), "
            << directories << " directories (" << invalid_directories << " invalid)";
    info("DirectoryScanner", "Scan completed", context.str());
}

void Logger::logRuleEdit(const std::string& display_key, const std::string& replacement) {
    info("RuleEditor", "Rule " + display_key + " edited", "replacement '" + replacement + "'");
}

void Logger::logRenameOutcome(const std::string& original, const std::string& proposed,
                              const std::string& status, const std::string& message) {
    std::string context = original + " -> " + proposed;
    if (!message.empty()) {
        context += ": " + message;
    }

    if (status == "failed") {
        error("RenameSession", "Rename failed", context);
    } else if (status == "unresolvable") {
        warning("RenameSession", "Name cannot be sanitized", context);
    } else {
        info("RenameSession", "Item " + status, context);
    }
}

void Logger::logSessionStart(const std::string& root_path) {
    info("Core", "Session started", "root " + root_path);
}

void Logger::logSessionEnd(int exit_code, long duration_ms) {
    std::string context = "exit code " + std::to_string(exit_code) + ", " +
                          std::to_string(duration_ms) + "ms";
    if (exit_code == 0) {
        info("Core", "Session finished", context);
    } else {
        error("Core", "Session failed", context);
    }
}

bool Logger::parseLevel(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warning" || lower == "warn") {
        level = LogLevel::WARNING;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else if (lower == "critical") {
        level = LogLevel::CRITICAL;
    } else {
        return false;
    }
    return true;
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
    }
    return "UNKNOWN";
}

std::string Logger::formatRecord(const LogRecord& record, bool with_color) {
    std::ostringstream line;
    line << formatTime(record.timestamp, false) << " ";
    if (with_color) {
        line << levelColor(record.level) << "[" << getLevelName(record.level) << "]" << COLOR_RESET;
    } else {
        line << "[" << getLevelName(record.level) << "]";
    }
    line << " " << record.component << ": " << record.message;
    if (!record.context.empty()) {
        line << " (" << record.context << ")";
    }
    return line.str();
}

void Logger::log(LogLevel level, const std::string& component,
                 const std::string& message, const std::string& context) {
    bool to_console = level >= m_console_level;
    if (!to_console && !m_log_file) {
        return;
    }

    LogRecord record{std::chrono::system_clock::now(), level, component, message, context};

    if (to_console) {
        *m_console << formatRecord(record, m_color_enabled) << std::endl;
    }

    if (m_log_file) {
        if (m_log_file_size >= m_max_log_size) {
            startNextLogFile();
        }
        if (m_log_file) {
            std::string line = formatRecord(record, false);
            *m_log_file << line << '\n';
            m_log_file_size += line.size() + 1;
            if (level >= LogLevel::ERROR) {
                m_log_file->flush();
            }
        }
    }
}

bool Logger::openLogFile() {
    std::ostringstream name;
    name << LOG_FILE_PREFIX << formatTime(std::chrono::system_clock::now(), true)
         << "_" << std::setfill('0') << std::setw(3) << m_log_file_sequence++ << LOG_FILE_EXTENSION;

    std::string path = (fs::path(m_log_dir) / name.str()).string();
    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file->is_open()) {
        *m_console << "[WARN] Cannot open log file " << path << std::endl;
        return false;
    }

    m_log_file = std::move(file);
    m_log_file_path = path;
    m_log_file_size = 0;
    pruneLogFiles();
    return true;
}

void Logger::startNextLogFile() {
    m_log_file.reset();
    if (!openLogFile()) {
        m_log_file_path.clear();
    }
}

void Logger::pruneLogFiles() {
    std::error_code ec;
    std::vector<fs::path> log_files;
    for (fs::directory_iterator it(m_log_dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (isRenamarionLogFile(it->path())) {
            log_files.push_back(it->path());
        }
    }
    if (ec) {
        *m_console << "[WARN] Cannot list log directory " << m_log_dir << ": " << ec.message() << std::endl;
        return;
    }

    // Names embed the creation time, so the newest sort last
    std::sort(log_files.begin(), log_files.end());
    while (log_files.size() > m_max_log_files) {
        fs::remove(log_files.front(), ec);
        if (ec) {
            *m_console << "[WARN] Cannot remove old log file " << log_files.front().string()
                       << ": " << ec.message() << std::endl;
            ec.clear();
        }
        log_files.erase(log_files.begin());
    }
}

} // namespace Renamarion
