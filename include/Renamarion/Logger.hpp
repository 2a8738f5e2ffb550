// =================================================================
// include/Renamarion/Logger.hpp
// =================================================================
// Header for leveled logging to the console and to rotating log files.

#pragma once

#include <chrono>
#include <cstddef>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>

namespace Renamarion {

/**
 * @brief Log levels, in increasing severity
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * @brief One message as it is handed to the console and the log file
 */
struct LogRecord {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;
};

/**
 * @brief Process-wide logger
 *
 * Console output goes to stderr so that it never mixes with the
 * interactive dialogue on stdout. File output is off until
 * enableFileLogging() is called, and then records every level.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Start writing log files
     * @param log_dir Directory for log files, created if missing
     * @param max_log_size Size in bytes after which a new file is started
     * @param max_log_files Number of renamarion log files kept in log_dir
     * @return False if the directory or file cannot be created
     */
    bool enableFileLogging(const std::string& log_dir,
                           size_t max_log_size = 10 * 1024 * 1024,
                           size_t max_log_files = 5);

    /**
     * @brief Close the current log file and stop writing files
     */
    void disableFileLogging();

    /**
     * @brief Path of the file currently written, empty when file logging is off
     */
    const std::string& getLogFilePath() const { return m_log_file_path; }

    void setConsoleLogLevel(LogLevel level);
    void setColorOutput(bool enabled);

    /**
     * @brief Redirect console output (std::cerr by default)
     */
    void setConsoleStream(std::ostream& stream);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    void logScanSummary(size_t files, size_t directories,
                        size_t invalid_files, size_t invalid_directories);

    /**
     * @brief Log an accepted rule edit
     * @param display_key Printable key of the edited rule
     * @param replacement New replacement (printable form)
     */
    void logRuleEdit(const std::string& display_key, const std::string& replacement);

    /**
     * @brief Log the outcome of one proposal
     *
     * Failures are logged at ERROR, unresolvable names at WARNING and
     * everything else at INFO.
     */
    void logRenameOutcome(const std::string& original, const std::string& proposed,
                          const std::string& status, const std::string& message);

    void logSessionStart(const std::string& root_path);
    void logSessionEnd(int exit_code, long duration_ms);

    /**
     * @brief Parse a level name ("debug", "info", "warning"/"warn", "error", "critical")
     * @param name Level name, case-insensitive
     * @param level Receives the parsed level
     * @return False if the name is unknown
     */
    static bool parseLevel(const std::string& name, LogLevel& level);

    static std::string getLevelName(LogLevel level);

    /**
     * @brief Render a record as one line, without a trailing newline
     */
    static std::string formatRecord(const LogRecord& record, bool with_color);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel m_console_level = LogLevel::WARNING;
    bool m_color_enabled = true;
    std::ostream* m_console;

    std::string m_log_dir;
    size_t m_max_log_size = 0;
    size_t m_max_log_files = 0;
    std::unique_ptr<std::ofstream> m_log_file;
    std::string m_log_file_path;
    size_t m_log_file_size = 0;
    unsigned m_log_file_sequence = 0;

    void log(LogLevel level, const std::string& component,
             const std::string& message, const std::string& context);
    bool openLogFile();
    void startNextLogFile();
    void pruneLogFiles();
};

#define LOG_DEBUG(component, message) \
    Renamarion::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Renamarion::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Renamarion::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Renamarion::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Renamarion::Logger::getInstance().critical(component, message)

} // namespace Renamarion
