#ifndef LOGGER_H
#define LOGGER_H

#include <QObject>
#include <QString>
#include <QFile>
#include <QDateTime>
#include <QMutex>
#include <functional>

/**
 * @brief Log level enumeration
 */
enum class LogLevel {
    Debug,   ///< Debug information
    Info,    ///< Ledger writes and other normal events
    Warning, ///< Skipped or refused operations
    Error,   ///< Failed queries and rolled back transactions
    Fatal    ///< Startup failures
};

/**
 * @brief Singleton class for centralized logging
 *
 * Writes formatted lines to a dated log file in the configured log
 * directory, mirrors them to the Qt message stream, and emits
 * messageLogged for anything listening (the command-line front end
 * uses the custom handler instead).
 */
class Logger : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Get the singleton instance
     * @return Reference to the Logger instance
     */
    static Logger& instance();

    /**
     * @brief Open a dated log file inside a directory
     * @param logDirectory Directory for the log file (created if missing)
     * @param logToConsole Whether to also log to the Qt message stream
     * @return True if the file could be opened
     */
    bool initialize(const QString& logDirectory, bool logToConsole = true);

    void debug(const QString& message, const QString& source = QString());
    void info(const QString& message, const QString& source = QString());
    void warning(const QString& message, const QString& source = QString());
    void error(const QString& message, const QString& source = QString());
    void fatal(const QString& message, const QString& source = QString());

    /**
     * @brief Log a message with a specified log level
     * @param level The log level
     * @param message The message to log
     * @param source Optional source information (class/function)
     */
    void log(LogLevel level, const QString& message, const QString& source = QString());

    /**
     * @brief Messages below this level are dropped
     */
    void setMinimumLevel(LogLevel level);

    /**
     * @brief Parse a level name such as "Info" or "warning"
     * @param name Level name, case-insensitive
     * @param fallback Returned for unknown names
     */
    static LogLevel levelFromString(const QString& name, LogLevel fallback = LogLevel::Info);

    void close();
    bool isInitialized() const;
    QString logFilePath() const;

    /**
     * @brief Set custom log handler function
     * @param handler Function that receives formatted log messages
     */
    void setCustomLogHandler(std::function<void(LogLevel, const QString&)> handler);

signals:
    void messageLogged(LogLevel level, const QString& message);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    QFile m_logFile;
    bool m_logToConsole;
    bool m_initialized;
    LogLevel m_minimumLevel;

    std::function<void(LogLevel, const QString&)> m_customHandler;

    mutable QMutex m_mutex;

    QString formatLogMessage(LogLevel level, const QString& message, const QString& source) const;
    void writeToFile(const QString& message);
    static QString levelToString(LogLevel level);
};

// Convenience logging macros
#define LOG_DEBUG(msg) Logger::instance().debug(msg, __FUNCTION__)
#define LOG_INFO(msg) Logger::instance().info(msg, __FUNCTION__)
#define LOG_WARNING(msg) Logger::instance().warning(msg, __FUNCTION__)
#define LOG_ERROR(msg) Logger::instance().error(msg, __FUNCTION__)
#define LOG_FATAL(msg) Logger::instance().fatal(msg, __FUNCTION__)

#endif // LOGGER_H
