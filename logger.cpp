#include "logger.h"
#include <QDebug>
#include <QDir>
#include <QTextStream>
#include <QMutexLocker>

Logger& Logger::instance()
{
    static Logger instance;
    return instance;
}

Logger::Logger()
    : QObject(nullptr),
    m_logToConsole(true),
    m_initialized(false),
    m_minimumLevel(LogLevel::Debug)
{
}

Logger::~Logger()
{
    close();
}

bool Logger::initialize(const QString& logDirectory, bool logToConsole)
{
    {
        QMutexLocker locker(&m_mutex);

        if (m_initialized && m_logFile.isOpen()) {
            m_logFile.close();
        }
        m_initialized = false;
        m_logToConsole = logToConsole;

        QDir dir(logDirectory);
        if (!dir.exists() && !dir.mkpath(".")) {
            return false;
        }

        // One file per day, appended across runs
        QString fileName = QString("shopcredit_%1.log")
                               .arg(QDate::currentDate().toString("yyyyMMdd"));
        m_logFile.setFileName(dir.filePath(fileName));

        if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Append)) {
            return false;
        }

        m_initialized = true;
    }

    info(QString("Logger initialized: %1").arg(logFilePath()), "Logger::initialize");
    return true;
}

void Logger::debug(const QString& message, const QString& source)
{
    log(LogLevel::Debug, message, source);
}

void Logger::info(const QString& message, const QString& source)
{
    log(LogLevel::Info, message, source);
}

void Logger::warning(const QString& message, const QString& source)
{
    log(LogLevel::Warning, message, source);
}

void Logger::error(const QString& message, const QString& source)
{
    log(LogLevel::Error, message, source);
}

void Logger::fatal(const QString& message, const QString& source)
{
    log(LogLevel::Fatal, message, source);
}

void Logger::log(LogLevel level, const QString& message, const QString& source)
{
    QString formattedMessage;
    std::function<void(LogLevel, const QString&)> handler;

    {
        QMutexLocker locker(&m_mutex);

        if (level < m_minimumLevel) {
            return;
        }

        formattedMessage = formatLogMessage(level, message, source);

        if (m_initialized && m_logFile.isOpen()) {
            writeToFile(formattedMessage);
        }

        if (m_logToConsole) {
            switch (level) {
            case LogLevel::Debug:
                qDebug().noquote() << formattedMessage;
                break;
            case LogLevel::Info:
                qInfo().noquote() << formattedMessage;
                break;
            case LogLevel::Warning:
                qWarning().noquote() << formattedMessage;
                break;
            case LogLevel::Error:
            case LogLevel::Fatal:
                qCritical().noquote() << formattedMessage;
                break;
            }
        }

        handler = m_customHandler;
    }

    // Handler and signal run unlocked so a receiver may log again
    if (handler) {
        handler(level, formattedMessage);
    }

    emit messageLogged(level, formattedMessage);
}

void Logger::setMinimumLevel(LogLevel level)
{
    QMutexLocker locker(&m_mutex);
    m_minimumLevel = level;
}

LogLevel Logger::levelFromString(const QString& name, LogLevel fallback)
{
    const QString key = name.trimmed().toLower();
    if (key == "debug") return LogLevel::Debug;
    if (key == "info") return LogLevel::Info;
    if (key == "warning") return LogLevel::Warning;
    if (key == "error") return LogLevel::Error;
    if (key == "fatal") return LogLevel::Fatal;
    return fallback;
}

void Logger::close()
{
    QMutexLocker locker(&m_mutex);

    if (m_initialized && m_logFile.isOpen()) {
        m_logFile.close();
    }

    m_initialized = false;
}

bool Logger::isInitialized() const
{
    QMutexLocker locker(&m_mutex);
    return m_initialized && m_logFile.isOpen();
}

QString Logger::logFilePath() const
{
    return m_logFile.fileName();
}

void Logger::setCustomLogHandler(std::function<void(LogLevel, const QString&)> handler)
{
    QMutexLocker locker(&m_mutex);
    m_customHandler = handler;
}

QString Logger::formatLogMessage(LogLevel level, const QString& message, const QString& source) const
{
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    QString levelStr = levelToString(level);

    if (source.isEmpty()) {
        return QString("[%1] [%2] %3").arg(timestamp, levelStr, message);
    }
    return QString("[%1] [%2] [%3] %4").arg(timestamp, levelStr, source, message);
}

void Logger::writeToFile(const QString& message)
{
    QTextStream out(&m_logFile);
    out << message << "\n";
    out.flush();
}

QString Logger::levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
    case LogLevel::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}
