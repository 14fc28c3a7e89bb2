#ifndef ERRORHANDLING_H
#define ERRORHANDLING_H

#include <QString>
#include <stdexcept>
#include "logger.h"

// Custom exception classes for specific error types
class DatabaseException : public std::runtime_error {
private:
    QString m_query;

public:
    DatabaseException(const QString& message, const QString& query = QString())
        : std::runtime_error(message.toStdString()), m_query(query) {}

    const QString& query() const { return m_query; }
};

class ValidationException : public std::runtime_error {
private:
    QString m_field;

public:
    ValidationException(const QString& message, const QString& field = QString())
        : std::runtime_error(message.toStdString()), m_field(field) {}

    const QString& field() const { return m_field; }
};

class ConfigurationException : public std::runtime_error {
private:
    QString m_key;

public:
    ConfigurationException(const QString& message, const QString& key = QString())
        : std::runtime_error(message.toStdString()), m_key(key) {}

    const QString& key() const { return m_key; }
};

// Log and throw exceptions
#define THROW_DB_ERROR(msg, query) \
    do { \
        QString error = QString("%1 (%2:%3)").arg(msg).arg(__FILE__).arg(__LINE__); \
        LOG_ERROR(QString("%1 - Query: %2").arg(error, query)); \
        throw DatabaseException(error, query); \
    } while (0)

#define THROW_VALIDATION_ERROR(msg, field) \
    do { \
        QString error = QString("%1 (%2:%3)").arg(msg).arg(__FILE__).arg(__LINE__); \
        LOG_WARNING(QString("%1 - Field: %2").arg(error, field)); \
        throw ValidationException(error, field); \
    } while (0)

#define THROW_CONFIG_ERROR(msg, key) \
    do { \
        QString error = QString("%1 (%2:%3)").arg(msg).arg(__FILE__).arg(__LINE__); \
        LOG_ERROR(QString("%1 - Key: %2").arg(error, key)); \
        throw ConfigurationException(error, key); \
    } while (0)

#endif // ERRORHANDLING_H
