#include "errormanager.h"

ErrorManager& ErrorManager::instance()
{
    static ErrorManager instance;
    return instance;
}

ErrorManager::ErrorManager()
    : QObject(nullptr),
    m_errorCount(0)
{
}

ErrorManager::~ErrorManager()
{
}

bool ErrorManager::handleException(const std::exception& e, const QString& context)
{
    QString message;
    QString title = tr("Error");
    bool recognised = true;

    if (const auto* dbEx = dynamic_cast<const DatabaseException*>(&e)) {
        message = tr("Database error: %1").arg(e.what());
        if (!dbEx->query().isEmpty()) {
            message += tr("\nQuery: %1").arg(dbEx->query());
        }
        title = tr("Database Error");
    }
    else if (const auto* valEx = dynamic_cast<const ValidationException*>(&e)) {
        message = tr("Validation error: %1").arg(e.what());
        if (!valEx->field().isEmpty()) {
            message += tr("\nField: %1").arg(valEx->field());
        }
        title = tr("Validation Error");
    }
    else if (const auto* cfgEx = dynamic_cast<const ConfigurationException*>(&e)) {
        message = tr("Configuration error: %1").arg(e.what());
        if (!cfgEx->key().isEmpty()) {
            message += tr("\nKey: %1").arg(cfgEx->key());
        }
        title = tr("Configuration Error");
    }
    else {
        message = tr("An error occurred: %1").arg(e.what());
        recognised = false;
    }

    if (!context.isEmpty()) {
        message = QString("%1: %2").arg(context, message);
    }

    report(message, title);
    return recognised;
}

void ErrorManager::report(const QString& message, const QString& title)
{
    ++m_errorCount;
    Logger::instance().error(message, title);
    emit errorOccurred(message, title);
}
