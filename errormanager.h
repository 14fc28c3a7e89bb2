#ifndef ERRORMANAGER_H
#define ERRORMANAGER_H

#include "errorhandling.h"
#include <QObject>
#include <functional>

/**
 * @brief Singleton class for centralized error handling
 *
 * Routes the exception types from errorhandling.h into the log with a
 * consistent message format and notifies listeners through
 * errorOccurred. There is no UI in this application, so handling an
 * error never blocks on a dialog.
 */
class ErrorManager : public QObject
{
    Q_OBJECT

public:
    static ErrorManager& instance();

    /**
     * @brief Handle an exception
     * @param e The exception to handle
     * @param context Short description of what was being done (e.g. "recompute RO-1001")
     * @return True if the exception type was recognised
     */
    bool handleException(const std::exception& e, const QString& context = QString());

    /**
     * @brief Execute code with exception handling
     * @param func Function to execute
     * @param context Description used in the logged message
     * @return True if func completed without throwing
     */
    template<typename Func>
    bool tryExec(Func func, const QString& context = QString()) {
        try {
            func();
            return true;
        }
        catch (const std::exception& e) {
            handleException(e, context);
            return false;
        }
    }

    int errorCount() const { return m_errorCount; }

signals:
    void errorOccurred(const QString& message, const QString& title);

private:
    ErrorManager();
    ~ErrorManager();

    ErrorManager(const ErrorManager&) = delete;
    ErrorManager& operator=(const ErrorManager&) = delete;

    int m_errorCount;

    void report(const QString& message, const QString& title);
};

#endif // ERRORMANAGER_H
