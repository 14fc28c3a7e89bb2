#ifndef STAGETRANSITIONLOG_H
#define STAGETRANSITIONLOG_H

#include <QString>
#include <QList>
#include <QDateTime>
#include "databasemanager.h"
#include "ledgertypes.h"

/**
 * @brief Append-only log of RO stage changes
 *
 * Stage names are stored as given. Callers validate them against the
 * configured stage list before recording.
 */
class StageTransitionLog
{
public:
    // Singleton access
    static StageTransitionLog* instance();

    // Initialize tables
    bool initialize();

    /**
     * @brief Append one transition
     * @param when Defaults to the current time when invalid
     * @return The new row id, or 0 on failure
     */
    qint64 recordTransition(const QString& roNumber, const QString& fromStage,
                            const QString& toStage, const QDateTime& when = QDateTime());

    /**
     * @brief Transitions for one RO ordered by occurred_at, then append order
     */
    QList<StageTransition> transitionsFor(const QString& roNumber);

    int transitionCount(const QString& roNumber);

private:
    // Private constructor for singleton
    StageTransitionLog();

    // Core database reference
    DatabaseManager* m_dbManager;

    // Singleton instance
    static StageTransitionLog* m_instance;

    // Table creation
    bool createTables();
};

#endif // STAGETRANSITIONLOG_H
