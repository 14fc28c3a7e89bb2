#ifndef CREDITLEDGERDBMANAGER_H
#define CREDITLEDGERDBMANAGER_H

#include <QString>
#include <QList>
#include "databasemanager.h"
#include "ledgertypes.h"

/**
 * @brief Storage for milestone baselines and their signed adjustments
 *
 * A baseline is written at most once per (RO, milestone) and never
 * updated. Adjustments are append-only; an operator may delete one
 * individually to reverse it.
 */
class CreditLedgerDBManager
{
public:
    // Singleton access
    static CreditLedgerDBManager* instance();

    // Initialize tables
    bool initialize();

    // Baseline operations
    /**
     * @brief Insert the baseline unless one already exists for the key
     * @param inserted Set to true only when a new row was written
     * @return False on SQL failure
     */
    bool ensureBaseline(const CreditBaseline& baseline, bool* inserted = nullptr);

    /**
     * @brief Load the baseline for (RO, milestone)
     * @param ok Set to false on SQL failure
     * @return True if a baseline exists
     */
    bool findBaseline(const QString& roNumber, const QString& milestoneId,
                      CreditBaseline& baseline, bool* ok = nullptr);

    // Adjustment operations
    qint64 addAdjustment(const CreditAdjustment& adjustment);
    bool deleteAdjustment(qint64 id);

    // Ordered by id; milestoneId empty lists every milestone
    QList<CreditAdjustment> adjustmentsFor(const QString& roNumber,
                                           const QString& milestoneId = QString(),
                                           bool* ok = nullptr);
    double sumAdjustments(const QString& roNumber, const QString& milestoneId, bool* ok = nullptr);
    int adjustmentCount(const QString& roNumber);

private:
    // Private constructor for singleton
    CreditLedgerDBManager();

    // Core database reference
    DatabaseManager* m_dbManager;

    // Singleton instance
    static CreditLedgerDBManager* m_instance;

    // Table creation
    bool createTables();
};

#endif // CREDITLEDGERDBMANAGER_H
