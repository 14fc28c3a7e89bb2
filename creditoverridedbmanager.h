#ifndef CREDITOVERRIDEDBMANAGER_H
#define CREDITOVERRIDEDBMANAGER_H

#include <QString>
#include <QList>
#include "databasemanager.h"
#include "ledgertypes.h"

/**
 * @brief Operator corrections to generated credit rows
 *
 * One override per (RO, from stage, to stage, note). Substitution only
 * touches the date, employee and hours of a row; the key fields are
 * never rewritten.
 */
class CreditOverrideDBManager
{
public:
    // Singleton access
    static CreditOverrideDBManager* instance();

    // Initialize tables
    bool initialize();

    // Insert or replace the override for its key
    bool setOverride(const CreditOverride& creditOverride);
    bool deleteOverride(const CreditRowKey& key);

    bool findOverride(const CreditRowKey& key, CreditOverride& creditOverride);
    QList<CreditOverride> overridesFor(const QString& roNumber);

    /**
     * @brief Substitute overridden fields into generated rows in place
     * @return Number of rows that had an override
     */
    int applyOverrides(QList<CreditRow>& rows);

    /**
     * @brief Substitute overridden employee/hours/date into posted audit lines
     */
    int applyOverrides(QList<CreditAuditEntry>& entries);

private:
    // Private constructor for singleton
    CreditOverrideDBManager();

    // Core database reference
    DatabaseManager* m_dbManager;

    // Singleton instance
    static CreditOverrideDBManager* m_instance;

    // Table creation
    bool createTables();

    QList<CreditOverride> loadOverrides(const QString& roNumber);
};

#endif // CREDITOVERRIDEDBMANAGER_H
