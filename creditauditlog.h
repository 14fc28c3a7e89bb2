#ifndef CREDITAUDITLOG_H
#define CREDITAUDITLOG_H

#include <QString>
#include <QList>
#include <QMap>
#include <QDate>
#include "databasemanager.h"
#include "ledgertypes.h"

/**
 * @brief Posted credit lines used for reporting and close reconciliation
 *
 * Entries are immutable once written. They go away only when their RO
 * is deleted or when the supplement that produced them is rolled back.
 */
class CreditAuditLog
{
public:
    enum PostMode {
        Always,     // One-shot postings such as close adjustments
        IfAbsent    // Skip when (RO, employee, note) is already posted
    };

    enum PostResult {
        Posted,
        Skipped,
        Failed
    };

    // Singleton access
    static CreditAuditLog* instance();

    // Initialize tables
    bool initialize();

    /**
     * @brief Post one credit line
     *
     * No-op for an empty employee or zero hours, and for an RO that no
     * longer exists.
     */
    PostResult postCredit(const CreditAuditEntry& entry, PostMode mode);

    bool hasEntry(const QString& roNumber, const QString& employee, const QString& note);

    /**
     * @brief Posted lines, newest first
     * @param roNumber Empty for every RO
     * @param from Inclusive lower date bound, ignored when invalid
     * @param to Inclusive upper date bound, ignored when invalid
     */
    QList<CreditAuditEntry> entries(const QString& roNumber = QString(),
                                    const QDate& from = QDate(), const QDate& to = QDate());

    // Same lines with overrides substituted
    QList<CreditAuditEntry> effectiveEntries(const QString& roNumber = QString(),
                                             const QDate& from = QDate(), const QDate& to = QDate());

    /**
     * @brief Post-override hours per employee for one RO
     */
    QMap<QString, double> postedTotals(const QString& roNumber);

    // Rollback of a deleted supplement
    bool deleteEntries(const QString& roNumber, const QString& note);

private:
    // Private constructor for singleton
    CreditAuditLog();

    // Core database reference
    DatabaseManager* m_dbManager;

    // Singleton instance
    static CreditAuditLog* m_instance;

    // Table creation
    bool createTables();
};

#endif // CREDITAUDITLOG_H
