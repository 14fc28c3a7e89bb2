#ifndef CREDITLEDGER_H
#define CREDITLEDGER_H

#include <QObject>
#include <QString>
#include <QList>
#include <QMap>
#include <QDate>
#include "creditsource.h"
#include "ledgertypes.h"
#include "milestonepolicy.h"
#include "stageorder.h"

class DatabaseManager;
class RepairOrderDBManager;
class StageTransitionLog;
class CreditLedgerDBManager;
class CreditOverrideDBManager;
class CreditAuditLog;
class WorkedHoursSource;

/**
 * @brief Configuration the ledger resolves at the start of every call
 */
struct LedgerContext
{
    StageOrder stageOrder;
    MilestonePolicy policy;
    CreditSource::Mode creditMode = CreditSource::FixedRole;
    double residualEpsilon = 1e-6;
    double closeTolerance = 0.01;
    QString closedStatus;

    /**
     * @throws ConfigurationException for an empty stage list, an unknown
     *         credit mode or a malformed milestone
     */
    static LedgerContext fromConfig();
};

/**
 * @brief Production credit ledger for repair orders
 *
 * Captures a frozen baseline the first time a milestone is reached,
 * records later bucket edits as signed adjustments, renders credit rows
 * with operator overrides substituted, posts them to the audit log and
 * trues up posted credit when an RO closes.
 *
 * Every public call re-reads the stage order and milestone table from
 * ConfigManager. Write paths run inside one ScopedTransaction and throw
 * DatabaseException on a failed write so the transaction rolls back.
 */
class CreditLedger : public QObject
{
    Q_OBJECT

public:
    explicit CreditLedger(QObject* parent = nullptr);
    ~CreditLedger();

    /**
     * @brief Source of worked hours for summary(); defaults to TimeClockDBManager
     */
    void setWorkedHoursSource(WorkedHoursSource* source);

    /**
     * @brief Capture baselines and residual adjustments for one RO and post its credit
     *
     * On a closed RO the close true-up runs again afterwards, so credit
     * reached after close does not stay on top of the expected totals.
     *
     * @return False if the RO does not exist
     * @throws DatabaseException if a ledger write fails
     */
    bool recompute(const QString& roNumber);

    /**
     * @brief Recompute every RO; a failing RO is logged and skipped
     * @return Number of ROs recomputed successfully
     */
    int recomputeAll();

    /**
     * @brief Credit rows for display and export, overrides applied
     *
     * Read-only. A milestone reached since the last recompute shows its
     * pending baseline and residual without writing them.
     */
    QList<CreditRow> generatedCreditRows(const QString& roNumber);

    bool setOverride(const CreditOverride& creditOverride);
    bool deleteOverride(const CreditRowKey& key);

    /**
     * @brief Reverse the adjustment behind a supplement row
     *
     * The signed delta is recovered from the displayed hours, the
     * milestone share and the recipient's weight; when an override has
     * changed the hours, the magnitude in the note is used instead.
     * The row's override and posted audit lines are removed with it.
     *
     * @return False for baseline rows or when no adjustment matches
     */
    bool deleteSupplement(const CreditRow& row);

    /**
     * @brief Operator delete: refuse baseline rows, reverse supplements,
     *        otherwise drop the row's override
     */
    bool deleteCreditRow(const CreditRow& row);

    /**
     * @brief Post balancing entries so posted credit matches expected credit
     * @return Number of entries posted
     * @throws DatabaseException if a posting fails
     */
    int closeReconcile(const QString& roNumber);

    QList<SummaryRow> summary(const QDate& from = QDate(), const QDate& to = QDate());
    QList<CreditAuditEntry> auditEntries(const QString& roNumber = QString());

signals:
    void recomputed(const QString& roNumber, double hoursTaken);
    void creditRowsChanged(const QString& roNumber);
    void closeReconciled(const QString& roNumber, int entriesPosted);

private:
    DatabaseManager* m_dbManager;
    RepairOrderDBManager* m_roManager;
    StageTransitionLog* m_transitions;
    CreditLedgerDBManager* m_ledgerDb;
    CreditOverrideDBManager* m_overrides;
    CreditAuditLog* m_auditLog;
    WorkedHoursSource* m_workedSource;

    /**
     * @brief Walk the milestone table for one RO
     * @param capture Write new baselines and residual adjustments; when
     *        false they are only projected into the returned rows
     */
    QList<CreditRow> buildRows(const RepairOrder& ro, const LedgerContext& context,
                               const CreditSource& source, bool capture);

    static QString uniqueNote(const QString& note, QMap<QString, int>& seen);
    static QString today();
};

#endif // CREDITLEDGER_H
