#ifndef REPAIRORDERCONTROLLER_H
#define REPAIRORDERCONTROLLER_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QList>
#include "repairorder.h"

class CreditLedger;
class DatabaseManager;
class RepairOrderDBManager;
class StageTransitionLog;

/**
 * @brief RO edits that feed the credit ledger
 *
 * Each change is validated, stored and followed by a recompute inside
 * one transaction. Invalid input throws ValidationException before
 * anything is written.
 */
class RepairOrderController : public QObject
{
    Q_OBJECT

public:
    explicit RepairOrderController(CreditLedger* ledger, QObject* parent = nullptr);
    ~RepairOrderController();

    /**
     * @brief Create an RO at its initial stage
     * @return False if the RO already exists or the insert fails
     */
    bool createRepairOrder(const RepairOrder& ro);

    /**
     * @brief Move an RO to another stage
     *
     * Records a transition only when the stage actually changes.
     */
    bool changeStage(const QString& roNumber, const QString& stage, const QDateTime& when = QDateTime());

    /**
     * @brief Edit one hour bucket
     * @param hoursText Operator input; blank means 0
     */
    bool changeBucket(const QString& roNumber, const QString& bucket, const QString& hoursText);

    /**
     * @brief Change status; entering the closed status runs close reconciliation once
     */
    bool changeStatus(const QString& roNumber, const QString& status);

    bool assignEmployee(const QString& roNumber, const QString& role, const QString& employee);
    bool setAllocations(const QString& roNumber, const QString& role, const QList<Allocation>& allocations);

    bool deleteRepairOrder(const QString& roNumber);

signals:
    void stageChanged(const QString& roNumber, const QString& fromStage, const QString& toStage);
    void statusChanged(const QString& roNumber, const QString& status);
    void repairOrderClosed(const QString& roNumber, int adjustmentsPosted);

private:
    CreditLedger* m_ledger;
    DatabaseManager* m_dbManager;
    RepairOrderDBManager* m_roManager;
    StageTransitionLog* m_transitions;

    bool loadExisting(const QString& roNumber, RepairOrder& ro);
};

#endif // REPAIRORDERCONTROLLER_H
