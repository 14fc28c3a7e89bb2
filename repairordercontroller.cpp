#include "repairordercontroller.h"
#include "configmanager.h"
#include "creditledger.h"
#include "databasemanager.h"
#include "errorhandling.h"
#include "repairorderdbmanager.h"
#include "stageorder.h"
#include "stagetransitionlog.h"
#include "validator.h"

RepairOrderController::RepairOrderController(CreditLedger* ledger, QObject* parent)
    : QObject(parent),
    m_ledger(ledger),
    m_dbManager(DatabaseManager::instance()),
    m_roManager(RepairOrderDBManager::instance()),
    m_transitions(StageTransitionLog::instance())
{
}

RepairOrderController::~RepairOrderController()
{
}

bool RepairOrderController::loadExisting(const QString& roNumber, RepairOrder& ro)
{
    const QString number = Validator::requireRoNumber(roNumber);
    if (!m_roManager->loadRepairOrder(number, ro)) {
        Logger::instance().warning(QString("RO %1 does not exist").arg(number));
        return false;
    }
    return true;
}

bool RepairOrderController::createRepairOrder(const RepairOrder& ro)
{
    RepairOrder record = ro;
    record.roNumber = Validator::requireRoNumber(ro.roNumber);

    if (!Validator::isValidHours(record.totalHours) || record.totalHours <= 0.0) {
        THROW_VALIDATION_ERROR("Total hours must be positive", "total_hours");
    }
    for (auto it = record.buckets.constBegin(); it != record.buckets.constEnd(); ++it) {
        if (!Validator::isValidHours(it.value())) {
            THROW_VALIDATION_ERROR(QString("Invalid hours for %1").arg(it.key()), it.key());
        }
    }
    for (const Allocation& allocation : record.allocations) {
        Validator::requirePercent(allocation.percent, "percent");
    }

    ConfigManager& config = ConfigManager::instance();
    const StageOrder order = StageOrder::fromConfig();
    if (record.stage.isEmpty() && !order.isEmpty()) {
        record.stage = order.stages().first();
    }
    Validator::requireStage(record.stage, order.stages());
    Validator::requireStatus(record.status, config.getStringList("Ledger/Statuses"));
    if (!record.date.isEmpty() && !Validator::isValidDate(record.date)) {
        THROW_VALIDATION_ERROR(QString("Invalid date '%1'").arg(record.date), "date");
    }

    if (m_roManager->roExists(record.roNumber)) {
        Logger::instance().warning(QString("RO %1 already exists").arg(record.roNumber));
        return false;
    }

    return m_roManager->createRepairOrder(record);
}

bool RepairOrderController::changeStage(const QString& roNumber, const QString& stage, const QDateTime& when)
{
    const StageOrder order = StageOrder::fromConfig();
    Validator::requireStage(stage, order.stages());

    RepairOrder ro;
    if (!loadExisting(roNumber, ro)) {
        return false;
    }

    if (ro.stage == stage) {
        return true;
    }

    ScopedTransaction transaction(m_dbManager);
    if (!transaction.isActive()) {
        return false;
    }

    if (m_transitions->recordTransition(ro.roNumber, ro.stage, stage, when) == 0
        || !m_roManager->setStage(ro.roNumber, stage)) {
        return false;
    }

    m_ledger->recompute(ro.roNumber);

    if (!transaction.commit()) {
        return false;
    }

    emit stageChanged(ro.roNumber, ro.stage, stage);
    return true;
}

bool RepairOrderController::changeBucket(const QString& roNumber, const QString& bucket, const QString& hoursText)
{
    if (!RepairOrder::bucketNames().contains(bucket)) {
        THROW_VALIDATION_ERROR(QString("Unknown hour bucket '%1'").arg(bucket), "bucket");
    }
    const double hours = Validator::requireHours(hoursText, bucket);

    RepairOrder ro;
    if (!loadExisting(roNumber, ro)) {
        return false;
    }

    ScopedTransaction transaction(m_dbManager);
    if (!transaction.isActive()) {
        return false;
    }

    if (!m_roManager->setBucket(ro.roNumber, bucket, hours)) {
        return false;
    }

    m_ledger->recompute(ro.roNumber);
    return transaction.commit();
}

bool RepairOrderController::changeStatus(const QString& roNumber, const QString& status)
{
    ConfigManager& config = ConfigManager::instance();
    Validator::requireStatus(status, config.getStringList("Ledger/Statuses"));
    const QString closedStatus = config.getString("Ledger/ClosedStatus", "closed");

    RepairOrder ro;
    if (!loadExisting(roNumber, ro)) {
        return false;
    }

    if (ro.status == status) {
        return true;
    }

    ScopedTransaction transaction(m_dbManager);
    if (!transaction.isActive()) {
        return false;
    }

    const bool closing = status == closedStatus;
    // Recompute while still open so the true-up below is the one close pass
    if (closing) {
        m_ledger->recompute(ro.roNumber);
    }

    if (!m_roManager->setStatus(ro.roNumber, status)) {
        return false;
    }

    int posted = 0;
    if (closing) {
        posted = m_ledger->closeReconcile(ro.roNumber);
    }

    if (!transaction.commit()) {
        return false;
    }

    emit statusChanged(ro.roNumber, status);
    if (closing) {
        emit repairOrderClosed(ro.roNumber, posted);
    }
    return true;
}

bool RepairOrderController::assignEmployee(const QString& roNumber, const QString& role, const QString& employee)
{
    if (!Validator::isNotEmpty(role)) {
        THROW_VALIDATION_ERROR("Role is required", "role");
    }

    RepairOrder ro;
    if (!loadExisting(roNumber, ro)) {
        return false;
    }

    ScopedTransaction transaction(m_dbManager);
    if (!transaction.isActive()) {
        return false;
    }

    if (!m_roManager->setAssignment(ro.roNumber, role, employee)) {
        return false;
    }

    m_ledger->recompute(ro.roNumber);
    return transaction.commit();
}

bool RepairOrderController::setAllocations(const QString& roNumber, const QString& role,
                                           const QList<Allocation>& allocations)
{
    if (!Validator::isNotEmpty(role)) {
        THROW_VALIDATION_ERROR("Role is required", "role");
    }

    double total = 0.0;
    for (const Allocation& allocation : allocations) {
        if (!Validator::isNotEmpty(allocation.employee)) {
            THROW_VALIDATION_ERROR("Allocation needs an employee", "employee");
        }
        Validator::requirePercent(allocation.percent, "percent");
        total += allocation.percent;
    }
    if (total > 100.0 + 1e-9) {
        THROW_VALIDATION_ERROR(QString("Allocations for %1 add up to %2%").arg(role).arg(total), "percent");
    }

    RepairOrder ro;
    if (!loadExisting(roNumber, ro)) {
        return false;
    }

    ScopedTransaction transaction(m_dbManager);
    if (!transaction.isActive()) {
        return false;
    }

    if (!m_roManager->setAllocations(ro.roNumber, role, allocations)) {
        return false;
    }

    m_ledger->recompute(ro.roNumber);
    return transaction.commit();
}

bool RepairOrderController::deleteRepairOrder(const QString& roNumber)
{
    return m_roManager->deleteRepairOrder(Validator::requireRoNumber(roNumber));
}
