#include "creditledgerdbmanager.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include "logger.h"

// Initialize static member
CreditLedgerDBManager* CreditLedgerDBManager::m_instance = nullptr;

CreditLedgerDBManager* CreditLedgerDBManager::instance()
{
    if (!m_instance) {
        m_instance = new CreditLedgerDBManager();
    }
    return m_instance;
}

CreditLedgerDBManager::CreditLedgerDBManager()
{
    m_dbManager = DatabaseManager::instance();
}

bool CreditLedgerDBManager::initialize()
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Core database manager not initialized for credit ledger");
        return false;
    }

    return createTables();
}

bool CreditLedgerDBManager::createTables()
{
    if (!m_dbManager->createTable("credit_baseline",
                                  "("
                                  "ro_number TEXT NOT NULL "
                                  "REFERENCES repair_orders(ro_number) ON DELETE CASCADE, "
                                  "milestone_id TEXT NOT NULL, "
                                  "base_hours REAL NOT NULL, "
                                  "from_stage TEXT NOT NULL, "
                                  "to_stage TEXT NOT NULL, "
                                  "date TEXT NOT NULL, "
                                  "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP, "
                                  "PRIMARY KEY (ro_number, milestone_id)"
                                  ")")) {
        Logger::instance().error("Failed to create credit_baseline table");
        return false;
    }

    if (!m_dbManager->createTable("credit_adjustments",
                                  "("
                                  "id INTEGER PRIMARY KEY AUTOINCREMENT, "
                                  "ro_number TEXT NOT NULL "
                                  "REFERENCES repair_orders(ro_number) ON DELETE CASCADE, "
                                  "milestone_id TEXT NOT NULL, "
                                  "from_stage TEXT NOT NULL, "
                                  "to_stage TEXT NOT NULL, "
                                  "date TEXT NOT NULL, "
                                  "tech TEXT NOT NULL DEFAULT '', "
                                  "delta_hours REAL NOT NULL, "
                                  "share REAL NOT NULL, "
                                  "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP"
                                  ")")) {
        Logger::instance().error("Failed to create credit_adjustments table");
        return false;
    }

    if (!m_dbManager->executeQuery("CREATE INDEX IF NOT EXISTS idx_credit_adjustments_key "
                                   "ON credit_adjustments(ro_number, milestone_id)")) {
        Logger::instance().error("Failed to create credit_adjustments index");
        return false;
    }

    return true;
}

bool CreditLedgerDBManager::ensureBaseline(const CreditBaseline& baseline, bool* inserted)
{
    if (inserted) {
        *inserted = false;
    }

    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for ensureBaseline");
        return false;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("INSERT OR IGNORE INTO credit_baseline "
                  "(ro_number, milestone_id, base_hours, from_stage, to_stage, date) "
                  "VALUES (:ro_number, :milestone_id, :base_hours, :from_stage, :to_stage, :date)");
    query.bindValue(":ro_number", baseline.roNumber);
    query.bindValue(":milestone_id", baseline.milestoneId);
    query.bindValue(":base_hours", baseline.baseHours);
    query.bindValue(":from_stage", baseline.fromStage);
    query.bindValue(":to_stage", baseline.toStage);
    query.bindValue(":date", baseline.date);

    if (!m_dbManager->executeQuery(query)) {
        Logger::instance().error(QString("Failed to store baseline %1 for RO %2")
                                     .arg(baseline.milestoneId, baseline.roNumber));
        return false;
    }

    if (query.numRowsAffected() > 0) {
        if (inserted) {
            *inserted = true;
        }
        Logger::instance().info(QString("Baseline %1 captured for RO %2: %3h")
                                    .arg(baseline.milestoneId, baseline.roNumber)
                                    .arg(baseline.baseHours, 0, 'f', 2));
    }
    return true;
}

bool CreditLedgerDBManager::findBaseline(const QString& roNumber, const QString& milestoneId,
                                         CreditBaseline& baseline, bool* ok)
{
    if (ok) {
        *ok = false;
    }

    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for findBaseline");
        return false;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("SELECT ro_number, milestone_id, base_hours, from_stage, to_stage, date "
                  "FROM credit_baseline WHERE ro_number = :ro_number AND milestone_id = :milestone_id");
    query.bindValue(":ro_number", roNumber);
    query.bindValue(":milestone_id", milestoneId);

    if (!m_dbManager->executeQuery(query)) {
        return false;
    }

    if (ok) {
        *ok = true;
    }

    if (!query.next()) {
        return false;
    }

    baseline.roNumber = query.value("ro_number").toString();
    baseline.milestoneId = query.value("milestone_id").toString();
    baseline.baseHours = query.value("base_hours").toDouble();
    baseline.fromStage = query.value("from_stage").toString();
    baseline.toStage = query.value("to_stage").toString();
    baseline.date = query.value("date").toString();
    return true;
}

qint64 CreditLedgerDBManager::addAdjustment(const CreditAdjustment& adjustment)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for addAdjustment");
        return 0;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("INSERT INTO credit_adjustments "
                  "(ro_number, milestone_id, from_stage, to_stage, date, tech, delta_hours, share) "
                  "VALUES (:ro_number, :milestone_id, :from_stage, :to_stage, :date, :tech, "
                  ":delta_hours, :share)");
    query.bindValue(":ro_number", adjustment.roNumber);
    query.bindValue(":milestone_id", adjustment.milestoneId);
    query.bindValue(":from_stage", adjustment.fromStage);
    query.bindValue(":to_stage", adjustment.toStage);
    query.bindValue(":date", adjustment.date);
    query.bindValue(":tech", DatabaseManager::textValue(adjustment.tech));
    query.bindValue(":delta_hours", adjustment.deltaHours);
    query.bindValue(":share", adjustment.share);

    if (!m_dbManager->executeQuery(query)) {
        Logger::instance().error(QString("Failed to add adjustment %1 for RO %2")
                                     .arg(adjustment.milestoneId, adjustment.roNumber));
        return 0;
    }

    Logger::instance().info(QString("Adjustment %1%2h on %3 for RO %4")
                                .arg(adjustment.deltaHours >= 0.0 ? "+" : "")
                                .arg(adjustment.deltaHours, 0, 'f', 2)
                                .arg(adjustment.milestoneId, adjustment.roNumber));
    return query.lastInsertId().toLongLong();
}

bool CreditLedgerDBManager::deleteAdjustment(qint64 id)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for deleteAdjustment");
        return false;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("DELETE FROM credit_adjustments WHERE id = :id");
    query.bindValue(":id", id);

    if (!m_dbManager->executeQuery(query)) {
        Logger::instance().error(QString("Failed to delete adjustment %1").arg(id));
        return false;
    }

    if (query.numRowsAffected() == 0) {
        Logger::instance().warning(QString("No adjustment with id %1").arg(id));
        return false;
    }

    Logger::instance().info(QString("Adjustment %1 deleted").arg(id));
    return true;
}

QList<CreditAdjustment> CreditLedgerDBManager::adjustmentsFor(const QString& roNumber,
                                                              const QString& milestoneId,
                                                              bool* ok)
{
    QList<CreditAdjustment> adjustments;
    if (ok) {
        *ok = false;
    }

    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for adjustmentsFor");
        return adjustments;
    }

    QString sql = "SELECT id, ro_number, milestone_id, from_stage, to_stage, date, tech, "
                  "delta_hours, share FROM credit_adjustments WHERE ro_number = :ro_number";
    if (!milestoneId.isEmpty()) {
        sql += " AND milestone_id = :milestone_id";
    }
    sql += " ORDER BY id ASC";

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare(sql);
    query.bindValue(":ro_number", roNumber);
    if (!milestoneId.isEmpty()) {
        query.bindValue(":milestone_id", milestoneId);
    }

    if (!m_dbManager->executeQuery(query)) {
        return adjustments;
    }

    while (query.next()) {
        CreditAdjustment adjustment;
        adjustment.id = query.value("id").toLongLong();
        adjustment.roNumber = query.value("ro_number").toString();
        adjustment.milestoneId = query.value("milestone_id").toString();
        adjustment.fromStage = query.value("from_stage").toString();
        adjustment.toStage = query.value("to_stage").toString();
        adjustment.date = query.value("date").toString();
        adjustment.tech = query.value("tech").toString();
        adjustment.deltaHours = query.value("delta_hours").toDouble();
        adjustment.share = query.value("share").toDouble();
        adjustments.append(adjustment);
    }

    if (ok) {
        *ok = true;
    }
    return adjustments;
}

double CreditLedgerDBManager::sumAdjustments(const QString& roNumber, const QString& milestoneId, bool* ok)
{
    if (ok) {
        *ok = false;
    }

    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for sumAdjustments");
        return 0.0;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("SELECT COALESCE(SUM(delta_hours), 0) FROM credit_adjustments "
                  "WHERE ro_number = :ro_number AND milestone_id = :milestone_id");
    query.bindValue(":ro_number", roNumber);
    query.bindValue(":milestone_id", milestoneId);

    if (!m_dbManager->executeQuery(query) || !query.next()) {
        return 0.0;
    }

    if (ok) {
        *ok = true;
    }
    return query.value(0).toDouble();
}

int CreditLedgerDBManager::adjustmentCount(const QString& roNumber)
{
    if (!m_dbManager->isInitialized()) {
        return 0;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("SELECT COUNT(*) FROM credit_adjustments WHERE ro_number = :ro_number");
    query.bindValue(":ro_number", roNumber);

    if (!m_dbManager->executeQuery(query) || !query.next()) {
        return 0;
    }
    return query.value(0).toInt();
}
