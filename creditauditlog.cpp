#include "creditauditlog.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QStringList>
#include "creditoverridedbmanager.h"
#include "repairorderdbmanager.h"
#include "logger.h"

// Initialize static member
CreditAuditLog* CreditAuditLog::m_instance = nullptr;

CreditAuditLog* CreditAuditLog::instance()
{
    if (!m_instance) {
        m_instance = new CreditAuditLog();
    }
    return m_instance;
}

CreditAuditLog::CreditAuditLog()
{
    m_dbManager = DatabaseManager::instance();
}

bool CreditAuditLog::initialize()
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Core database manager not initialized for credit audit");
        return false;
    }

    return createTables();
}

bool CreditAuditLog::createTables()
{
    if (!m_dbManager->createTable("credit_audit",
                                  "("
                                  "id INTEGER PRIMARY KEY AUTOINCREMENT, "
                                  "date TEXT NOT NULL, "
                                  "ro_number TEXT NOT NULL "
                                  "REFERENCES repair_orders(ro_number) ON DELETE CASCADE, "
                                  "employee TEXT NOT NULL, "
                                  "hours REAL NOT NULL, "
                                  "note TEXT NOT NULL, "
                                  "from_stage TEXT, "
                                  "to_stage TEXT, "
                                  "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP"
                                  ")")) {
        Logger::instance().error("Failed to create credit_audit table");
        return false;
    }

    // Not unique: close adjustments may legitimately repeat their note
    if (!m_dbManager->executeQuery("CREATE INDEX IF NOT EXISTS idx_credit_audit_key "
                                   "ON credit_audit(ro_number, employee, note)")) {
        Logger::instance().error("Failed to create credit_audit index");
        return false;
    }

    return true;
}

CreditAuditLog::PostResult CreditAuditLog::postCredit(const CreditAuditEntry& entry, PostMode mode)
{
    if (entry.employee.trimmed().isEmpty() || entry.hours == 0.0) {
        Logger::instance().debug(QString("Nothing to post for RO %1 '%2'").arg(entry.roNumber, entry.note));
        return Skipped;
    }

    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for postCredit");
        return Failed;
    }

    // The RO may have been deleted while a recompute was running
    if (!RepairOrderDBManager::instance()->roExists(entry.roNumber)) {
        Logger::instance().debug(QString("RO %1 no longer exists, credit not posted").arg(entry.roNumber));
        return Skipped;
    }

    if (mode == IfAbsent && hasEntry(entry.roNumber, entry.employee, entry.note)) {
        return Skipped;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("INSERT INTO credit_audit (date, ro_number, employee, hours, note, from_stage, to_stage) "
                  "VALUES (:date, :ro_number, :employee, :hours, :note, :from_stage, :to_stage)");
    query.bindValue(":date", entry.date);
    query.bindValue(":ro_number", entry.roNumber);
    query.bindValue(":employee", entry.employee.trimmed());
    query.bindValue(":hours", entry.hours);
    query.bindValue(":note", entry.note);
    query.bindValue(":from_stage", entry.fromStage.isEmpty() ? QVariant() : QVariant(entry.fromStage));
    query.bindValue(":to_stage", entry.toStage.isEmpty() ? QVariant() : QVariant(entry.toStage));

    if (!m_dbManager->executeQuery(query)) {
        Logger::instance().error(QString("Failed to post credit for RO %1 '%2'").arg(entry.roNumber, entry.note));
        return Failed;
    }

    Logger::instance().info(QString("Posted %1h to %2 on RO %3: %4")
                                .arg(entry.hours, 0, 'f', 2)
                                .arg(entry.employee, entry.roNumber, entry.note));
    return Posted;
}

bool CreditAuditLog::hasEntry(const QString& roNumber, const QString& employee, const QString& note)
{
    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("SELECT 1 FROM credit_audit WHERE ro_number = :ro_number "
                  "AND employee = :employee AND note = :note LIMIT 1");
    query.bindValue(":ro_number", roNumber);
    query.bindValue(":employee", employee.trimmed());
    query.bindValue(":note", note);

    if (!m_dbManager->executeQuery(query)) {
        return false;
    }
    return query.next();
}

QList<CreditAuditEntry> CreditAuditLog::entries(const QString& roNumber, const QDate& from, const QDate& to)
{
    QList<CreditAuditEntry> result;

    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for audit entries");
        return result;
    }

    QStringList conditions;
    if (!roNumber.isEmpty()) {
        conditions << "ro_number = :ro_number";
    }
    if (from.isValid()) {
        conditions << "date >= :from_date";
    }
    if (to.isValid()) {
        conditions << "date <= :to_date";
    }

    QString sql = "SELECT id, date, ro_number, employee, hours, note, from_stage, to_stage FROM credit_audit";
    if (!conditions.isEmpty()) {
        sql += " WHERE " + conditions.join(" AND ");
    }
    sql += " ORDER BY date DESC, id DESC";

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare(sql);
    if (!roNumber.isEmpty()) {
        query.bindValue(":ro_number", roNumber);
    }
    if (from.isValid()) {
        query.bindValue(":from_date", from.toString("yyyy-MM-dd"));
    }
    if (to.isValid()) {
        query.bindValue(":to_date", to.toString("yyyy-MM-dd"));
    }

    if (!m_dbManager->executeQuery(query)) {
        return result;
    }

    while (query.next()) {
        CreditAuditEntry entry;
        entry.id = query.value("id").toLongLong();
        entry.date = query.value("date").toString();
        entry.roNumber = query.value("ro_number").toString();
        entry.employee = query.value("employee").toString();
        entry.hours = query.value("hours").toDouble();
        entry.note = query.value("note").toString();
        entry.fromStage = query.value("from_stage").toString();
        entry.toStage = query.value("to_stage").toString();
        result.append(entry);
    }

    return result;
}

QList<CreditAuditEntry> CreditAuditLog::effectiveEntries(const QString& roNumber, const QDate& from, const QDate& to)
{
    QList<CreditAuditEntry> result = entries(roNumber, from, to);
    CreditOverrideDBManager::instance()->applyOverrides(result);
    return result;
}

QMap<QString, double> CreditAuditLog::postedTotals(const QString& roNumber)
{
    QMap<QString, double> totals;
    const QList<CreditAuditEntry> posted = effectiveEntries(roNumber);
    for (const CreditAuditEntry& entry : posted) {
        if (!entry.employee.isEmpty()) {
            totals[entry.employee] += entry.hours;
        }
    }
    return totals;
}

bool CreditAuditLog::deleteEntries(const QString& roNumber, const QString& note)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for deleteEntries");
        return false;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("DELETE FROM credit_audit WHERE ro_number = :ro_number AND note = :note");
    query.bindValue(":ro_number", roNumber);
    query.bindValue(":note", note);

    if (!m_dbManager->executeQuery(query)) {
        Logger::instance().error(QString("Failed to delete audit entries for RO %1 '%2'").arg(roNumber, note));
        return false;
    }

    Logger::instance().info(QString("Removed %1 audit entries for RO %2 '%3'")
                                .arg(query.numRowsAffected())
                                .arg(roNumber, note));
    return true;
}
