#include "repairorderdbmanager.h"
#include <QDateTime>
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include "logger.h"

// Initialize static member
RepairOrderDBManager* RepairOrderDBManager::m_instance = nullptr;

RepairOrderDBManager* RepairOrderDBManager::instance()
{
    if (!m_instance) {
        m_instance = new RepairOrderDBManager();
    }
    return m_instance;
}

RepairOrderDBManager::RepairOrderDBManager()
{
    m_dbManager = DatabaseManager::instance();
}

bool RepairOrderDBManager::initialize()
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Core database manager not initialized for repair orders");
        return false;
    }

    return createTables();
}

bool RepairOrderDBManager::createTables()
{
    if (!m_dbManager->createTable("repair_orders",
                                  "("
                                  "ro_number TEXT PRIMARY KEY, "
                                  "date TEXT NOT NULL DEFAULT '', "
                                  "total_hours REAL NOT NULL DEFAULT 0, "
                                  "body_hours REAL NOT NULL DEFAULT 0, "
                                  "refinish_hours REAL NOT NULL DEFAULT 0, "
                                  "mechanical_hours REAL NOT NULL DEFAULT 0, "
                                  "hours_taken REAL NOT NULL DEFAULT 0, "
                                  "hours_remaining REAL NOT NULL DEFAULT 0, "
                                  "stage TEXT NOT NULL, "
                                  "status TEXT NOT NULL DEFAULT 'open', "
                                  "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP, "
                                  "updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP"
                                  ")")) {
        Logger::instance().error("Failed to create repair_orders table");
        return false;
    }

    if (!m_dbManager->createTable("ro_assignments",
                                  "("
                                  "ro_number TEXT NOT NULL "
                                  "REFERENCES repair_orders(ro_number) ON DELETE CASCADE, "
                                  "role TEXT NOT NULL, "
                                  "employee TEXT NOT NULL, "
                                  "PRIMARY KEY (ro_number, role)"
                                  ")")) {
        Logger::instance().error("Failed to create ro_assignments table");
        return false;
    }

    if (!m_dbManager->createTable("ro_allocations",
                                  "("
                                  "id INTEGER PRIMARY KEY AUTOINCREMENT, "
                                  "ro_number TEXT NOT NULL "
                                  "REFERENCES repair_orders(ro_number) ON DELETE CASCADE, "
                                  "employee TEXT NOT NULL, "
                                  "role TEXT NOT NULL, "
                                  "percent REAL NOT NULL, "
                                  "UNIQUE (ro_number, employee, role)"
                                  ")")) {
        Logger::instance().error("Failed to create ro_allocations table");
        return false;
    }

    Logger::instance().info("Repair order tables created successfully");
    return true;
}

QString RepairOrderDBManager::bucketColumn(const QString& bucket)
{
    // Only known bucket names ever reach SQL text
    return RepairOrder::bucketNames().contains(bucket) ? bucket : QString();
}

bool RepairOrderDBManager::createRepairOrder(const RepairOrder& ro)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for createRepairOrder");
        return false;
    }

    ScopedTransaction transaction(m_dbManager);
    if (!transaction.isActive()) {
        return false;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("INSERT INTO repair_orders "
                  "(ro_number, date, total_hours, body_hours, refinish_hours, mechanical_hours, "
                  "hours_taken, hours_remaining, stage, status) "
                  "VALUES (:ro_number, :date, :total_hours, :body_hours, :refinish_hours, "
                  ":mechanical_hours, 0, :hours_remaining, :stage, :status)");
    query.bindValue(":ro_number", ro.roNumber);
    query.bindValue(":date", DatabaseManager::textValue(ro.date));
    query.bindValue(":total_hours", ro.totalHours);
    query.bindValue(":body_hours", ro.bucket(RepairOrder::BODY_HOURS));
    query.bindValue(":refinish_hours", ro.bucket(RepairOrder::REFINISH_HOURS));
    query.bindValue(":mechanical_hours", ro.bucket(RepairOrder::MECHANICAL_HOURS));
    query.bindValue(":hours_remaining", ro.totalHours);
    query.bindValue(":stage", ro.stage);
    query.bindValue(":status", ro.status);

    if (!m_dbManager->executeQuery(query)) {
        Logger::instance().error(QString("Failed to create RO %1: %2").arg(ro.roNumber, query.lastError().text()));
        return false;
    }

    for (auto it = ro.assignments.constBegin(); it != ro.assignments.constEnd(); ++it) {
        if (!setAssignment(ro.roNumber, it.key(), it.value())) {
            return false;
        }
    }

    QStringList roles;
    for (const Allocation& allocation : ro.allocations) {
        if (!roles.contains(allocation.role)) {
            roles.append(allocation.role);
        }
    }
    for (const QString& role : roles) {
        if (!setAllocations(ro.roNumber, role, ro.allocationsForRole(role))) {
            return false;
        }
    }

    if (!transaction.commit()) {
        return false;
    }

    Logger::instance().info(QString("RO %1 created at stage %2").arg(ro.roNumber, ro.stage));
    return true;
}

bool RepairOrderDBManager::loadRepairOrder(const QString& roNumber, RepairOrder& ro)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for loadRepairOrder");
        return false;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("SELECT ro_number, date, total_hours, body_hours, refinish_hours, mechanical_hours, "
                  "hours_taken, hours_remaining, stage, status "
                  "FROM repair_orders WHERE ro_number = :ro_number");
    query.bindValue(":ro_number", roNumber);

    if (!m_dbManager->executeQuery(query)) {
        return false;
    }

    if (!query.next()) {
        Logger::instance().warning(QString("No RO found for %1").arg(roNumber));
        return false;
    }

    ro.reset();
    ro.roNumber = query.value("ro_number").toString();
    ro.date = query.value("date").toString();
    ro.totalHours = query.value("total_hours").toDouble();
    for (const QString& bucket : RepairOrder::bucketNames()) {
        ro.buckets[bucket] = query.value(bucket).toDouble();
    }
    ro.hoursTaken = query.value("hours_taken").toDouble();
    ro.hoursRemaining = query.value("hours_remaining").toDouble();
    ro.stage = query.value("stage").toString();
    ro.status = query.value("status").toString();

    QSqlQuery people(m_dbManager->getDatabase());
    people.prepare("SELECT role, employee FROM ro_assignments WHERE ro_number = :ro_number");
    people.bindValue(":ro_number", roNumber);
    if (!m_dbManager->executeQuery(people)) {
        return false;
    }
    while (people.next()) {
        ro.assignments.insert(people.value("role").toString(), people.value("employee").toString());
    }

    QSqlQuery shares(m_dbManager->getDatabase());
    shares.prepare("SELECT employee, role, percent FROM ro_allocations "
                   "WHERE ro_number = :ro_number ORDER BY id");
    shares.bindValue(":ro_number", roNumber);
    if (!m_dbManager->executeQuery(shares)) {
        return false;
    }
    while (shares.next()) {
        Allocation allocation;
        allocation.employee = shares.value("employee").toString();
        allocation.role = shares.value("role").toString();
        allocation.percent = shares.value("percent").toDouble();
        ro.allocations.append(allocation);
    }

    return true;
}

bool RepairOrderDBManager::roExists(const QString& roNumber)
{
    if (!m_dbManager->isInitialized()) {
        return false;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("SELECT 1 FROM repair_orders WHERE ro_number = :ro_number");
    query.bindValue(":ro_number", roNumber);

    if (!m_dbManager->executeQuery(query)) {
        return false;
    }
    return query.next();
}

QStringList RepairOrderDBManager::roNumbers()
{
    QStringList numbers;
    const QList<QMap<QString, QVariant>> rows =
        m_dbManager->executeSelectQuery("SELECT ro_number FROM repair_orders ORDER BY ro_number");
    for (const QMap<QString, QVariant>& row : rows) {
        numbers.append(row.value("ro_number").toString());
    }
    return numbers;
}

bool RepairOrderDBManager::deleteRepairOrder(const QString& roNumber)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for deleteRepairOrder");
        return false;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("DELETE FROM repair_orders WHERE ro_number = :ro_number");
    query.bindValue(":ro_number", roNumber);

    if (!m_dbManager->executeQuery(query)) {
        Logger::instance().error(QString("Failed to delete RO %1").arg(roNumber));
        return false;
    }

    if (query.numRowsAffected() == 0) {
        Logger::instance().warning(QString("No RO to delete for %1").arg(roNumber));
        return false;
    }

    Logger::instance().info(QString("RO %1 deleted").arg(roNumber));
    return true;
}

bool RepairOrderDBManager::updateColumn(const QString& roNumber, const QString& column, const QVariant& value)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for RO update");
        return false;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare(QString("UPDATE repair_orders SET %1 = :value, updated_at = :updated_at "
                          "WHERE ro_number = :ro_number").arg(column));
    query.bindValue(":value", value);
    query.bindValue(":updated_at", QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss"));
    query.bindValue(":ro_number", roNumber);

    if (!m_dbManager->executeQuery(query)) {
        Logger::instance().error(QString("Failed to update %1 on RO %2").arg(column, roNumber));
        return false;
    }

    if (query.numRowsAffected() == 0) {
        Logger::instance().warning(QString("No RO found for %1").arg(roNumber));
        return false;
    }
    return true;
}

bool RepairOrderDBManager::setBucket(const QString& roNumber, const QString& bucket, double hours)
{
    const QString column = bucketColumn(bucket);
    if (column.isEmpty()) {
        Logger::instance().error(QString("Unknown hour bucket %1").arg(bucket));
        return false;
    }
    return updateColumn(roNumber, column, hours);
}

bool RepairOrderDBManager::setStage(const QString& roNumber, const QString& stage)
{
    return updateColumn(roNumber, "stage", stage);
}

bool RepairOrderDBManager::setStatus(const QString& roNumber, const QString& status)
{
    return updateColumn(roNumber, "status", status);
}

bool RepairOrderDBManager::updateDerivedHours(const QString& roNumber, double hoursTaken, double hoursRemaining)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for updateDerivedHours");
        return false;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("UPDATE repair_orders SET hours_taken = :hours_taken, "
                  "hours_remaining = :hours_remaining WHERE ro_number = :ro_number");
    query.bindValue(":hours_taken", hoursTaken);
    query.bindValue(":hours_remaining", hoursRemaining);
    query.bindValue(":ro_number", roNumber);

    return m_dbManager->executeQuery(query);
}

bool RepairOrderDBManager::setAssignment(const QString& roNumber, const QString& role, const QString& employee)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for setAssignment");
        return false;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    if (employee.trimmed().isEmpty()) {
        query.prepare("DELETE FROM ro_assignments WHERE ro_number = :ro_number AND role = :role");
    } else {
        query.prepare("INSERT OR REPLACE INTO ro_assignments (ro_number, role, employee) "
                      "VALUES (:ro_number, :role, :employee)");
        query.bindValue(":employee", employee.trimmed());
    }
    query.bindValue(":ro_number", roNumber);
    query.bindValue(":role", role);

    if (!m_dbManager->executeQuery(query)) {
        Logger::instance().error(QString("Failed to assign %1 on RO %2").arg(role, roNumber));
        return false;
    }
    return true;
}

bool RepairOrderDBManager::setAllocations(const QString& roNumber, const QString& role,
                                          const QList<Allocation>& allocations)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for setAllocations");
        return false;
    }

    ScopedTransaction transaction(m_dbManager);
    if (!transaction.isActive()) {
        return false;
    }

    QSqlQuery clear(m_dbManager->getDatabase());
    clear.prepare("DELETE FROM ro_allocations WHERE ro_number = :ro_number AND role = :role");
    clear.bindValue(":ro_number", roNumber);
    clear.bindValue(":role", role);
    if (!m_dbManager->executeQuery(clear)) {
        return false;
    }

    for (const Allocation& allocation : allocations) {
        QSqlQuery insert(m_dbManager->getDatabase());
        insert.prepare("INSERT OR REPLACE INTO ro_allocations (ro_number, employee, role, percent) "
                       "VALUES (:ro_number, :employee, :role, :percent)");
        insert.bindValue(":ro_number", roNumber);
        insert.bindValue(":employee", allocation.employee.trimmed());
        insert.bindValue(":role", role);
        insert.bindValue(":percent", allocation.percent);
        if (!m_dbManager->executeQuery(insert)) {
            Logger::instance().error(QString("Failed to allocate %1 on RO %2").arg(allocation.employee, roNumber));
            return false;
        }
    }

    return transaction.commit();
}
