#include "timeclockdbmanager.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QStringList>
#include <QVariant>
#include "logger.h"

// Initialize static member
TimeClockDBManager* TimeClockDBManager::m_instance = nullptr;

TimeClockDBManager* TimeClockDBManager::instance()
{
    if (!m_instance) {
        m_instance = new TimeClockDBManager();
    }
    return m_instance;
}

TimeClockDBManager::TimeClockDBManager()
{
    m_dbManager = DatabaseManager::instance();
}

bool TimeClockDBManager::initialize()
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Core database manager not initialized for time clock");
        return false;
    }

    return createTables();
}

bool TimeClockDBManager::createTables()
{
    if (!m_dbManager->createTable("time_clock_records",
                                  "("
                                  "id INTEGER PRIMARY KEY AUTOINCREMENT, "
                                  "employee TEXT NOT NULL, "
                                  "work_date TEXT NOT NULL, "
                                  "hours REAL NOT NULL, "
                                  "note TEXT NOT NULL DEFAULT '', "
                                  "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP"
                                  ")")) {
        Logger::instance().error("Failed to create time_clock_records table");
        return false;
    }

    return true;
}

qint64 TimeClockDBManager::addRecord(const TimeClockRecord& record)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for addRecord");
        return 0;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("INSERT INTO time_clock_records (employee, work_date, hours, note) "
                  "VALUES (:employee, :work_date, :hours, :note)");
    query.bindValue(":employee", record.employee.trimmed());
    query.bindValue(":work_date", record.workDate);
    query.bindValue(":hours", record.hours);
    query.bindValue(":note", DatabaseManager::textValue(record.note));

    if (!m_dbManager->executeQuery(query)) {
        Logger::instance().error(QString("Failed to add time clock record for %1").arg(record.employee));
        return 0;
    }

    Logger::instance().info(QString("Clocked %1h for %2 on %3")
                                .arg(record.hours, 0, 'f', 2)
                                .arg(record.employee, record.workDate));
    return query.lastInsertId().toLongLong();
}

bool TimeClockDBManager::deleteRecord(qint64 id)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for deleteRecord");
        return false;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("DELETE FROM time_clock_records WHERE id = :id");
    query.bindValue(":id", id);

    if (!m_dbManager->executeQuery(query)) {
        return false;
    }
    return query.numRowsAffected() > 0;
}

QList<TimeClockRecord> TimeClockDBManager::records(const QString& employee, const QDate& from, const QDate& to)
{
    QList<TimeClockRecord> result;

    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for time clock records");
        return result;
    }

    QStringList conditions;
    if (!employee.isEmpty()) {
        conditions << "employee = :employee";
    }
    if (from.isValid()) {
        conditions << "work_date >= :from_date";
    }
    if (to.isValid()) {
        conditions << "work_date <= :to_date";
    }

    QString sql = "SELECT id, employee, work_date, hours, note FROM time_clock_records";
    if (!conditions.isEmpty()) {
        sql += " WHERE " + conditions.join(" AND ");
    }
    sql += " ORDER BY work_date ASC, id ASC";

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare(sql);
    if (!employee.isEmpty()) {
        query.bindValue(":employee", employee);
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
        TimeClockRecord record;
        record.id = query.value("id").toLongLong();
        record.employee = query.value("employee").toString();
        record.workDate = query.value("work_date").toString();
        record.hours = query.value("hours").toDouble();
        record.note = query.value("note").toString();
        result.append(record);
    }

    return result;
}

QMap<QString, double> TimeClockDBManager::workedHoursByEmployee(const QDate& from, const QDate& to)
{
    QMap<QString, double> totals;
    const QList<TimeClockRecord> all = records(QString(), from, to);
    for (const TimeClockRecord& record : all) {
        totals[record.employee] += record.hours;
    }
    return totals;
}
