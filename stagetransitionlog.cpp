#include "stagetransitionlog.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include "logger.h"

// Initialize static member
StageTransitionLog* StageTransitionLog::m_instance = nullptr;

StageTransitionLog* StageTransitionLog::instance()
{
    if (!m_instance) {
        m_instance = new StageTransitionLog();
    }
    return m_instance;
}

StageTransitionLog::StageTransitionLog()
{
    m_dbManager = DatabaseManager::instance();
}

bool StageTransitionLog::initialize()
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Core database manager not initialized for stage transitions");
        return false;
    }

    return createTables();
}

bool StageTransitionLog::createTables()
{
    if (!m_dbManager->createTable("stage_transitions",
                                  "("
                                  "id INTEGER PRIMARY KEY AUTOINCREMENT, "
                                  "ro_number TEXT NOT NULL "
                                  "REFERENCES repair_orders(ro_number) ON DELETE CASCADE, "
                                  "from_stage TEXT NOT NULL DEFAULT '', "
                                  "to_stage TEXT NOT NULL, "
                                  "occurred_at TEXT NOT NULL"
                                  ")")) {
        Logger::instance().error("Failed to create stage_transitions table");
        return false;
    }

    if (!m_dbManager->executeQuery("CREATE INDEX IF NOT EXISTS idx_stage_transitions_ro "
                                   "ON stage_transitions(ro_number, occurred_at, id)")) {
        Logger::instance().error("Failed to create stage_transitions index");
        return false;
    }

    return true;
}

qint64 StageTransitionLog::recordTransition(const QString& roNumber, const QString& fromStage,
                                            const QString& toStage, const QDateTime& when)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for recordTransition");
        return 0;
    }

    const QDateTime stamp = when.isValid() ? when : QDateTime::currentDateTime();

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("INSERT INTO stage_transitions (ro_number, from_stage, to_stage, occurred_at) "
                  "VALUES (:ro_number, :from_stage, :to_stage, :occurred_at)");
    query.bindValue(":ro_number", roNumber);
    query.bindValue(":from_stage", DatabaseManager::textValue(fromStage));
    query.bindValue(":to_stage", toStage);
    query.bindValue(":occurred_at", stamp.toString("yyyy-MM-dd hh:mm:ss"));

    if (!m_dbManager->executeQuery(query)) {
        Logger::instance().error(QString("Failed to record transition %1 -> %2 for RO %3")
                                     .arg(fromStage, toStage, roNumber));
        return 0;
    }

    Logger::instance().info(QString("RO %1 moved %2 -> %3").arg(roNumber, fromStage, toStage));
    return query.lastInsertId().toLongLong();
}

QList<StageTransition> StageTransitionLog::transitionsFor(const QString& roNumber)
{
    QList<StageTransition> transitions;

    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for transitionsFor");
        return transitions;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("SELECT id, ro_number, from_stage, to_stage, occurred_at "
                  "FROM stage_transitions WHERE ro_number = :ro_number "
                  "ORDER BY occurred_at ASC, id ASC");
    query.bindValue(":ro_number", roNumber);

    if (!m_dbManager->executeQuery(query)) {
        return transitions;
    }

    while (query.next()) {
        StageTransition transition;
        transition.id = query.value("id").toLongLong();
        transition.roNumber = query.value("ro_number").toString();
        transition.fromStage = query.value("from_stage").toString();
        transition.toStage = query.value("to_stage").toString();
        transition.occurredAt = query.value("occurred_at").toString();
        transitions.append(transition);
    }

    return transitions;
}

int StageTransitionLog::transitionCount(const QString& roNumber)
{
    if (!m_dbManager->isInitialized()) {
        return 0;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("SELECT COUNT(*) FROM stage_transitions WHERE ro_number = :ro_number");
    query.bindValue(":ro_number", roNumber);

    if (!m_dbManager->executeQuery(query) || !query.next()) {
        return 0;
    }
    return query.value(0).toInt();
}
