#include "creditoverridedbmanager.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QMap>
#include <QStringList>
#include "logger.h"

// Initialize static member
CreditOverrideDBManager* CreditOverrideDBManager::m_instance = nullptr;

CreditOverrideDBManager* CreditOverrideDBManager::instance()
{
    if (!m_instance) {
        m_instance = new CreditOverrideDBManager();
    }
    return m_instance;
}

CreditOverrideDBManager::CreditOverrideDBManager()
{
    m_dbManager = DatabaseManager::instance();
}

bool CreditOverrideDBManager::initialize()
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Core database manager not initialized for credit overrides");
        return false;
    }

    return createTables();
}

bool CreditOverrideDBManager::createTables()
{
    // NULL columns keep the generated value
    if (!m_dbManager->createTable("credit_overrides",
                                  "("
                                  "ro_number TEXT NOT NULL "
                                  "REFERENCES repair_orders(ro_number) ON DELETE CASCADE, "
                                  "from_stage TEXT NOT NULL, "
                                  "to_stage TEXT NOT NULL, "
                                  "note TEXT NOT NULL, "
                                  "date TEXT, "
                                  "tech TEXT, "
                                  "hours REAL, "
                                  "updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP, "
                                  "PRIMARY KEY (ro_number, from_stage, to_stage, note)"
                                  ")")) {
        Logger::instance().error("Failed to create credit_overrides table");
        return false;
    }

    return true;
}

bool CreditOverrideDBManager::setOverride(const CreditOverride& creditOverride)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for setOverride");
        return false;
    }

    const CreditRowKey& key = creditOverride.key;

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("INSERT OR REPLACE INTO credit_overrides "
                  "(ro_number, from_stage, to_stage, note, date, tech, hours) "
                  "VALUES (:ro_number, :from_stage, :to_stage, :note, :date, :tech, :hours)");
    query.bindValue(":ro_number", key.roNumber);
    query.bindValue(":from_stage", DatabaseManager::textValue(key.fromStage));
    query.bindValue(":to_stage", DatabaseManager::textValue(key.toStage));
    query.bindValue(":note", key.note);
    query.bindValue(":date", creditOverride.date.isEmpty() ? QVariant() : QVariant(creditOverride.date));
    query.bindValue(":tech", creditOverride.tech.isEmpty() ? QVariant() : QVariant(creditOverride.tech));
    query.bindValue(":hours", creditOverride.hasHours ? QVariant(creditOverride.hours) : QVariant());

    if (!m_dbManager->executeQuery(query)) {
        Logger::instance().error(QString("Failed to set override on RO %1 '%2'").arg(key.roNumber, key.note));
        return false;
    }

    Logger::instance().info(QString("Override set on RO %1 '%2'").arg(key.roNumber, key.note));
    return true;
}

bool CreditOverrideDBManager::deleteOverride(const CreditRowKey& key)
{
    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for deleteOverride");
        return false;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("DELETE FROM credit_overrides WHERE ro_number = :ro_number "
                  "AND from_stage = :from_stage AND to_stage = :to_stage AND note = :note");
    query.bindValue(":ro_number", key.roNumber);
    query.bindValue(":from_stage", DatabaseManager::textValue(key.fromStage));
    query.bindValue(":to_stage", DatabaseManager::textValue(key.toStage));
    query.bindValue(":note", key.note);

    if (!m_dbManager->executeQuery(query)) {
        Logger::instance().error(QString("Failed to delete override on RO %1 '%2'").arg(key.roNumber, key.note));
        return false;
    }

    if (query.numRowsAffected() > 0) {
        Logger::instance().info(QString("Override deleted on RO %1 '%2'").arg(key.roNumber, key.note));
    }
    return true;
}

bool CreditOverrideDBManager::findOverride(const CreditRowKey& key, CreditOverride& creditOverride)
{
    const QList<CreditOverride> overrides = loadOverrides(key.roNumber);
    for (const CreditOverride& candidate : overrides) {
        if (candidate.key == key) {
            creditOverride = candidate;
            return true;
        }
    }
    return false;
}

QList<CreditOverride> CreditOverrideDBManager::overridesFor(const QString& roNumber)
{
    return loadOverrides(roNumber);
}

QList<CreditOverride> CreditOverrideDBManager::loadOverrides(const QString& roNumber)
{
    QList<CreditOverride> overrides;

    if (!m_dbManager->isInitialized()) {
        Logger::instance().error("Database not initialized for overridesFor");
        return overrides;
    }

    QSqlQuery query(m_dbManager->getDatabase());
    query.prepare("SELECT ro_number, from_stage, to_stage, note, date, tech, hours "
                  "FROM credit_overrides WHERE ro_number = :ro_number");
    query.bindValue(":ro_number", roNumber);

    if (!m_dbManager->executeQuery(query)) {
        return overrides;
    }

    while (query.next()) {
        CreditOverride creditOverride;
        creditOverride.key.roNumber = query.value("ro_number").toString();
        creditOverride.key.fromStage = query.value("from_stage").toString();
        creditOverride.key.toStage = query.value("to_stage").toString();
        creditOverride.key.note = query.value("note").toString();
        creditOverride.date = query.value("date").toString();
        creditOverride.tech = query.value("tech").toString();
        creditOverride.hasHours = !query.value("hours").isNull();
        creditOverride.hours = query.value("hours").toDouble();
        overrides.append(creditOverride);
    }

    return overrides;
}

int CreditOverrideDBManager::applyOverrides(QList<CreditRow>& rows)
{
    QMap<QString, QList<CreditOverride>> byRo;
    int applied = 0;

    for (CreditRow& row : rows) {
        if (!byRo.contains(row.roNumber)) {
            byRo.insert(row.roNumber, loadOverrides(row.roNumber));
        }

        const CreditRowKey key = row.key();
        for (const CreditOverride& creditOverride : byRo.value(row.roNumber)) {
            if (!(creditOverride.key == key)) {
                continue;
            }
            if (!creditOverride.date.isEmpty()) {
                row.date = creditOverride.date;
            }
            if (!creditOverride.tech.isEmpty()) {
                row.employee = creditOverride.tech;
            }
            if (creditOverride.hasHours) {
                row.hours = creditOverride.hours;
            }
            row.overridden = true;
            ++applied;
            break;
        }
    }

    return applied;
}

int CreditOverrideDBManager::applyOverrides(QList<CreditAuditEntry>& entries)
{
    // After a reassignment a key is posted once per employee. The override
    // goes to the latest line only; earlier lines stay as posted until the
    // close true-up reverses them.
    QMap<QString, int> latestByKey;
    for (int i = 0; i < entries.size(); ++i) {
        const CreditAuditEntry& entry = entries.at(i);
        const QString id = QStringList{entry.roNumber, entry.fromStage, entry.toStage, entry.note}.join(QChar(0x1f));
        if (!latestByKey.contains(id) || entries.at(latestByKey.value(id)).id < entry.id) {
            latestByKey.insert(id, i);
        }
    }

    QMap<QString, QList<CreditOverride>> byRo;
    int applied = 0;

    for (int index : latestByKey) {
        CreditAuditEntry& entry = entries[index];
        if (!byRo.contains(entry.roNumber)) {
            byRo.insert(entry.roNumber, loadOverrides(entry.roNumber));
        }

        const CreditRowKey key{entry.roNumber, entry.fromStage, entry.toStage, entry.note};
        for (const CreditOverride& creditOverride : byRo.value(entry.roNumber)) {
            if (!(creditOverride.key == key)) {
                continue;
            }
            if (!creditOverride.date.isEmpty()) {
                entry.date = creditOverride.date;
            }
            if (!creditOverride.tech.isEmpty()) {
                entry.employee = creditOverride.tech;
            }
            if (creditOverride.hasHours) {
                entry.hours = creditOverride.hours;
            }
            ++applied;
            break;
        }
    }

    return applied;
}
