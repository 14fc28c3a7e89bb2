#include "databasemanager.h"
#include "logger.h"
#include <QSqlError>
#include <QSqlRecord>
#include <QDir>
#include <QFileInfo>

namespace {
const char* const CONNECTION_NAME = "shopcredit_connection";
}

// Initialize static member
DatabaseManager* DatabaseManager::m_instance = nullptr;

DatabaseManager* DatabaseManager::instance()
{
    if (!m_instance) {
        m_instance = new DatabaseManager();
    }
    return m_instance;
}

DatabaseManager::DatabaseManager()
    : m_initialized(false),
    m_transactionDepth(0),
    m_rollbackOnly(false)
{
}

DatabaseManager::~DatabaseManager()
{
    close();
}

bool DatabaseManager::initialize(const QString& dbPath)
{
    close();

    if (dbPath != ":memory:") {
        QFileInfo fileInfo(dbPath);
        QDir dir = fileInfo.dir();
        if (!dir.exists() && !dir.mkpath(".")) {
            Logger::instance().error("Failed to create database directory: " + dir.path());
            return false;
        }
    }

    Logger::instance().debug("Setting up database connection to: " + dbPath);

    m_db = QSqlDatabase::addDatabase("QSQLITE", CONNECTION_NAME);
    m_db.setDatabaseName(dbPath);
    // Wait for a competing writer instead of failing immediately
    m_db.setConnectOptions("QSQLITE_BUSY_TIMEOUT=30000");

    if (!m_db.open()) {
        Logger::instance().error(QString("Failed to open database %1: %2")
                                     .arg(dbPath, m_db.lastError().text()));
        return false;
    }

    m_dbPath = dbPath;

    if (!applyPragmas() || !createCoreTables()) {
        Logger::instance().error("Failed to prepare core database tables");
        close();
        return false;
    }

    m_initialized = true;
    Logger::instance().info("Database initialized: " + dbPath);
    return true;
}

bool DatabaseManager::isInitialized() const
{
    return m_initialized && m_db.isOpen();
}

void DatabaseManager::close()
{
    if (m_db.isOpen()) {
        if (m_transactionDepth > 0) {
            m_db.rollback();
        }
        m_db.close();
    }
    m_db = QSqlDatabase();
    if (QSqlDatabase::contains(CONNECTION_NAME)) {
        QSqlDatabase::removeDatabase(CONNECTION_NAME);
    }

    m_initialized = false;
    m_transactionDepth = 0;
    m_rollbackOnly = false;
    m_dbPath.clear();
}

bool DatabaseManager::applyPragmas()
{
    QSqlQuery query(m_db);
    if (!query.exec("PRAGMA foreign_keys = ON")) {
        Logger::instance().error("Failed to enable foreign keys: " + query.lastError().text());
        return false;
    }
    // WAL lets the reporting side read while a recompute is writing
    if (!query.exec("PRAGMA journal_mode = WAL")) {
        Logger::instance().warning("Could not switch to WAL journal: " + query.lastError().text());
    }
    return true;
}

bool DatabaseManager::createCoreTables()
{
    QSqlQuery query(m_db);

    if (!query.exec("CREATE TABLE IF NOT EXISTS schema_version ("
                    "version INTEGER NOT NULL)")) {
        Logger::instance().error("Failed to create schema_version table: " + query.lastError().text());
        return false;
    }

    if (!query.exec("SELECT version FROM schema_version LIMIT 1")) {
        Logger::instance().error("Failed to read schema_version: " + query.lastError().text());
        return false;
    }

    if (!query.next()) {
        QSqlQuery insert(m_db);
        insert.prepare("INSERT INTO schema_version (version) VALUES (:version)");
        insert.bindValue(":version", SCHEMA_VERSION);
        if (!insert.exec()) {
            Logger::instance().error("Failed to seed schema_version: " + insert.lastError().text());
            return false;
        }
    }

    return true;
}

bool DatabaseManager::createTable(const QString& tableName, const QString& tableDefinition)
{
    if (!isInitialized()) {
        Logger::instance().error("Database not initialized");
        return false;
    }

    QString query = QString("CREATE TABLE IF NOT EXISTS %1 %2").arg(tableName, tableDefinition);
    return executeQuery(query);
}

bool DatabaseManager::executeQuery(const QString& queryStr)
{
    if (!isInitialized()) {
        Logger::instance().error("Database not initialized");
        return false;
    }

    QSqlQuery query(m_db);
    if (!query.exec(queryStr)) {
        Logger::instance().error(QString("Query failed: %1 | %2")
                                     .arg(query.lastError().text(), queryStr));
        return false;
    }

    return true;
}

bool DatabaseManager::executeQuery(QSqlQuery& query)
{
    if (!isInitialized()) {
        Logger::instance().error("Database not initialized");
        return false;
    }

    if (!query.exec()) {
        Logger::instance().error(QString("Query failed: %1 | %2")
                                     .arg(query.lastError().text(), query.lastQuery()));
        return false;
    }

    return true;
}

QList<QMap<QString, QVariant>> DatabaseManager::executeSelectQuery(const QString& queryStr)
{
    QList<QMap<QString, QVariant>> result;

    if (!isInitialized()) {
        Logger::instance().error("Database not initialized");
        return result;
    }

    QSqlQuery query(m_db);
    if (!query.exec(queryStr)) {
        Logger::instance().error(QString("Select query failed: %1 | %2")
                                     .arg(query.lastError().text(), queryStr));
        return result;
    }

    while (query.next()) {
        QMap<QString, QVariant> row;
        QSqlRecord record = query.record();

        for (int i = 0; i < record.count(); i++) {
            row[record.fieldName(i)] = query.value(i);
        }

        result.append(row);
    }

    return result;
}

bool DatabaseManager::beginTransaction()
{
    if (!isInitialized()) {
        Logger::instance().error("Database not initialized");
        return false;
    }

    if (m_transactionDepth == 0) {
        if (!m_db.transaction()) {
            Logger::instance().error("Failed to begin transaction: " + m_db.lastError().text());
            return false;
        }
        m_rollbackOnly = false;
    }

    ++m_transactionDepth;
    return true;
}

bool DatabaseManager::commitTransaction()
{
    if (m_transactionDepth == 0) {
        Logger::instance().warning("Commit without an open transaction");
        return false;
    }

    --m_transactionDepth;
    if (m_transactionDepth > 0) {
        return !m_rollbackOnly;
    }

    if (m_rollbackOnly) {
        m_db.rollback();
        m_rollbackOnly = false;
        Logger::instance().warning("Transaction rolled back: an inner scope failed");
        return false;
    }

    if (!m_db.commit()) {
        Logger::instance().error("Commit failed: " + m_db.lastError().text());
        m_db.rollback();
        return false;
    }
    return true;
}

bool DatabaseManager::rollbackTransaction()
{
    if (m_transactionDepth == 0) {
        return false;
    }

    --m_transactionDepth;
    if (m_transactionDepth > 0) {
        m_rollbackOnly = true;
        return true;
    }

    m_rollbackOnly = false;
    if (!m_db.rollback()) {
        Logger::instance().error("Rollback failed: " + m_db.lastError().text());
        return false;
    }
    return true;
}

ScopedTransaction::ScopedTransaction(DatabaseManager* dbManager)
    : m_dbManager(dbManager),
    m_active(dbManager && dbManager->beginTransaction())
{
}

ScopedTransaction::~ScopedTransaction()
{
    if (m_active) {
        m_dbManager->rollbackTransaction();
    }
}

bool ScopedTransaction::commit()
{
    if (!m_active) {
        return false;
    }
    m_active = false;
    return m_dbManager->commitTransaction();
}
