#ifndef DATABASEMANAGER_H
#define DATABASEMANAGER_H

#include <QSqlDatabase>
#include <QString>
#include <QList>
#include <QMap>
#include <QVariant>
#include <QSqlQuery>

class DatabaseManager
{
public:
    // Singleton access
    static DatabaseManager* instance();

    // Open (or create) the SQLite file; ":memory:" gives a private in-memory store
    bool initialize(const QString& dbPath);
    bool isInitialized() const;
    void close();
    QSqlDatabase& getDatabase() { return m_db; }

    bool createTable(const QString& tableName, const QString& tableDefinition);

    // Generic query execution
    bool executeQuery(const QString& queryStr);
    bool executeQuery(QSqlQuery& query);

    // Bind value for a NOT NULL text column; a null QString would bind NULL
    static QVariant textValue(const QString& text) { return text.isNull() ? QString("") : text; }

    // Generic data retrieval
    QList<QMap<QString, QVariant>> executeSelectQuery(const QString& queryStr);

    // Nested-safe transactions: only the outermost begin/commit touches SQLite
    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    static const int SCHEMA_VERSION = 1;

private:
    DatabaseManager();
    ~DatabaseManager();

    QSqlDatabase m_db;
    QString m_dbPath;
    bool m_initialized;
    int m_transactionDepth;
    bool m_rollbackOnly;

    static DatabaseManager* m_instance;

    bool applyPragmas();
    bool createCoreTables();
};

/**
 * @brief RAII transaction scope on the shared connection
 *
 * Begins on construction and rolls back on destruction unless commit()
 * was called. Scopes nest: an inner scope that rolls back marks the
 * outer transaction rollback-only.
 */
class ScopedTransaction
{
public:
    explicit ScopedTransaction(DatabaseManager* dbManager);
    ~ScopedTransaction();

    ScopedTransaction(const ScopedTransaction&) = delete;
    ScopedTransaction& operator=(const ScopedTransaction&) = delete;

    bool isActive() const { return m_active; }
    bool commit();

private:
    DatabaseManager* m_dbManager;
    bool m_active;
};

#endif // DATABASEMANAGER_H
