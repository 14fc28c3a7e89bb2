#ifndef REPAIRORDERDBMANAGER_H
#define REPAIRORDERDBMANAGER_H

#include <QString>
#include <QStringList>
#include <QList>
#include "databasemanager.h"
#include "repairorder.h"

class RepairOrderDBManager
{
public:
    // Singleton access
    static RepairOrderDBManager* instance();

    // Initialize tables
    bool initialize();

    // RO operations
    bool createRepairOrder(const RepairOrder& ro);
    bool loadRepairOrder(const QString& roNumber, RepairOrder& ro);
    bool roExists(const QString& roNumber);
    QStringList roNumbers();

    /**
     * @brief Delete an RO; its transitions and credit rows cascade
     */
    bool deleteRepairOrder(const QString& roNumber);

    // Field updates
    bool setBucket(const QString& roNumber, const QString& bucket, double hours);
    bool setStage(const QString& roNumber, const QString& stage);
    bool setStatus(const QString& roNumber, const QString& status);
    bool updateDerivedHours(const QString& roNumber, double hoursTaken, double hoursRemaining);

    // People
    bool setAssignment(const QString& roNumber, const QString& role, const QString& employee);
    bool setAllocations(const QString& roNumber, const QString& role, const QList<Allocation>& allocations);

private:
    // Private constructor for singleton
    RepairOrderDBManager();

    // Core database reference
    DatabaseManager* m_dbManager;

    // Singleton instance
    static RepairOrderDBManager* m_instance;

    // Table creation
    bool createTables();

    bool updateColumn(const QString& roNumber, const QString& column, const QVariant& value);
    static QString bucketColumn(const QString& bucket);
};

#endif // REPAIRORDERDBMANAGER_H
