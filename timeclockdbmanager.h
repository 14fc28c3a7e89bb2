#ifndef TIMECLOCKDBMANAGER_H
#define TIMECLOCKDBMANAGER_H

#include <QString>
#include <QList>
#include <QMap>
#include <QDate>
#include "databasemanager.h"
#include "productionsummary.h"

struct TimeClockRecord
{
    qint64 id = 0;
    QString employee;
    QString workDate;   // yyyy-MM-dd
    double hours = 0.0;
    QString note;
};

/**
 * @brief Imported time clock hours, the worked side of the summary
 */
class TimeClockDBManager : public WorkedHoursSource
{
public:
    // Singleton access
    static TimeClockDBManager* instance();

    // Initialize tables
    bool initialize();

    qint64 addRecord(const TimeClockRecord& record);
    bool deleteRecord(qint64 id);

    // Ordered by date then id; empty employee lists everyone
    QList<TimeClockRecord> records(const QString& employee = QString(),
                                   const QDate& from = QDate(), const QDate& to = QDate());

    QMap<QString, double> workedHoursByEmployee(const QDate& from, const QDate& to) override;

private:
    // Private constructor for singleton
    TimeClockDBManager();

    // Core database reference
    DatabaseManager* m_dbManager;

    // Singleton instance
    static TimeClockDBManager* m_instance;

    // Table creation
    bool createTables();
};

#endif // TIMECLOCKDBMANAGER_H
