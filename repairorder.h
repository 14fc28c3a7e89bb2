#ifndef REPAIRORDER_H
#define REPAIRORDER_H

#include <QString>
#include <QStringList>
#include <QMap>
#include <QList>

/**
 * @brief One employee's percent share of a role on an RO
 */
struct Allocation
{
    QString employee;
    QString role;
    double percent = 0.0;
};

class RepairOrder
{
public:
    RepairOrder();

    // Bucket and role names shared with the milestone table
    static const char* const BODY_HOURS;
    static const char* const REFINISH_HOURS;
    static const char* const MECHANICAL_HOURS;

    static const char* const ROLE_ESTIMATOR;
    static const char* const ROLE_BODY_TECH;
    static const char* const ROLE_PAINTER;
    static const char* const ROLE_MECHANIC;

    static QStringList bucketNames();

    // Identification
    QString roNumber;
    QString date;

    // Hours
    double totalHours;
    QMap<QString, double> buckets;
    double hoursTaken;
    double hoursRemaining;

    // People: role -> employee (fixed mode) and percent allocations (allocation mode)
    QMap<QString, QString> assignments;
    QList<Allocation> allocations;

    // Workflow
    QString stage;
    QString status;

    bool isValid() const;
    double bucket(const QString& name) const;
    QString assignee(const QString& role) const;
    QList<Allocation> allocationsForRole(const QString& role) const;
    void reset();
};

#endif // REPAIRORDER_H
