#include "repairorder.h"

const char* const RepairOrder::BODY_HOURS = "body_hours";
const char* const RepairOrder::REFINISH_HOURS = "refinish_hours";
const char* const RepairOrder::MECHANICAL_HOURS = "mechanical_hours";

const char* const RepairOrder::ROLE_ESTIMATOR = "Estimator";
const char* const RepairOrder::ROLE_BODY_TECH = "Body Tech";
const char* const RepairOrder::ROLE_PAINTER = "Painter";
const char* const RepairOrder::ROLE_MECHANIC = "Mechanic";

RepairOrder::RepairOrder()
{
    reset();
}

QStringList RepairOrder::bucketNames()
{
    return {BODY_HOURS, REFINISH_HOURS, MECHANICAL_HOURS};
}

bool RepairOrder::isValid() const
{
    return !roNumber.trimmed().isEmpty() && totalHours >= 0.0 && !stage.isEmpty();
}

double RepairOrder::bucket(const QString& name) const
{
    return buckets.value(name, 0.0);
}

QString RepairOrder::assignee(const QString& role) const
{
    QString employee = assignments.value(role).trimmed();
    // "Unassigned" is what the entry forms store for an empty role
    if (employee.compare("Unassigned", Qt::CaseInsensitive) == 0) {
        return QString();
    }
    return employee;
}

QList<Allocation> RepairOrder::allocationsForRole(const QString& role) const
{
    QList<Allocation> result;
    for (const Allocation& allocation : allocations) {
        if (allocation.role == role) {
            result.append(allocation);
        }
    }
    return result;
}

void RepairOrder::reset()
{
    roNumber = "";
    date = "";

    totalHours = 0.0;
    buckets.clear();
    for (const QString& name : bucketNames()) {
        buckets[name] = 0.0;
    }
    hoursTaken = 0.0;
    hoursRemaining = 0.0;

    assignments.clear();
    allocations.clear();

    stage = "";
    status = "open";
}
