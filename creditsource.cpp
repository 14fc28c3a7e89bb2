#include "creditsource.h"

double CreditSource::bucketValue(const RepairOrder& ro, const QString& bucket) const
{
    return ro.bucket(bucket);
}

bool CreditSource::modeFromString(const QString& text, Mode& mode)
{
    const QString key = text.trimmed().toLower();
    if (key == "fixed") {
        mode = FixedRole;
        return true;
    }
    if (key == "allocation") {
        mode = Allocation;
        return true;
    }
    return false;
}

CreditSource* CreditSource::create(Mode mode)
{
    switch (mode) {
    case FixedRole:
        return new FixedRoleCreditSource();

    case Allocation:
        return new AllocationCreditSource();
    }
    return nullptr;
}

QList<CreditRecipient> FixedRoleCreditSource::recipients(const RepairOrder& ro, const QString& role) const
{
    QList<CreditRecipient> result;
    const QString employee = ro.assignee(role);
    if (!employee.isEmpty()) {
        CreditRecipient recipient;
        recipient.employee = employee;
        result.append(recipient);
    }
    return result;
}

QString FixedRoleCreditSource::adjustmentTech(const RepairOrder& ro, const QString& role) const
{
    return ro.assignee(role);
}

QList<CreditRecipient> AllocationCreditSource::recipients(const RepairOrder& ro, const QString& role) const
{
    QList<CreditRecipient> result;
    const QList<Allocation> allocations = ro.allocationsForRole(role);
    for (const Allocation& allocation : allocations) {
        if (allocation.employee.trimmed().isEmpty() || allocation.percent <= 0.0) {
            continue;
        }
        CreditRecipient recipient;
        recipient.employee = allocation.employee.trimmed();
        recipient.percent = allocation.percent;
        recipient.weight = allocation.percent / 100.0;
        result.append(recipient);
    }
    return result;
}

QString AllocationCreditSource::adjustmentTech(const RepairOrder& ro, const QString& role) const
{
    Q_UNUSED(ro)
    Q_UNUSED(role)
    return QString();
}
