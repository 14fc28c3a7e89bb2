#include "closereconciler.h"
#include <QSet>
#include <QStringList>
#include <QtGlobal>
#include <cmath>

const char* const CloseReconciler::CLOSE_NOTE = "Adjustment on close (recalc)";

CloseReconciler::CloseReconciler(const MilestonePolicy& policy, const CreditSource& source, double tolerance)
    : m_policy(policy),
    m_source(source),
    m_tolerance(tolerance)
{
}

QMap<QString, double> CloseReconciler::expectedTotals(const RepairOrder& ro) const
{
    QMap<QString, double> expected;

    const QList<MilestonePolicy::RoleBucket> pairs = m_policy.roleBuckets();
    for (const MilestonePolicy::RoleBucket& pair : pairs) {
        const double value = m_source.bucketValue(ro, pair.second);
        if (value <= 0.0) {
            continue;
        }

        const double share = m_policy.roleShare(pair.first, pair.second);
        const QList<CreditRecipient> recipients = m_source.recipients(ro, pair.first);
        for (const CreditRecipient& recipient : recipients) {
            expected[recipient.employee] += value * share * recipient.weight;
        }
    }

    return expected;
}

QList<CloseAdjustment> CloseReconciler::plan(const RepairOrder& ro, const QMap<QString, double>& posted) const
{
    const QMap<QString, double> expected = expectedTotals(ro);

    QSet<QString> names;
    for (auto it = expected.constBegin(); it != expected.constEnd(); ++it) {
        names.insert(it.key());
    }
    for (auto it = posted.constBegin(); it != posted.constEnd(); ++it) {
        names.insert(it.key());
    }

    QStringList employees = names.values();
    employees.sort();

    QList<CloseAdjustment> adjustments;
    for (const QString& employee : employees) {
        CloseAdjustment adjustment;
        adjustment.employee = employee;
        adjustment.expected = expected.value(employee, 0.0);
        adjustment.posted = posted.value(employee, 0.0);

        const double difference = adjustment.expected - adjustment.posted;
        if (qAbs(difference) <= m_tolerance) {
            continue;
        }

        adjustment.difference = std::round(difference * 100.0) / 100.0;
        adjustments.append(adjustment);
    }

    return adjustments;
}
