#ifndef CLOSERECONCILER_H
#define CLOSERECONCILER_H

#include <QString>
#include <QList>
#include <QMap>
#include "creditsource.h"
#include "milestonepolicy.h"
#include "repairorder.h"

struct CloseAdjustment
{
    QString employee;
    double expected = 0.0;
    double posted = 0.0;
    double difference = 0.0;   // Signed, rounded to 0.01h
};

/**
 * @brief Computes the close-time true-up for one RO
 *
 * Expected credit per employee is bucket x role share x allocation
 * weight over every (role, bucket) pair of the policy. The fixed-role
 * model is the case of one recipient at 100%. Employees who only have
 * posted credit are included with an expectation of zero.
 */
class CloseReconciler
{
public:
    static const char* const CLOSE_NOTE;

    CloseReconciler(const MilestonePolicy& policy, const CreditSource& source, double tolerance);

    QMap<QString, double> expectedTotals(const RepairOrder& ro) const;

    /**
     * @brief Balancing entries needed, sorted by employee
     * @param posted Post-override hours already credited per employee
     * @return Only the employees whose difference exceeds the tolerance
     */
    QList<CloseAdjustment> plan(const RepairOrder& ro, const QMap<QString, double>& posted) const;

private:
    const MilestonePolicy& m_policy;
    const CreditSource& m_source;
    double m_tolerance;
};

#endif // CLOSERECONCILER_H
