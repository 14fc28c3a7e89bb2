#ifndef PRODUCTIONSUMMARY_H
#define PRODUCTIONSUMMARY_H

#include <QString>
#include <QList>
#include <QMap>
#include <QDate>
#include "ledgertypes.h"

class CreditAuditLog;

/**
 * @brief Supplier of per-employee worked hours (time clock import)
 */
class WorkedHoursSource
{
public:
    virtual ~WorkedHoursSource() = default;

    /**
     * @param from Inclusive lower bound, ignored when invalid
     * @param to Inclusive upper bound, ignored when invalid
     */
    virtual QMap<QString, double> workedHoursByEmployee(const QDate& from, const QDate& to) = 0;
};

/**
 * @brief Worked vs. credited hours per employee
 *
 * Read-only; every call derives the rows from the current time clock
 * records and post-override audit lines.
 */
class ProductionSummary
{
public:
    ProductionSummary(WorkedHoursSource* workedSource, CreditAuditLog* auditLog);

    QList<SummaryRow> build(const QDate& from = QDate(), const QDate& to = QDate());

    /**
     * @brief Join worked and credited totals into rows sorted by employee
     */
    static QList<SummaryRow> combine(const QMap<QString, double>& worked,
                                     const QMap<QString, double>& credited);

    static double roundHours(double hours);

private:
    WorkedHoursSource* m_workedSource;
    CreditAuditLog* m_auditLog;
};

#endif // PRODUCTIONSUMMARY_H
