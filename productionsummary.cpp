#include "productionsummary.h"
#include <QSet>
#include <QStringList>
#include <cmath>
#include "creditauditlog.h"
#include "logger.h"

ProductionSummary::ProductionSummary(WorkedHoursSource* workedSource, CreditAuditLog* auditLog)
    : m_workedSource(workedSource),
    m_auditLog(auditLog)
{
}

QList<SummaryRow> ProductionSummary::build(const QDate& from, const QDate& to)
{
    QMap<QString, double> worked;
    if (m_workedSource) {
        worked = m_workedSource->workedHoursByEmployee(from, to);
    } else {
        Logger::instance().warning("No worked hours source; summary shows credit only");
    }

    QMap<QString, double> credited;
    if (m_auditLog) {
        const QList<CreditAuditEntry> entries = m_auditLog->effectiveEntries(QString(), from, to);
        for (const CreditAuditEntry& entry : entries) {
            if (!entry.employee.isEmpty()) {
                credited[entry.employee] += entry.hours;
            }
        }
    }

    return combine(worked, credited);
}

QList<SummaryRow> ProductionSummary::combine(const QMap<QString, double>& worked,
                                             const QMap<QString, double>& credited)
{
    QSet<QString> names;
    for (auto it = worked.constBegin(); it != worked.constEnd(); ++it) {
        names.insert(it.key());
    }
    for (auto it = credited.constBegin(); it != credited.constEnd(); ++it) {
        names.insert(it.key());
    }

    QStringList employees = names.values();
    employees.sort();

    QList<SummaryRow> rows;
    for (const QString& employee : employees) {
        SummaryRow row;
        row.employee = employee;
        row.workedHours = roundHours(worked.value(employee, 0.0));
        row.creditedHours = roundHours(credited.value(employee, 0.0));
        const double rawWorked = worked.value(employee, 0.0);
        row.efficiency = rawWorked > 0.0 ? roundHours(credited.value(employee, 0.0) / rawWorked) : 0.0;
        rows.append(row);
    }
    return rows;
}

double ProductionSummary::roundHours(double hours)
{
    return std::round(hours * 100.0) / 100.0;
}
