#ifndef LEDGERTYPES_H
#define LEDGERTYPES_H

#include <QString>
#include <QList>
#include <QMetaType>

// Row types shared by the credit ledger stores. Dates are ISO yyyy-MM-dd,
// transition timestamps are yyyy-MM-dd hh:mm:ss.

struct StageTransition
{
    qint64 id = 0;
    QString roNumber;
    QString fromStage;
    QString toStage;
    QString occurredAt;

    QString date() const { return occurredAt.left(10); }
};

struct CreditBaseline
{
    QString roNumber;
    QString milestoneId;
    double baseHours = 0.0;
    // Transition that first reached the milestone
    QString fromStage;
    QString toStage;
    QString date;
};

struct CreditAdjustment
{
    qint64 id = 0;
    QString roNumber;
    QString milestoneId;
    QString fromStage;
    QString toStage;
    QString date;
    QString tech;
    double deltaHours = 0.0;
    double share = 0.0;
};

/**
 * @brief Identity of a generated credit row; overrides are keyed on it
 */
struct CreditRowKey
{
    QString roNumber;
    QString fromStage;
    QString toStage;
    QString note;

    bool operator==(const CreditRowKey& other) const
    {
        return roNumber == other.roNumber && fromStage == other.fromStage
               && toStage == other.toStage && note == other.note;
    }
};

struct CreditOverride
{
    CreditRowKey key;
    // Empty date/tech and hasHours == false keep the generated value
    QString date;
    QString tech;
    bool hasHours = false;
    double hours = 0.0;
};

struct CreditAuditEntry
{
    qint64 id = 0;
    QString date;
    QString roNumber;
    QString employee;
    double hours = 0.0;
    QString note;
    QString fromStage;
    QString toStage;
};

enum class CreditRowKind {
    Baseline,
    Supplement
};

struct CreditRow
{
    QString date;
    QString roNumber;
    QString fromStage;
    QString toStage;
    QString employee;
    double hours = 0.0;
    QString note;

    CreditRowKind kind = CreditRowKind::Baseline;
    QString milestoneId;
    qint64 adjustmentId = 0;   // Supplement rows only
    double weight = 1.0;       // Recipient's fraction of the milestone
    bool overridden = false;

    CreditRowKey key() const { return {roNumber, fromStage, toStage, note}; }
};

struct SummaryRow
{
    QString employee;
    double workedHours = 0.0;
    double creditedHours = 0.0;
    double efficiency = 0.0;
};

Q_DECLARE_METATYPE(CreditRow)

#endif // LEDGERTYPES_H
