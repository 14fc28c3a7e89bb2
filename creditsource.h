#ifndef CREDITSOURCE_H
#define CREDITSOURCE_H

#include <QString>
#include <QList>
#include "repairorder.h"

/**
 * @brief One employee credited for a role, with their fraction of it
 */
struct CreditRecipient
{
    QString employee;
    double weight = 1.0;
    double percent = 100.0;
};

/**
 * @brief Resolves hour buckets and responsible employees on an RO
 *
 * The ledger asks a credit source who is paid for a role instead of
 * reading assignments directly, so the same milestone math serves both
 * the named-role model and the percent allocation model.
 */
class CreditSource
{
public:
    enum Mode {
        FixedRole,
        Allocation
    };

    virtual ~CreditSource() = default;

    virtual Mode mode() const = 0;

    /**
     * @brief Current value of an hour bucket
     */
    virtual double bucketValue(const RepairOrder& ro, const QString& bucket) const;

    /**
     * @brief Employees credited for a role on this RO
     * @return Empty when nobody is responsible for the role
     */
    virtual QList<CreditRecipient> recipients(const RepairOrder& ro, const QString& role) const = 0;

    /**
     * @brief Tech recorded on a new adjustment, empty when rows fan out per recipient
     */
    virtual QString adjustmentTech(const RepairOrder& ro, const QString& role) const = 0;

    static bool modeFromString(const QString& text, Mode& mode);

    /**
     * @brief Create the credit source for a mode
     * @return New instance owned by the caller
     */
    static CreditSource* create(Mode mode);
};

/**
 * @brief One named employee per role, paid in full
 */
class FixedRoleCreditSource : public CreditSource
{
public:
    Mode mode() const override { return FixedRole; }
    QList<CreditRecipient> recipients(const RepairOrder& ro, const QString& role) const override;
    QString adjustmentTech(const RepairOrder& ro, const QString& role) const override;
};

/**
 * @brief Every allocation row for the role with a non-zero percent
 */
class AllocationCreditSource : public CreditSource
{
public:
    Mode mode() const override { return Allocation; }
    QList<CreditRecipient> recipients(const RepairOrder& ro, const QString& role) const override;
    QString adjustmentTech(const RepairOrder& ro, const QString& role) const override;
};

#endif // CREDITSOURCE_H
