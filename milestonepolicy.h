#ifndef MILESTONEPOLICY_H
#define MILESTONEPOLICY_H

#include <QString>
#include <QList>
#include <QMap>
#include <QVariant>
#include <QPair>
#include "ledgertypes.h"
#include "stageorder.h"

/**
 * @brief Transition shape that reaches a milestone
 *
 * A transition matches when it leaves fromStage exactly and its
 * destination is at-or-after (or strictly after) targetStage in the
 * configured stage order.
 */
struct TransitionPattern
{
    enum Predicate {
        AtOrAfter,
        StrictlyAfter
    };

    QString fromStage;
    QString targetStage;
    Predicate predicate = AtOrAfter;

    bool matches(const StageTransition& transition, const StageOrder& order) const;

    static QString predicateToString(Predicate predicate);
    static bool predicateFromString(const QString& text, Predicate& predicate);
};

struct Milestone
{
    QString id;        // e.g. "body_60"
    QString label;     // e.g. "Body 60%", used in generated notes
    TransitionPattern pattern;
    QString bucket;    // RepairOrder bucket it draws from
    QString role;      // Responsible role for the bucket
    double share = 1.0;

    /**
     * @brief Scan transitions in log order for the first match
     * @param transitions Log for one RO, already in log order
     * @param order Current stage order
     * @param match Receives the matching transition
     * @return True if the milestone has been reached
     */
    bool findFirstMatch(const QList<StageTransition>& transitions, const StageOrder& order,
                        StageTransition& match) const;

    QString baselineNote(double baseHours, const QString& fromStage, const QString& toStage) const;
    QString supplementNote(double deltaHours) const;
};

/**
 * @brief Parsed form of a "Supplement +10.00h (Body 60%)" note
 */
struct SupplementNote
{
    bool negative = false;
    double magnitude = 0.0;
    QString label;
    bool hasAllocation = false;
    QString employee;
    double percent = 100.0;
};

class MilestonePolicy
{
public:
    typedef QPair<QString, QString> RoleBucket;   // (role, bucket)

    MilestonePolicy();
    explicit MilestonePolicy(const QList<Milestone>& milestones,
                             const QList<RoleBucket>& closeOnlyBuckets = QList<RoleBucket>());

    /**
     * @brief Body 60% / Body 40% / Refinish 100% table
     */
    static MilestonePolicy defaultPolicy();

    /**
     * @brief Read Ledger/Milestones from ConfigManager, falling back to the default table
     * @throws ConfigurationException if an entry is malformed
     */
    static MilestonePolicy fromConfig();

    static Milestone milestoneFromSettings(const QMap<QString, QVariant>& entry);
    static QMap<QString, QVariant> milestoneToSettings(const Milestone& milestone);

    const QList<Milestone>& milestones() const { return m_milestones; }
    const Milestone* findById(const QString& id) const;
    const Milestone* findByLabel(const QString& label) const;

    /**
     * @brief Total share paid out of a bucket to a role across all milestones
     * @return Sum of matching shares, or 1.0 when no milestone covers the pair
     */
    double roleShare(const QString& role, const QString& bucket) const;

    /**
     * @brief Distinct (role, bucket) pairs close reconciliation looks at
     *
     * Every pair a milestone pays from, followed by the close-only pairs
     * (buckets such as mechanical hours that are credited in full at close).
     */
    QList<RoleBucket> roleBuckets() const;
    const QList<RoleBucket>& closeOnlyBuckets() const { return m_closeOnly; }

    bool isBaselineNote(const QString& note) const;
    static bool isSupplementNote(const QString& note);
    static bool parseSupplementNote(const QString& note, SupplementNote& parsed);

    static QString allocationSuffix(const QString& employee, double percent);

private:
    QList<Milestone> m_milestones;
    QList<RoleBucket> m_closeOnly;
};

#endif // MILESTONEPOLICY_H
