#include "milestonepolicy.h"
#include "configmanager.h"
#include "errorhandling.h"
#include "repairorder.h"
#include <QRegularExpression>
#include <QtGlobal>

bool TransitionPattern::matches(const StageTransition& transition, const StageOrder& order) const
{
    if (transition.fromStage != fromStage) {
        return false;
    }

    if (predicate == StrictlyAfter) {
        return order.isAfter(transition.toStage, targetStage);
    }
    return order.isAtOrAfter(transition.toStage, targetStage);
}

QString TransitionPattern::predicateToString(Predicate predicate)
{
    return predicate == StrictlyAfter ? "after" : "at_or_after";
}

bool TransitionPattern::predicateFromString(const QString& text, Predicate& predicate)
{
    const QString key = text.trimmed().toLower();
    if (key == "at_or_after") {
        predicate = AtOrAfter;
        return true;
    }
    if (key == "after" || key == "strictly_after") {
        predicate = StrictlyAfter;
        return true;
    }
    return false;
}

bool Milestone::findFirstMatch(const QList<StageTransition>& transitions, const StageOrder& order,
                               StageTransition& match) const
{
    for (const StageTransition& transition : transitions) {
        if (pattern.matches(transition, order)) {
            match = transition;
            return true;
        }
    }
    return false;
}

QString Milestone::baselineNote(double baseHours, const QString& fromStage, const QString& toStage) const
{
    return QString("%1 of %2h on %3%4%5").arg(label, QString::number(baseHours, 'f', 2),
                                             fromStage, QString(QChar(0x2192)), toStage);
}

QString Milestone::supplementNote(double deltaHours) const
{
    return QString("Supplement %1%2h (%3)").arg(QString(deltaHours >= 0.0 ? "+" : "-"),
                                               QString::number(qAbs(deltaHours), 'f', 2),
                                               label);
}

MilestonePolicy::MilestonePolicy()
{
}

MilestonePolicy::MilestonePolicy(const QList<Milestone>& milestones,
                                 const QList<RoleBucket>& closeOnlyBuckets)
    : m_milestones(milestones),
    m_closeOnly(closeOnlyBuckets)
{
}

MilestonePolicy MilestonePolicy::defaultPolicy()
{
    QList<Milestone> milestones;

    Milestone bodyFirst;
    bodyFirst.id = "body_60";
    bodyFirst.label = "Body 60%";
    bodyFirst.pattern = {"Body", "Paint", TransitionPattern::AtOrAfter};
    bodyFirst.bucket = RepairOrder::BODY_HOURS;
    bodyFirst.role = RepairOrder::ROLE_BODY_TECH;
    bodyFirst.share = 0.60;
    milestones.append(bodyFirst);

    Milestone bodyFinal;
    bodyFinal.id = "body_40";
    bodyFinal.label = "Body 40%";
    bodyFinal.pattern = {"Reassembly", "Reassembly", TransitionPattern::StrictlyAfter};
    bodyFinal.bucket = RepairOrder::BODY_HOURS;
    bodyFinal.role = RepairOrder::ROLE_BODY_TECH;
    bodyFinal.share = 0.40;
    milestones.append(bodyFinal);

    Milestone refinish;
    refinish.id = "paint_100";
    refinish.label = "Refinish 100%";
    refinish.pattern = {"Paint", "Paint", TransitionPattern::StrictlyAfter};
    refinish.bucket = RepairOrder::REFINISH_HOURS;
    refinish.role = RepairOrder::ROLE_PAINTER;
    refinish.share = 1.00;
    milestones.append(refinish);

    QList<RoleBucket> closeOnly;
    closeOnly.append(qMakePair(QString(RepairOrder::ROLE_MECHANIC), QString(RepairOrder::MECHANICAL_HOURS)));

    return MilestonePolicy(milestones, closeOnly);
}

MilestonePolicy MilestonePolicy::fromConfig()
{
    ConfigManager& config = ConfigManager::instance();
    MilestonePolicy defaults = defaultPolicy();

    QList<Milestone> milestones;
    const QList<QMap<QString, QVariant>> entries = config.getArray("Ledger/Milestones");
    if (entries.isEmpty()) {
        milestones = defaults.milestones();
    } else {
        for (const QMap<QString, QVariant>& entry : entries) {
            milestones.append(milestoneFromSettings(entry));
        }
    }

    QList<RoleBucket> closeOnly;
    const QStringList pairs = config.getStringList("Ledger/CloseBuckets");
    for (const QString& pair : pairs) {
        const int separator = pair.indexOf('=');
        if (separator <= 0 || separator == pair.length() - 1) {
            THROW_CONFIG_ERROR(QString("Expected Role=bucket, got '%1'").arg(pair), "Ledger/CloseBuckets");
        }
        const QString bucket = pair.mid(separator + 1).trimmed();
        if (!RepairOrder::bucketNames().contains(bucket)) {
            THROW_CONFIG_ERROR(QString("Unknown hour bucket '%1'").arg(bucket), "Ledger/CloseBuckets");
        }
        closeOnly.append(qMakePair(pair.left(separator).trimmed(), bucket));
    }

    return MilestonePolicy(milestones, closeOnly);
}

Milestone MilestonePolicy::milestoneFromSettings(const QMap<QString, QVariant>& entry)
{
    Milestone milestone;
    milestone.id = entry.value("id").toString().trimmed();
    milestone.label = entry.value("label").toString().trimmed();
    milestone.pattern.fromStage = entry.value("from").toString().trimmed();
    milestone.pattern.targetStage = entry.value("target").toString().trimmed();
    milestone.bucket = entry.value("bucket").toString().trimmed();
    milestone.role = entry.value("role").toString().trimmed();

    const QString key = "Ledger/Milestones/" + (milestone.id.isEmpty() ? QString("?") : milestone.id);

    if (milestone.id.isEmpty() || milestone.label.isEmpty()) {
        THROW_CONFIG_ERROR("Milestone needs an id and a label", key);
    }
    if (milestone.pattern.fromStage.isEmpty() || milestone.pattern.targetStage.isEmpty()) {
        THROW_CONFIG_ERROR("Milestone needs from and target stages", key);
    }
    if (milestone.bucket.isEmpty() || milestone.role.isEmpty()) {
        THROW_CONFIG_ERROR("Milestone needs a bucket and a role", key);
    }
    if (!RepairOrder::bucketNames().contains(milestone.bucket)) {
        THROW_CONFIG_ERROR(QString("Unknown hour bucket '%1'").arg(milestone.bucket), key);
    }
    if (!TransitionPattern::predicateFromString(entry.value("predicate", "at_or_after").toString(),
                                                milestone.pattern.predicate)) {
        THROW_CONFIG_ERROR("Unknown predicate " + entry.value("predicate").toString(), key);
    }

    bool ok = false;
    milestone.share = entry.value("share").toDouble(&ok);
    if (!ok || milestone.share <= 0.0 || milestone.share > 1.0) {
        THROW_CONFIG_ERROR("Share must be in (0, 1]", key);
    }

    return milestone;
}

QMap<QString, QVariant> MilestonePolicy::milestoneToSettings(const Milestone& milestone)
{
    QMap<QString, QVariant> entry;
    entry["id"] = milestone.id;
    entry["label"] = milestone.label;
    entry["from"] = milestone.pattern.fromStage;
    entry["target"] = milestone.pattern.targetStage;
    entry["predicate"] = TransitionPattern::predicateToString(milestone.pattern.predicate);
    entry["bucket"] = milestone.bucket;
    entry["role"] = milestone.role;
    entry["share"] = milestone.share;
    return entry;
}

const Milestone* MilestonePolicy::findById(const QString& id) const
{
    for (const Milestone& milestone : m_milestones) {
        if (milestone.id == id) {
            return &milestone;
        }
    }
    return nullptr;
}

const Milestone* MilestonePolicy::findByLabel(const QString& label) const
{
    for (const Milestone& milestone : m_milestones) {
        if (milestone.label == label) {
            return &milestone;
        }
    }
    return nullptr;
}

double MilestonePolicy::roleShare(const QString& role, const QString& bucket) const
{
    double total = 0.0;
    bool covered = false;
    for (const Milestone& milestone : m_milestones) {
        if (milestone.role == role && milestone.bucket == bucket) {
            total += milestone.share;
            covered = true;
        }
    }
    return covered ? total : 1.0;
}

QList<MilestonePolicy::RoleBucket> MilestonePolicy::roleBuckets() const
{
    QList<RoleBucket> pairs;
    for (const Milestone& milestone : m_milestones) {
        RoleBucket pair = qMakePair(milestone.role, milestone.bucket);
        if (!pairs.contains(pair)) {
            pairs.append(pair);
        }
    }
    for (const RoleBucket& pair : m_closeOnly) {
        if (!pairs.contains(pair)) {
            pairs.append(pair);
        }
    }
    return pairs;
}

bool MilestonePolicy::isBaselineNote(const QString& note) const
{
    for (const Milestone& milestone : m_milestones) {
        if (note.startsWith(milestone.label + " of ")) {
            return true;
        }
    }
    return false;
}

bool MilestonePolicy::isSupplementNote(const QString& note)
{
    return note.startsWith("Supplement ");
}

bool MilestonePolicy::parseSupplementNote(const QString& note, SupplementNote& parsed)
{
    // Supplement +10.00h (Body 60%)[ [Alice 50%]][ (2)]
    static const QRegularExpression supplementRegex(
        "^Supplement ([+-])(\\d+(?:\\.\\d+)?)h \\((.+?)\\)"
        "(?: \\[(.+) (\\d+(?:\\.\\d+)?)%\\])?"
        "(?: \\((\\d+)\\))?$");

    QRegularExpressionMatch match = supplementRegex.match(note);
    if (!match.hasMatch()) {
        return false;
    }

    parsed.negative = match.captured(1) == "-";
    parsed.magnitude = match.captured(2).toDouble();
    parsed.label = match.captured(3);
    parsed.hasAllocation = !match.captured(4).isEmpty();
    parsed.employee = match.captured(4);
    parsed.percent = parsed.hasAllocation ? match.captured(5).toDouble() : 100.0;
    return true;
}

QString MilestonePolicy::allocationSuffix(const QString& employee, double percent)
{
    return QString(" [%1 %2%]").arg(employee, QString::number(percent, 'g', 6));
}
