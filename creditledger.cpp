#include "creditledger.h"
#include <QScopedPointer>
#include <QtGlobal>
#include <cmath>
#include "closereconciler.h"
#include "configmanager.h"
#include "creditauditlog.h"
#include "creditledgerdbmanager.h"
#include "creditoverridedbmanager.h"
#include "databasemanager.h"
#include "errorhandling.h"
#include "errormanager.h"
#include "productionsummary.h"
#include "repairorderdbmanager.h"
#include "stagetransitionlog.h"
#include "timeclockdbmanager.h"

namespace {

double roundHours(double hours)
{
    return std::round(hours * 100.0) / 100.0;
}

// Tolerance for matching a recovered delta against a stored adjustment
const double DELTA_MATCH_TOLERANCE = 1e-5;
// Notes carry two decimals
const double NOTE_MATCH_TOLERANCE = 0.005;

}

LedgerContext LedgerContext::fromConfig()
{
    ConfigManager& config = ConfigManager::instance();
    LedgerContext context;

    context.stageOrder = StageOrder::fromConfig();
    if (context.stageOrder.isEmpty()) {
        THROW_CONFIG_ERROR("No stages configured", "Ledger/Stages");
    }

    context.policy = MilestonePolicy::fromConfig();

    const QString mode = config.getString("Ledger/CreditMode", "fixed");
    if (!CreditSource::modeFromString(mode, context.creditMode)) {
        THROW_CONFIG_ERROR("Unknown credit mode " + mode, "Ledger/CreditMode");
    }

    context.residualEpsilon = config.getDouble("Ledger/ResidualEpsilon", 1e-6);
    if (context.residualEpsilon <= 0.0) {
        context.residualEpsilon = 1e-6;
    }
    context.closedStatus = config.getString("Ledger/ClosedStatus", "closed");
    context.closeTolerance = config.getDouble("Ledger/CloseTolerance", 0.01);
    if (context.closeTolerance < 0.0) {
        context.closeTolerance = 0.01;
    }

    return context;
}

CreditLedger::CreditLedger(QObject* parent)
    : QObject(parent),
    m_dbManager(DatabaseManager::instance()),
    m_roManager(RepairOrderDBManager::instance()),
    m_transitions(StageTransitionLog::instance()),
    m_ledgerDb(CreditLedgerDBManager::instance()),
    m_overrides(CreditOverrideDBManager::instance()),
    m_auditLog(CreditAuditLog::instance()),
    m_workedSource(TimeClockDBManager::instance())
{
}

CreditLedger::~CreditLedger()
{
}

void CreditLedger::setWorkedHoursSource(WorkedHoursSource* source)
{
    m_workedSource = source;
}

QString CreditLedger::today()
{
    return QDate::currentDate().toString("yyyy-MM-dd");
}

QString CreditLedger::uniqueNote(const QString& note, QMap<QString, int>& seen)
{
    const int count = ++seen[note];
    if (count == 1) {
        return note;
    }
    return QString("%1 (%2)").arg(note).arg(count);
}

QList<CreditRow> CreditLedger::buildRows(const RepairOrder& ro, const LedgerContext& context,
                                         const CreditSource& source, bool capture)
{
    QList<CreditRow> rows;
    QMap<QString, int> seenNotes;
    const QList<StageTransition> transitions = m_transitions->transitionsFor(ro.roNumber);
    const bool fanOut = source.mode() == CreditSource::Allocation;

    for (const Milestone& milestone : context.policy.milestones()) {
        const double bucketValue = source.bucketValue(ro, milestone.bucket);
        const QList<CreditRecipient> recipients = source.recipients(ro, milestone.role);

        bool ok = false;
        CreditBaseline baseline;
        const bool hasBaseline = m_ledgerDb->findBaseline(ro.roNumber, milestone.id, baseline, &ok);
        if (!ok) {
            THROW_DB_ERROR("Failed to read baseline " + milestone.id, ro.roNumber);
        }

        if (!hasBaseline) {
            StageTransition match;
            if (!milestone.findFirstMatch(transitions, context.stageOrder, match)) {
                continue;
            }
            // Nothing to pay yet: wait for hours and a responsible employee
            if (bucketValue <= 0.0 || recipients.isEmpty()) {
                continue;
            }

            baseline.roNumber = ro.roNumber;
            baseline.milestoneId = milestone.id;
            baseline.baseHours = bucketValue;
            baseline.fromStage = match.fromStage;
            baseline.toStage = match.toStage;
            baseline.date = match.date();

            if (capture && !m_ledgerDb->ensureBaseline(baseline)) {
                THROW_DB_ERROR("Failed to capture baseline " + milestone.id, ro.roNumber);
            }
        }

        QList<CreditAdjustment> adjustments = m_ledgerDb->adjustmentsFor(ro.roNumber, milestone.id, &ok);
        if (!ok) {
            THROW_DB_ERROR("Failed to read adjustments " + milestone.id, ro.roNumber);
        }

        double applied = baseline.baseHours;
        for (const CreditAdjustment& adjustment : adjustments) {
            applied += adjustment.deltaHours;
        }

        const double unapplied = bucketValue - applied;
        if (qAbs(unapplied) >= context.residualEpsilon) {
            CreditAdjustment adjustment;
            adjustment.roNumber = ro.roNumber;
            adjustment.milestoneId = milestone.id;
            adjustment.fromStage = baseline.fromStage;
            adjustment.toStage = baseline.toStage;
            adjustment.date = today();
            adjustment.tech = source.adjustmentTech(ro, milestone.role);
            adjustment.deltaHours = unapplied;
            adjustment.share = milestone.share;

            if (capture) {
                adjustment.id = m_ledgerDb->addAdjustment(adjustment);
                if (adjustment.id == 0) {
                    THROW_DB_ERROR("Failed to record adjustment " + milestone.id, ro.roNumber);
                }
            }
            adjustments.append(adjustment);
        }

        const QString baseNote = milestone.baselineNote(baseline.baseHours, baseline.fromStage, baseline.toStage);
        for (const CreditRecipient& recipient : recipients) {
            CreditRow row;
            row.date = baseline.date;
            row.roNumber = ro.roNumber;
            row.fromStage = baseline.fromStage;
            row.toStage = baseline.toStage;
            row.employee = recipient.employee;
            row.hours = baseline.baseHours * milestone.share * recipient.weight;
            row.note = baseNote;
            if (fanOut) {
                row.note += MilestonePolicy::allocationSuffix(recipient.employee, recipient.percent);
            }
            row.note = uniqueNote(row.note, seenNotes);
            row.kind = CreditRowKind::Baseline;
            row.milestoneId = milestone.id;
            row.weight = recipient.weight;
            rows.append(row);
        }

        for (const CreditAdjustment& adjustment : adjustments) {
            const QString supplementNote = milestone.supplementNote(adjustment.deltaHours);

            // A recorded tech takes the whole supplement
            QList<CreditRecipient> paid;
            if (!adjustment.tech.isEmpty()) {
                CreditRecipient single;
                single.employee = adjustment.tech;
                paid.append(single);
            } else if (fanOut) {
                paid = recipients;
            } else {
                paid = source.recipients(ro, milestone.role);
            }

            for (const CreditRecipient& recipient : paid) {
                CreditRow row;
                row.date = adjustment.date;
                row.roNumber = ro.roNumber;
                row.fromStage = adjustment.fromStage;
                row.toStage = adjustment.toStage;
                row.employee = recipient.employee;
                row.hours = adjustment.deltaHours * adjustment.share * recipient.weight;
                row.note = supplementNote;
                if (fanOut && adjustment.tech.isEmpty()) {
                    row.note += MilestonePolicy::allocationSuffix(recipient.employee, recipient.percent);
                }
                row.note = uniqueNote(row.note, seenNotes);
                row.kind = CreditRowKind::Supplement;
                row.milestoneId = milestone.id;
                row.adjustmentId = adjustment.id;
                row.weight = recipient.weight;
                rows.append(row);
            }
        }
    }

    return rows;
}

bool CreditLedger::recompute(const QString& roNumber)
{
    const LedgerContext context = LedgerContext::fromConfig();

    RepairOrder ro;
    if (!m_roManager->loadRepairOrder(roNumber, ro)) {
        LOG_WARNING(QString("Recompute skipped, RO %1 not found").arg(roNumber));
        return false;
    }

    QScopedPointer<CreditSource> source(CreditSource::create(context.creditMode));

    ScopedTransaction transaction(m_dbManager);
    if (!transaction.isActive()) {
        THROW_DB_ERROR("Could not start recompute transaction", roNumber);
    }

    QList<CreditRow> rows = buildRows(ro, context, *source, true);

    // Audit lines keep the generated values; overrides apply at read time
    for (const CreditRow& row : rows) {
        CreditAuditEntry entry;
        entry.date = row.date;
        entry.roNumber = row.roNumber;
        entry.employee = row.employee;
        entry.hours = row.hours;
        entry.note = row.note;
        entry.fromStage = row.fromStage;
        entry.toStage = row.toStage;
        if (m_auditLog->postCredit(entry, CreditAuditLog::IfAbsent) == CreditAuditLog::Failed) {
            THROW_DB_ERROR("Failed to post credit '" + row.note + "'", roNumber);
        }
    }

    m_overrides->applyOverrides(rows);

    double taken = 0.0;
    for (const CreditRow& row : rows) {
        taken += row.hours;
    }
    taken = roundHours(taken);
    const double remaining = qMax(ro.totalHours - taken, 0.0);

    if (!m_roManager->updateDerivedHours(roNumber, taken, remaining)) {
        THROW_DB_ERROR("Failed to update derived hours", roNumber);
    }

    if (!transaction.commit()) {
        THROW_DB_ERROR("Recompute transaction did not commit", roNumber);
    }

    LOG_DEBUG(QString("Recomputed RO %1: %2 credit rows, %3h taken").arg(roNumber).arg(rows.size()).arg(taken));
    emit recomputed(roNumber, taken);

    // Credit posted after close is balanced against the expected totals again
    if (ro.status == context.closedStatus) {
        closeReconcile(roNumber);
    }
    return true;
}

int CreditLedger::recomputeAll()
{
    int succeeded = 0;
    const QStringList numbers = m_roManager->roNumbers();
    for (const QString& roNumber : numbers) {
        bool found = false;
        if (ErrorManager::instance().tryExec([&]() { found = recompute(roNumber); },
                                             "recompute RO " + roNumber) && found) {
            ++succeeded;
        }
    }

    LOG_INFO(QString("Recomputed %1 of %2 repair orders").arg(succeeded).arg(numbers.size()));
    return succeeded;
}

QList<CreditRow> CreditLedger::generatedCreditRows(const QString& roNumber)
{
    const LedgerContext context = LedgerContext::fromConfig();

    RepairOrder ro;
    if (!m_roManager->loadRepairOrder(roNumber, ro)) {
        return QList<CreditRow>();
    }

    QScopedPointer<CreditSource> source(CreditSource::create(context.creditMode));
    QList<CreditRow> rows = buildRows(ro, context, *source, false);
    m_overrides->applyOverrides(rows);
    return rows;
}

bool CreditLedger::setOverride(const CreditOverride& creditOverride)
{
    if (creditOverride.key.roNumber.isEmpty() || creditOverride.key.note.isEmpty()) {
        LOG_WARNING("Override needs an RO number and a note");
        return false;
    }
    if (creditOverride.hasHours && !std::isfinite(creditOverride.hours)) {
        LOG_WARNING("Override hours must be a number");
        return false;
    }

    if (!m_overrides->setOverride(creditOverride)) {
        return false;
    }

    emit creditRowsChanged(creditOverride.key.roNumber);
    return true;
}

bool CreditLedger::deleteOverride(const CreditRowKey& key)
{
    if (!m_overrides->deleteOverride(key)) {
        return false;
    }

    emit creditRowsChanged(key.roNumber);
    return true;
}

bool CreditLedger::deleteSupplement(const CreditRow& row)
{
    const LedgerContext context = LedgerContext::fromConfig();

    if (context.policy.isBaselineNote(row.note)) {
        LOG_WARNING(QString("Baseline credit on RO %1 cannot be deleted").arg(row.roNumber));
        return false;
    }

    SupplementNote parsed;
    if (!MilestonePolicy::parseSupplementNote(row.note, parsed)) {
        LOG_WARNING(QString("Not a supplement row: %1").arg(row.note));
        return false;
    }

    const Milestone* milestone = context.policy.findByLabel(parsed.label);
    if (!milestone) {
        LOG_WARNING(QString("No milestone labelled %1").arg(parsed.label));
        return false;
    }

    bool ok = false;
    const QList<CreditAdjustment> adjustments = m_ledgerDb->adjustmentsFor(row.roNumber, milestone->id, &ok);
    if (!ok) {
        THROW_DB_ERROR("Failed to read adjustments " + milestone->id, row.roNumber);
    }

    const double sign = parsed.negative ? -1.0 : 1.0;
    const double weight = parsed.hasAllocation ? parsed.percent / 100.0 : 1.0;

    qint64 targetId = 0;
    for (const CreditAdjustment& adjustment : adjustments) {
        if (row.adjustmentId > 0 && adjustment.id == row.adjustmentId) {
            targetId = adjustment.id;
            break;
        }
    }

    if (targetId == 0) {
        for (const CreditAdjustment& adjustment : adjustments) {
            if (adjustment.fromStage != row.fromStage || adjustment.toStage != row.toStage) {
                continue;
            }
            const double share = adjustment.share > 0.0 ? adjustment.share : milestone->share;
            if (share * weight <= 0.0) {
                continue;
            }
            const double recovered = sign * qAbs(row.hours) / (share * weight);
            if (qAbs(adjustment.deltaHours - recovered) < DELTA_MATCH_TOLERANCE) {
                targetId = adjustment.id;
                break;
            }
        }
    }

    // Overridden hours no longer divide back to the delta
    if (targetId == 0) {
        for (const CreditAdjustment& adjustment : adjustments) {
            if (adjustment.fromStage != row.fromStage || adjustment.toStage != row.toStage) {
                continue;
            }
            if (qAbs(adjustment.deltaHours - sign * parsed.magnitude) < NOTE_MATCH_TOLERANCE) {
                targetId = adjustment.id;
                break;
            }
        }
    }

    if (targetId == 0) {
        LOG_WARNING(QString("No adjustment matches '%1' on RO %2").arg(row.note, row.roNumber));
        return false;
    }

    // Every row the adjustment fans out to goes with it
    QList<CreditRowKey> keys;
    keys.append(row.key());
    RepairOrder ro;
    if (m_roManager->loadRepairOrder(row.roNumber, ro)) {
        QScopedPointer<CreditSource> source(CreditSource::create(context.creditMode));
        const QList<CreditRow> current = buildRows(ro, context, *source, false);
        for (const CreditRow& generated : current) {
            if (generated.adjustmentId == targetId && !keys.contains(generated.key())) {
                keys.append(generated.key());
            }
        }
    }

    ScopedTransaction transaction(m_dbManager);
    if (!transaction.isActive()) {
        THROW_DB_ERROR("Could not start delete transaction", row.roNumber);
    }

    if (!m_ledgerDb->deleteAdjustment(targetId)) {
        THROW_DB_ERROR(QString("Failed to delete adjustment %1").arg(targetId), row.roNumber);
    }

    for (const CreditRowKey& key : keys) {
        if (!m_overrides->deleteOverride(key) || !m_auditLog->deleteEntries(key.roNumber, key.note)) {
            THROW_DB_ERROR("Failed to roll back '" + key.note + "'", row.roNumber);
        }
    }

    if (!transaction.commit()) {
        THROW_DB_ERROR("Delete transaction did not commit", row.roNumber);
    }

    LOG_INFO(QString("Supplement '%1' on RO %2 reversed").arg(row.note, row.roNumber));
    emit creditRowsChanged(row.roNumber);
    return true;
}

bool CreditLedger::deleteCreditRow(const CreditRow& row)
{
    const LedgerContext context = LedgerContext::fromConfig();

    if (context.policy.isBaselineNote(row.note)) {
        LOG_WARNING(QString("Baseline credit on RO %1 cannot be deleted").arg(row.roNumber));
        return false;
    }

    if (MilestonePolicy::isSupplementNote(row.note)) {
        return deleteSupplement(row);
    }

    return deleteOverride(row.key());
}

int CreditLedger::closeReconcile(const QString& roNumber)
{
    const LedgerContext context = LedgerContext::fromConfig();

    RepairOrder ro;
    if (!m_roManager->loadRepairOrder(roNumber, ro)) {
        LOG_WARNING(QString("Close reconciliation skipped, RO %1 not found").arg(roNumber));
        return 0;
    }

    QScopedPointer<CreditSource> source(CreditSource::create(context.creditMode));
    CloseReconciler reconciler(context.policy, *source, context.closeTolerance);

    ScopedTransaction transaction(m_dbManager);
    if (!transaction.isActive()) {
        THROW_DB_ERROR("Could not start close transaction", roNumber);
    }

    // Recomputed from current state so a repeated close posts nothing
    const QList<CloseAdjustment> plan = reconciler.plan(ro, m_auditLog->postedTotals(roNumber));

    int posted = 0;
    for (const CloseAdjustment& adjustment : plan) {
        CreditAuditEntry entry;
        entry.date = today();
        entry.roNumber = roNumber;
        entry.employee = adjustment.employee;
        entry.hours = adjustment.difference;
        entry.note = CloseReconciler::CLOSE_NOTE;

        const CreditAuditLog::PostResult result = m_auditLog->postCredit(entry, CreditAuditLog::Always);
        if (result == CreditAuditLog::Failed) {
            THROW_DB_ERROR("Failed to post close adjustment for " + adjustment.employee, roNumber);
        }
        if (result == CreditAuditLog::Posted) {
            ++posted;
        }
    }

    if (!transaction.commit()) {
        THROW_DB_ERROR("Close transaction did not commit", roNumber);
    }

    LOG_INFO(QString("Close reconciliation on RO %1 posted %2 adjustments").arg(roNumber).arg(posted));
    emit closeReconciled(roNumber, posted);
    return posted;
}

QList<SummaryRow> CreditLedger::summary(const QDate& from, const QDate& to)
{
    ProductionSummary report(m_workedSource, m_auditLog);
    return report.build(from, to);
}

QList<CreditAuditEntry> CreditLedger::auditEntries(const QString& roNumber)
{
    return m_auditLog->entries(roNumber);
}
