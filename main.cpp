#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDate>
#include <QDir>
#include <QSqlDatabase>
#include <QTextStream>

#include "configmanager.h"
#include "creditauditlog.h"
#include "creditledger.h"
#include "creditledgerdbmanager.h"
#include "creditoverridedbmanager.h"
#include "databasemanager.h"
#include "errormanager.h"
#include "logger.h"
#include "repairorderdbmanager.h"
#include "repairordercontroller.h"
#include "stagetransitionlog.h"
#include "timeclockdbmanager.h"
#include "validator.h"

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

bool initializeStores(const QString& dbPath)
{
    if (!QSqlDatabase::drivers().contains("QSQLITE")) {
        LOG_FATAL("SQLite driver is not available");
        return false;
    }

    if (!DatabaseManager::instance()->initialize(dbPath)) {
        LOG_FATAL("Failed to initialize database at " + dbPath);
        return false;
    }

    // repair_orders first: every other table references it
    return RepairOrderDBManager::instance()->initialize()
           && StageTransitionLog::instance()->initialize()
           && CreditLedgerDBManager::instance()->initialize()
           && CreditOverrideDBManager::instance()->initialize()
           && CreditAuditLog::instance()->initialize()
           && TimeClockDBManager::instance()->initialize();
}

QDate parseDateOption(const QCommandLineParser& parser, const QString& name)
{
    if (!parser.isSet(name)) {
        return QDate();
    }
    const QString value = parser.value(name);
    if (!Validator::isValidDate(value)) {
        THROW_VALIDATION_ERROR(QString("Expected yyyy-MM-dd, got '%1'").arg(value), name);
    }
    return QDate::fromString(value, "yyyy-MM-dd");
}

QString hours(double value)
{
    return QString::number(value, 'f', 2);
}

void printRows(const QList<CreditRow>& rows)
{
    for (const CreditRow& row : rows) {
        out() << row.date << "  " << row.employee.leftJustified(16) << " "
              << hours(row.hours).rightJustified(8) << "  " << row.note
              << (row.overridden ? "  *" : "") << Qt::endl;
    }
}

void printAudit(const QList<CreditAuditEntry>& entries)
{
    for (const CreditAuditEntry& entry : entries) {
        out() << entry.date << "  " << entry.roNumber.leftJustified(10) << " "
              << entry.employee.leftJustified(16) << " " << hours(entry.hours).rightJustified(8)
              << "  " << entry.note << Qt::endl;
    }
}

void printSummary(const QList<SummaryRow>& rows)
{
    out() << QString("Employee").leftJustified(16) << " " << QString("Worked").rightJustified(8) << " "
          << QString("Credited").rightJustified(9) << " " << QString("Eff.").rightJustified(6) << Qt::endl;
    for (const SummaryRow& row : rows) {
        out() << row.employee.leftJustified(16) << " " << hours(row.workedHours).rightJustified(8) << " "
              << hours(row.creditedHours).rightJustified(9) << " "
              << hours(row.efficiency).rightJustified(6) << Qt::endl;
    }
}

bool requireArgs(const QStringList& args, int count, const QString& usage)
{
    if (args.size() < count) {
        out() << "Usage: shopcredit " << usage << Qt::endl;
        return false;
    }
    return true;
}

int runCommand(const QCommandLineParser& parser, CreditLedger& ledger, RepairOrderController& controller)
{
    const QStringList args = parser.positionalArguments();
    const QString command = args.value(0);

    if (command == "recompute") {
        if (parser.isSet("ro")) {
            return ledger.recompute(Validator::requireRoNumber(parser.value("ro"))) ? 0 : 1;
        }
        const int done = ledger.recomputeAll();
        out() << "Recomputed " << done << " repair orders" << Qt::endl;
        return ErrorManager::instance().errorCount() == 0 ? 0 : 1;
    }

    if (command == "rows") {
        if (!requireArgs(args, 2, "rows <ro>")) {
            return 2;
        }
        printRows(ledger.generatedCreditRows(Validator::requireRoNumber(args.at(1))));
        return 0;
    }

    if (command == "close") {
        if (!requireArgs(args, 2, "close <ro>")) {
            return 2;
        }
        const QString roNumber = Validator::requireRoNumber(args.at(1));
        const QString closedStatus = ConfigManager::instance().getString("Ledger/ClosedStatus", "closed");
        RepairOrder ro;
        if (!RepairOrderDBManager::instance()->loadRepairOrder(roNumber, ro)) {
            return 1;
        }
        // Already closed: run the true-up again, it only posts what is still missing
        if (ro.status == closedStatus) {
            out() << "Posted " << ledger.closeReconcile(roNumber) << " close adjustments" << Qt::endl;
            return 0;
        }
        return controller.changeStatus(roNumber, closedStatus) ? 0 : 1;
    }

    if (command == "summary") {
        printSummary(ledger.summary(parseDateOption(parser, "from"), parseDateOption(parser, "to")));
        return 0;
    }

    if (command == "audit") {
        const QString roNumber = parser.isSet("ro") ? Validator::requireRoNumber(parser.value("ro")) : QString();
        printAudit(ledger.auditEntries(roNumber));
        return 0;
    }

    if (command == "create") {
        if (!requireArgs(args, 3, "create <ro> <total_hours> [--stage <stage>] [--date <yyyy-MM-dd>]")) {
            return 2;
        }
        RepairOrder ro;
        ro.roNumber = args.at(1);
        ro.totalHours = Validator::requireHours(args.at(2), "total_hours");
        ro.stage = parser.value("stage");
        ro.date = parser.isSet("date") ? parser.value("date") : QDate::currentDate().toString("yyyy-MM-dd");
        return controller.createRepairOrder(ro) ? 0 : 1;
    }

    if (command == "stage") {
        if (!requireArgs(args, 3, "stage <ro> <stage>")) {
            return 2;
        }
        return controller.changeStage(args.at(1), args.at(2)) ? 0 : 1;
    }

    if (command == "bucket") {
        if (!requireArgs(args, 4, "bucket <ro> <bucket> <hours>")) {
            return 2;
        }
        return controller.changeBucket(args.at(1), args.at(2), args.at(3)) ? 0 : 1;
    }

    if (command == "status") {
        if (!requireArgs(args, 3, "status <ro> <status>")) {
            return 2;
        }
        return controller.changeStatus(args.at(1), args.at(2)) ? 0 : 1;
    }

    if (command == "assign") {
        if (!requireArgs(args, 4, "assign <ro> <role> <employee>")) {
            return 2;
        }
        return controller.assignEmployee(args.at(1), args.at(2), args.at(3)) ? 0 : 1;
    }

    if (command == "override") {
        if (!requireArgs(args, 3, "override <ro> <note> [--hours <h>] [--tech <name>] [--date <yyyy-MM-dd>]")) {
            return 2;
        }
        const QList<CreditRow> rows = ledger.generatedCreditRows(Validator::requireRoNumber(args.at(1)));
        for (const CreditRow& row : rows) {
            if (row.note != args.at(2)) {
                continue;
            }
            CreditOverride creditOverride;
            creditOverride.key = row.key();
            creditOverride.tech = parser.value("tech");
            creditOverride.date = parseDateOption(parser, "date").toString("yyyy-MM-dd");
            if (parser.isSet("hours")) {
                bool ok = false;
                creditOverride.hours = parser.value("hours").toDouble(&ok);
                if (!ok) {
                    THROW_VALIDATION_ERROR("Override hours must be a number", "hours");
                }
                creditOverride.hasHours = true;
            }
            return ledger.setOverride(creditOverride) ? 0 : 1;
        }
        out() << "No credit row with that note" << Qt::endl;
        return 1;
    }

    if (command == "delete-row") {
        if (!requireArgs(args, 3, "delete-row <ro> <note>")) {
            return 2;
        }
        const QList<CreditRow> rows = ledger.generatedCreditRows(Validator::requireRoNumber(args.at(1)));
        for (const CreditRow& row : rows) {
            if (row.note == args.at(2)) {
                return ledger.deleteCreditRow(row) ? 0 : 1;
            }
        }
        out() << "No credit row with that note" << Qt::endl;
        return 1;
    }

    if (command == "clock") {
        if (!requireArgs(args, 4, "clock <employee> <yyyy-MM-dd> <hours>")) {
            return 2;
        }
        if (!Validator::isValidDate(args.at(2))) {
            THROW_VALIDATION_ERROR(QString("Expected yyyy-MM-dd, got '%1'").arg(args.at(2)), "work_date");
        }
        TimeClockRecord record;
        record.employee = args.at(1);
        record.workDate = args.at(2);
        record.hours = Validator::requireHours(args.at(3), "hours");
        return TimeClockDBManager::instance()->addRecord(record) > 0 ? 0 : 1;
    }

    out() << "Unknown command '" << command << "'" << Qt::endl;
    return 2;
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("ShopCredit");
    app.setOrganizationName("ShopCredit");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Production credit ledger for repair orders");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {"config", "Settings file (INI).", "path"},
        {"db", "Database file, overrides DatabasePath.", "path"},
        {"ro", "Restrict to one repair order.", "ro"},
        {"from", "First date of the range.", "yyyy-MM-dd"},
        {"to", "Last date of the range.", "yyyy-MM-dd"},
        {"stage", "Initial stage for create.", "stage"},
        {"date", "Date for create or override.", "yyyy-MM-dd"},
        {"hours", "Replacement hours for override.", "hours"},
        {"tech", "Replacement employee for override.", "name"},
    });
    parser.addPositionalArgument("command",
                                 "recompute | rows | close | summary | audit | create | stage | "
                                 "bucket | status | assign | override | delete-row | clock");
    parser.process(app);

    if (parser.positionalArguments().isEmpty()) {
        parser.showHelp(2);
    }

    ConfigManager& config = ConfigManager::instance();
    config.initialize("ShopCredit", "ShopCredit", parser.value("config"));

    Logger& logger = Logger::instance();
    logger.setMinimumLevel(Logger::levelFromString(config.getString("Logging/MinLevel", "Info")));
    if (!logger.initialize(config.getPath("LogPath", QString(), true), false)) {
        fprintf(stderr, "Could not open log file, continuing without it\n");
    }
    logger.setCustomLogHandler([](LogLevel level, const QString& message) {
        if (level >= LogLevel::Warning) {
            fprintf(stderr, "%s\n", qPrintable(message));
        }
    });

    const QString dbPath = parser.isSet("db") ? parser.value("db") : config.getPath("DatabasePath");
    if (!initializeStores(dbPath)) {
        return 1;
    }

    CreditLedger ledger;
    RepairOrderController controller(&ledger);

    int exitCode = 1;
    try {
        exitCode = runCommand(parser, ledger, controller);
    }
    catch (const std::exception& e) {
        ErrorManager::instance().handleException(e, parser.positionalArguments().join(' '));
        fprintf(stderr, "Error: %s\n", e.what());
        exitCode = 1;
    }

    config.save();
    logger.close();
    DatabaseManager::instance()->close();
    return exitCode;
}
