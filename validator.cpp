#include "validator.h"
#include "errorhandling.h"
#include <QDate>
#include <QDateTime>
#include <cmath>

const QRegularExpression Validator::roNumberRegex(
    "^[A-Za-z0-9]+(-[A-Za-z0-9]+)*$"
    );

bool Validator::isNotEmpty(const QString& value, bool allowWhitespace)
{
    if (allowWhitespace) {
        return !value.isEmpty();
    } else {
        return !value.trimmed().isEmpty();
    }
}

bool Validator::matchesPattern(const QString& value, const QRegularExpression& regex)
{
    QRegularExpressionMatch match = regex.match(value);
    return match.hasMatch();
}

bool Validator::isValidRoNumber(const QString& value)
{
    return isNotEmpty(value) && matchesPattern(value.trimmed(), roNumberRegex);
}

double Validator::parseHours(const QString& value, bool* ok)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        if (ok) *ok = true;
        return 0.0;
    }

    bool parsed = false;
    double hours = trimmed.toDouble(&parsed);
    if (!parsed || !isValidHours(hours)) {
        if (ok) *ok = false;
        return 0.0;
    }

    if (ok) *ok = true;
    return hours;
}

bool Validator::isValidHours(double hours)
{
    return std::isfinite(hours) && hours >= 0.0;
}

bool Validator::isValidPercent(double percent)
{
    return std::isfinite(percent) && percent >= 0.0 && percent <= 100.0;
}

bool Validator::isValidDate(const QString& value, const QString& format)
{
    QDate date = QDate::fromString(value, format);
    return date.isValid();
}

bool Validator::isValidDateTime(const QString& value, const QString& format)
{
    QDateTime dateTime = QDateTime::fromString(value, format);
    return dateTime.isValid();
}

bool Validator::isKnownStage(const QString& stage, const QStringList& stages)
{
    return stages.contains(stage, Qt::CaseSensitive);
}

QString Validator::requireRoNumber(const QString& value)
{
    if (!isNotEmpty(value)) {
        THROW_VALIDATION_ERROR("RO number is required", "ro_number");
    }
    if (!isValidRoNumber(value)) {
        THROW_VALIDATION_ERROR(QString("Invalid RO number '%1'").arg(value), "ro_number");
    }
    return value.trimmed();
}

double Validator::requireHours(const QString& value, const QString& field)
{
    bool ok = false;
    double hours = parseHours(value, &ok);
    if (!ok) {
        THROW_VALIDATION_ERROR(QString("'%1' is not a valid number of hours").arg(value), field);
    }
    return hours;
}

void Validator::requirePercent(double percent, const QString& field)
{
    if (!isValidPercent(percent)) {
        THROW_VALIDATION_ERROR(QString("Percent %1 is outside 0-100").arg(percent), field);
    }
}

void Validator::requireStage(const QString& stage, const QStringList& stages)
{
    if (!isKnownStage(stage, stages)) {
        THROW_VALIDATION_ERROR(QString("Unknown stage '%1'").arg(stage), "stage");
    }
}

void Validator::requireStatus(const QString& status, const QStringList& statuses)
{
    if (!statuses.contains(status, Qt::CaseSensitive)) {
        THROW_VALIDATION_ERROR(QString("Unknown status '%1'").arg(status), "status");
    }
}
