#ifndef VALIDATOR_H
#define VALIDATOR_H

#include <QString>
#include <QStringList>
#include <QRegularExpression>

/**
 * @brief Static utility class for input validation
 *
 * Checks applied at the collaborator boundary before values reach the
 * ledger. The require* variants throw ValidationException with the
 * field name; the is* variants only report.
 */
class Validator
{
public:
    /**
     * @brief Validate if a string is not empty
     * @param value The string to validate
     * @param allowWhitespace Whether whitespace-only strings are valid
     */
    static bool isNotEmpty(const QString& value, bool allowWhitespace = false);

    static bool matchesPattern(const QString& value, const QRegularExpression& regex);

    /**
     * @brief RO numbers are letters, digits and dashes, e.g. "1001" or "RO-1001"
     */
    static bool isValidRoNumber(const QString& value);

    /**
     * @brief Parse an hours field
     * @param value Text as typed by the operator
     * @param ok Set to false when the text is not a non-negative number
     * @return The parsed value; blank text parses as 0.0
     */
    static double parseHours(const QString& value, bool* ok = nullptr);

    static bool isValidHours(double hours);
    static bool isValidPercent(double percent);

    /**
     * @brief Validate if a string is a valid date
     * @param value The string to validate
     * @param format The expected date format
     */
    static bool isValidDate(const QString& value, const QString& format = "yyyy-MM-dd");

    static bool isValidDateTime(const QString& value, const QString& format = "yyyy-MM-dd hh:mm:ss");

    /**
     * @brief Stage must be one of the configured stage names (case-sensitive)
     */
    static bool isKnownStage(const QString& stage, const QStringList& stages);

    // Throwing variants used by RepairOrderController
    static QString requireRoNumber(const QString& value);
    static double requireHours(const QString& value, const QString& field);
    static void requirePercent(double percent, const QString& field);
    static void requireStage(const QString& stage, const QStringList& stages);
    static void requireStatus(const QString& status, const QStringList& statuses);

private:
    static const QRegularExpression roNumberRegex;
};

#endif // VALIDATOR_H
