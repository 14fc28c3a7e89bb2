#ifndef STAGEORDER_H
#define STAGEORDER_H

#include <QString>
#include <QStringList>

/**
 * @brief Snapshot of the configured stage sequence
 *
 * Stage names are matched case-sensitively. A name that is not in the
 * list has index -1 and is never at or after any configured stage.
 * Build a fresh snapshot per ledger call; do not keep one around.
 */
class StageOrder
{
public:
    StageOrder();
    StageOrder(const QStringList& stages, int version = 0);

    static StageOrder fromConfig();

    const QStringList& stages() const { return m_stages; }
    int version() const { return m_version; }
    bool isEmpty() const { return m_stages.isEmpty(); }

    int indexOf(const QString& stage) const;
    bool contains(const QString& stage) const;

    bool isAtOrAfter(const QString& stage, const QString& target) const;
    bool isAfter(const QString& stage, const QString& target) const;

private:
    QStringList m_stages;
    int m_version;
};

#endif // STAGEORDER_H
