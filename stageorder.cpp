#include "stageorder.h"
#include "configmanager.h"

StageOrder::StageOrder()
    : m_version(0)
{
}

StageOrder::StageOrder(const QStringList& stages, int version)
    : m_stages(stages),
    m_version(version)
{
}

StageOrder StageOrder::fromConfig()
{
    ConfigManager& config = ConfigManager::instance();
    return StageOrder(config.getStringList("Ledger/Stages"), config.configVersion());
}

int StageOrder::indexOf(const QString& stage) const
{
    return m_stages.indexOf(stage);
}

bool StageOrder::contains(const QString& stage) const
{
    return indexOf(stage) >= 0;
}

bool StageOrder::isAtOrAfter(const QString& stage, const QString& target) const
{
    int stageIndex = indexOf(stage);
    int targetIndex = indexOf(target);
    if (stageIndex < 0 || targetIndex < 0) {
        return false;
    }
    return stageIndex >= targetIndex;
}

bool StageOrder::isAfter(const QString& stage, const QString& target) const
{
    int stageIndex = indexOf(stage);
    int targetIndex = indexOf(target);
    if (stageIndex < 0 || targetIndex < 0) {
        return false;
    }
    return stageIndex > targetIndex;
}
