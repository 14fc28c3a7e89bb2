#include "configmanager.h"
#include "logger.h"
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QCoreApplication>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QSet>

ConfigManager& ConfigManager::instance()
{
    static ConfigManager instance;
    return instance;
}

ConfigManager::ConfigManager()
    : QObject(nullptr),
    m_settings(nullptr),
    m_initialized(false),
    m_version(0)
{
}

ConfigManager::~ConfigManager()
{
    if (m_settings) {
        m_settings->sync();
        delete m_settings;
    }
}

void ConfigManager::initialize(const QString& organization, const QString& application,
                               const QString& configFilePath)
{
    QMutexLocker locker(&m_mutex);

    // Clean up existing settings if any
    if (m_settings) {
        m_settings->sync();
        delete m_settings;
        m_settings = nullptr;
    }
    m_defaults.clear();
    m_initialized = false;

    QCoreApplication::setApplicationName(application);
    QCoreApplication::setOrganizationName(organization);

    if (!configFilePath.isEmpty()) {
        m_settings = new QSettings(configFilePath, QSettings::IniFormat);
    } else {
        m_settings = new QSettings(QSettings::IniFormat, QSettings::UserScope, organization, application);
    }

    QFileInfo fileInfo(m_settings->fileName());
    QDir dir = fileInfo.dir();
    if (!dir.exists() && !dir.mkpath(".")) {
        LOG_ERROR(QString("Failed to create settings directory: %1").arg(dir.path()));
        return;
    }

    m_initialized = true;
    ++m_version;

    QMap<QString, QVariant> defaults;
    defaults["DataPath"] = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    defaults["DatabasePath"] = "${DataPath}/shopcredit.db";
    defaults["LogPath"] = "${DataPath}/logs";
    defaults["Logging/MinLevel"] = "Info";

    defaults["Ledger/Stages"] = QStringList{"New Entry", "Intake", "Disassembly", "Body", "Paint",
                                            "Reassembly", "Detail", "QC", "Deliver"};
    defaults["Ledger/Statuses"] = QStringList{"open", "on_hold", "closed"};
    defaults["Ledger/ClosedStatus"] = "closed";
    defaults["Ledger/CloseBuckets"] = QStringList{"Mechanic=mechanical_hours"};
    defaults["Ledger/CreditMode"] = "fixed";
    defaults["Ledger/ResidualEpsilon"] = 1e-6;
    defaults["Ledger/CloseTolerance"] = 0.01;

    setDefaults(defaults);
}

bool ConfigManager::isInitialized() const
{
    QMutexLocker locker(&m_mutex);
    return m_initialized && m_settings;
}

QVariant ConfigManager::getValue(const QString& key, const QVariant& defaultValue) const
{
    QMutexLocker locker(&m_mutex);

    if (!m_initialized || !m_settings) {
        if (m_defaults.contains(key)) {
            return m_defaults.value(key);
        }
        return defaultValue;
    }

    if (m_settings->contains(key)) {
        return m_settings->value(key);
    } else if (m_defaults.contains(key)) {
        return m_defaults.value(key);
    }
    return defaultValue;
}

void ConfigManager::setValue(const QString& key, const QVariant& value)
{
    {
        QMutexLocker locker(&m_mutex);

        if (!m_initialized || !m_settings) {
            LOG_WARNING(QString("Attempted to set %1 before initialization").arg(key));
            return;
        }

        if (m_settings->contains(key) && m_settings->value(key) == value) {
            return;
        }
        m_settings->setValue(key, value);
        ++m_version;
    }

    emit valueChanged(key, value);
}

QString ConfigManager::getString(const QString& key, const QString& defaultValue) const
{
    return getValue(key, defaultValue).toString();
}

double ConfigManager::getDouble(const QString& key, double defaultValue) const
{
    bool ok = false;
    double value = getValue(key, defaultValue).toDouble(&ok);
    return ok ? value : defaultValue;
}

QStringList ConfigManager::getStringList(const QString& key, const QStringList& defaultValue) const
{
    QVariant value = getValue(key);
    if (!value.isValid()) {
        return defaultValue;
    }

    // A single-element INI list comes back as a plain string
    QStringList list = value.toStringList();
    if (list.isEmpty() && !value.toString().isEmpty()) {
        list = value.toString().split(',', Qt::SkipEmptyParts);
    }

    QStringList trimmed;
    for (const QString& item : list) {
        if (!item.trimmed().isEmpty()) {
            trimmed.append(item.trimmed());
        }
    }
    return trimmed;
}

QList<QMap<QString, QVariant>> ConfigManager::getArray(const QString& prefix) const
{
    QMutexLocker locker(&m_mutex);
    QList<QMap<QString, QVariant>> entries;

    if (!m_initialized || !m_settings) {
        return entries;
    }

    int size = m_settings->beginReadArray(prefix);
    for (int i = 0; i < size; ++i) {
        m_settings->setArrayIndex(i);
        QMap<QString, QVariant> entry;
        const QStringList keys = m_settings->childKeys();
        for (const QString& key : keys) {
            entry[key] = m_settings->value(key);
        }
        entries.append(entry);
    }
    m_settings->endArray();

    return entries;
}

void ConfigManager::setArray(const QString& prefix, const QList<QMap<QString, QVariant>>& entries)
{
    {
        QMutexLocker locker(&m_mutex);

        if (!m_initialized || !m_settings) {
            LOG_WARNING(QString("Attempted to set array %1 before initialization").arg(prefix));
            return;
        }

        m_settings->remove(prefix);
        m_settings->beginWriteArray(prefix, entries.size());
        for (int i = 0; i < entries.size(); ++i) {
            m_settings->setArrayIndex(i);
            const QMap<QString, QVariant>& entry = entries.at(i);
            for (auto it = entry.constBegin(); it != entry.constEnd(); ++it) {
                m_settings->setValue(it.key(), it.value());
            }
        }
        m_settings->endArray();
        ++m_version;
    }

    emit valueChanged(prefix, QVariant());
}

QString ConfigManager::getPath(const QString& key, const QString& defaultPath, bool createIfMissing) const
{
    QString path = resolvePath(getString(key, defaultPath));

    if (createIfMissing) {
        QDir dir(path);
        if (!dir.exists() && !dir.mkpath(".")) {
            LOG_WARNING(QString("Failed to create directory: %1").arg(path));
        }
    }

    return path;
}

void ConfigManager::setDefaults(const QMap<QString, QVariant>& defaults)
{
    QMutexLocker locker(&m_mutex);

    for (auto it = defaults.constBegin(); it != defaults.constEnd(); ++it) {
        m_defaults[it.key()] = it.value();

        // Seed the file so operators can see and edit every key
        if (m_settings && !m_settings->contains(it.key())) {
            m_settings->setValue(it.key(), it.value());
        }
    }
}

int ConfigManager::configVersion() const
{
    QMutexLocker locker(&m_mutex);
    return m_version;
}

void ConfigManager::save()
{
    QMutexLocker locker(&m_mutex);

    if (m_initialized && m_settings) {
        m_settings->sync();
    }
}

QString ConfigManager::resolvePath(const QString& path) const
{
    QString result = path;

    static const QRegularExpression variableRegex(QStringLiteral("\\$\\{([^}]+)\\}"));

    // Track processed variables to avoid infinite recursion
    QSet<QString> processedVars;
    const int maxIterations = 10;

    for (int i = 0; i < maxIterations && result.contains("${"); i++) {
        QRegularExpressionMatchIterator it = variableRegex.globalMatch(result);
        if (!it.hasNext()) {
            break;
        }
        while (it.hasNext()) {
            QRegularExpressionMatch match = it.next();
            QString variableName = match.captured(1);

            if (processedVars.contains(variableName)) {
                continue;
            }

            QString variableValue = getString(variableName, "");
            if (!variableValue.isEmpty()) {
                result.replace("${" + variableName + "}", variableValue);
                processedVars.insert(variableName);
            }
        }
    }
    return result;
}
