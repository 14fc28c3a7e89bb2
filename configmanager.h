#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QVariant>
#include <QString>
#include <QStringList>
#include <QMap>
#include <QList>
#include <QRecursiveMutex>

/**
 * @brief Singleton class for managing application configuration
 *
 * Wraps QSettings with a table of defaults, ${Key} substitution in path
 * values and a version counter that changes on every write. The ledger
 * reads the stage list, milestone table and tolerances from here at the
 * start of each call, so edits take effect without a restart.
 */
class ConfigManager : public QObject
{
    Q_OBJECT

public:
    static ConfigManager& instance();

    /**
     * @brief Initialize with default settings file
     * @param organization Organization name for QSettings
     * @param application Application name for QSettings
     * @param configFilePath Optional path to an INI file
     */
    void initialize(const QString& organization, const QString& application,
                    const QString& configFilePath = QString());

    bool isInitialized() const;

    /**
     * @brief Get a configuration value
     * @param key The setting key
     * @param defaultValue The default value if key not found
     * @return The setting value, the registered default, or defaultValue
     */
    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;

    /**
     * @brief Set a configuration value and bump the config version
     */
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    double getDouble(const QString& key, double defaultValue = 0.0) const;
    QStringList getStringList(const QString& key, const QStringList& defaultValue = QStringList()) const;

    /**
     * @brief Read a QSettings array (beginReadArray) as a list of key/value maps
     * @param prefix Array name, e.g. "Ledger/Milestones"
     * @return One map per array element; empty if the array is absent
     */
    QList<QMap<QString, QVariant>> getArray(const QString& prefix) const;

    /**
     * @brief Replace a QSettings array
     */
    void setArray(const QString& prefix, const QList<QMap<QString, QVariant>>& entries);

    /**
     * @brief Get a file path from configuration with ${Key} substitution
     * @param key The key for the path
     * @param defaultPath Default path if key not found
     * @param createIfMissing Create the directory if it doesn't exist
     * @return The resolved file path
     */
    QString getPath(const QString& key, const QString& defaultPath = QString(), bool createIfMissing = false) const;

    void setDefaults(const QMap<QString, QVariant>& defaults);

    /**
     * @brief Monotonic counter incremented whenever a value changes
     */
    int configVersion() const;

    void save();

signals:
    void valueChanged(const QString& key, const QVariant& value);

private:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    QSettings* m_settings;
    QMap<QString, QVariant> m_defaults;
    bool m_initialized;
    int m_version;

    mutable QRecursiveMutex m_mutex;

    QString resolvePath(const QString& path) const;
};

#endif // CONFIGMANAGER_H
