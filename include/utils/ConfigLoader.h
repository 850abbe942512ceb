#ifndef CONFIGLOADER_H
#define CONFIGLOADER_H

#include <QMap>
#include <QString>
#include <QStringList>

/**
 * INI configuration for the formula tools.
 *
 *   [RUNNER]   use_input_pooling = true
 *   [RANDOM]   mode = default | seeded | fixed, seed, fixed_value
 *   [LOGGING]  log_dir = logs, debug = false
 *   [LIBRARY]  path = formulas.json
 *
 * Lines starting with '#' or ';' are comments. Keys that appear before the
 * first section header are stored under "DEFAULT".
 */
class ConfigLoader
{
public:
    ConfigLoader();
    ~ConfigLoader();

    // Load configuration from file
    bool load(const QString &filePath);

    // Get configuration values
    QString getValue(const QString &section, const QString &key, const QString &defaultValue = "") const;
    int getInt(const QString &section, const QString &key, int defaultValue = 0) const;
    double getDouble(const QString &section, const QString &key, double defaultValue = 0.0) const;
    bool getBool(const QString &section, const QString &key, bool defaultValue = false) const;

    // Check if configuration is loaded
    bool isLoaded() const { return m_loaded; }
    QStringList sections() const { return m_config.keys(); }

    // Runner
    bool getUseInputPooling() const;

    // Random provider selection
    QString getRandomMode() const;
    quint32 getRandomSeed() const;
    double getRandomFixedValue() const;

    // Logging
    QString getLogDir() const;
    bool getDebugLogging() const;

    // Formula library (JSON)
    QString getLibraryPath() const;

private:
    bool m_loaded;
    QMap<QString, QMap<QString, QString>> m_config;
};

#endif // CONFIGLOADER_H
