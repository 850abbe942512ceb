#include "utils/ConfigLoader.h"
#include <QFile>
#include <QTextStream>
#include <QDebug>

ConfigLoader::ConfigLoader()
    : m_loaded(false)
{
}

ConfigLoader::~ConfigLoader()
{
}

bool ConfigLoader::load(const QString &filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "[Config] Failed to open config file:" << filePath;
        return false;
    }

    QTextStream in(&file);
    QString currentSection;

    while (!in.atEnd()) {
        QString line = in.readLine().trimmed();

        // Skip empty lines and comments
        if (line.isEmpty() || line.startsWith('#') || line.startsWith(';')) {
            continue;
        }

        // Section header [SECTION]
        if (line.startsWith('[') && line.endsWith(']')) {
            currentSection = line.mid(1, line.length() - 2).trimmed();
            if (!m_config.contains(currentSection)) {
                m_config[currentSection] = QMap<QString, QString>();
            }
            continue;
        }

        // key = value
        int equalPos = line.indexOf('=');
        if (equalPos > 0) {
            QString key = line.left(equalPos).trimmed();
            QString value = line.mid(equalPos + 1).trimmed();

            if (currentSection.isEmpty()) {
                currentSection = "DEFAULT";
            }

            m_config[currentSection][key] = value;
        } else {
            qWarning() << "[Config] Ignoring malformed line:" << line;
        }
    }

    file.close();
    m_loaded = true;

    qDebug() << "[Config] Configuration loaded from:" << filePath;
    qDebug() << "[Config]    Sections found:" << m_config.keys();

    return true;
}

QString ConfigLoader::getValue(const QString &section, const QString &key, const QString &defaultValue) const
{
    if (m_config.contains(section) && m_config[section].contains(key)) {
        return m_config[section][key];
    }
    return defaultValue;
}

int ConfigLoader::getInt(const QString &section, const QString &key, int defaultValue) const
{
    QString value = getValue(section, key);
    if (!value.isEmpty()) {
        bool ok;
        int result = value.toInt(&ok);
        if (ok) return result;
    }
    return defaultValue;
}

double ConfigLoader::getDouble(const QString &section, const QString &key, double defaultValue) const
{
    QString value = getValue(section, key);
    if (!value.isEmpty()) {
        bool ok;
        double result = value.toDouble(&ok);
        if (ok) return result;
    }
    return defaultValue;
}

bool ConfigLoader::getBool(const QString &section, const QString &key, bool defaultValue) const
{
    QString value = getValue(section, key).toLower();
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    } else if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    return defaultValue;
}

bool ConfigLoader::getUseInputPooling() const
{
    return getBool("RUNNER", "use_input_pooling", true);
}

QString ConfigLoader::getRandomMode() const
{
    return getValue("RANDOM", "mode", "default").toLower();
}

quint32 ConfigLoader::getRandomSeed() const
{
    bool ok;
    quint32 seed = getValue("RANDOM", "seed", "0").toUInt(&ok);
    return ok ? seed : 0;
}

double ConfigLoader::getRandomFixedValue() const
{
    return getDouble("RANDOM", "fixed_value", 0.5);
}

QString ConfigLoader::getLogDir() const
{
    return getValue("LOGGING", "log_dir", "logs");
}

bool ConfigLoader::getDebugLogging() const
{
    return getBool("LOGGING", "debug", false);
}

QString ConfigLoader::getLibraryPath() const
{
    return getValue("LIBRARY", "path");
}
