#include "utils/ConfigLoader.h"
#include <QDebug>
#include <QFile>
#include <QTextStream>

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
        m_lastError = QString("Failed to open config file: %1").arg(filePath);
        qWarning() << "[ConfigLoader]" << m_lastError;
        return false;
    }

    QTextStream in(&file);
    return loadFromString(in.readAll(), filePath);
}

bool ConfigLoader::loadFromString(const QString &content, const QString &origin)
{
    QString currentSection;
    const QStringList lines = content.split('\n');
    for (const QString &line : lines)
        parseLine(line, currentSection);

    m_loaded = true;
    qDebug() << "[ConfigLoader] Configuration loaded from:" << origin;
    qDebug() << "[ConfigLoader]   Sections found:" << m_config.keys();
    return true;
}

void ConfigLoader::parseLine(const QString &rawLine, QString &currentSection)
{
    QString line = rawLine.trimmed();

    // Skip empty lines and comments
    if (line.isEmpty() || line.startsWith('#') || line.startsWith(';'))
        return;

    // Section header [SECTION]
    if (line.startsWith('[') && line.endsWith(']')) {
        currentSection = line.mid(1, line.length() - 2).trimmed();
        if (!m_config.contains(currentSection))
            m_config[currentSection] = QMap<QString, QString>();
        return;
    }

    // key = value
    int equalPos = line.indexOf('=');
    if (equalPos <= 0) {
        qWarning() << "[ConfigLoader] Ignoring malformed line:" << line;
        return;
    }

    QString key = line.left(equalPos).trimmed();
    QString value = line.mid(equalPos + 1).trimmed();

    // Store in default section if no section defined yet
    if (currentSection.isEmpty())
        currentSection = "DEFAULT";

    m_config[currentSection][key] = value;
}

bool ConfigLoader::contains(const QString &section, const QString &key) const
{
    return m_config.contains(section) && m_config[section].contains(key);
}

QString ConfigLoader::getValue(const QString &section, const QString &key, const QString &defaultValue) const
{
    if (contains(section, key))
        return m_config[section][key];
    return defaultValue;
}

int ConfigLoader::getInt(const QString &section, const QString &key, int defaultValue) const
{
    QString value = getValue(section, key);
    if (!value.isEmpty()) {
        bool ok;
        int result = value.toInt(&ok);
        if (ok)
            return result;
        m_invalid << QString("%1.%2").arg(section, key);
        qWarning() << "[ConfigLoader]" << section << key << "is not an integer:" << value;
    }
    return defaultValue;
}

bool ConfigLoader::getBool(const QString &section, const QString &key, bool defaultValue) const
{
    QString raw = getValue(section, key);
    QString value = raw.toLower();
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    } else if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    if (!raw.isEmpty()) {
        m_invalid << QString("%1.%2").arg(section, key);
        qWarning() << "[ConfigLoader]" << section << key << "is not a boolean:" << raw;
    }
    return defaultValue;
}
