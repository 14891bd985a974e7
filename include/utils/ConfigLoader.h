#ifndef CONFIGLOADER_H
#define CONFIGLOADER_H

#include <QMap>
#include <QString>
#include <QStringList>

/**
 * INI reader used for engine.ini:
 *
 *   # comment
 *   [ENGINE]
 *   max_formula_length = 5000
 *   strict_mode = false
 *
 * Keys before the first section header land in DEFAULT.
 */
class ConfigLoader
{
public:
    ConfigLoader();
    ~ConfigLoader();

    // Load configuration from file
    bool load(const QString &filePath);

    // Parse INI text directly (used for inline configuration)
    bool loadFromString(const QString &content, const QString &origin = "<string>");

    // Get configuration values
    QString getValue(const QString &section, const QString &key, const QString &defaultValue = "") const;
    int getInt(const QString &section, const QString &key, int defaultValue = 0) const;
    bool getBool(const QString &section, const QString &key, bool defaultValue = false) const;

    bool contains(const QString &section, const QString &key) const;
    QStringList sections() const { return m_config.keys(); }
    QStringList keys(const QString &section) const { return m_config.value(section).keys(); }

    // Values that are present but unparsable, as "SECTION.key"
    QStringList invalidValues() const { return m_invalid; }

    // Check if configuration is loaded
    bool isLoaded() const { return m_loaded; }

    QString lastError() const { return m_lastError; }

private:
    void parseLine(const QString &rawLine, QString &currentSection);

    bool m_loaded;
    QMap<QString, QMap<QString, QString>> m_config;
    mutable QStringList m_invalid;
    QString m_lastError;
};

#endif // CONFIGLOADER_H
