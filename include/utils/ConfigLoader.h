#ifndef CONFIGLOADER_H
#define CONFIGLOADER_H

#include <QMap>
#include <QString>
#include <QStringList>

/**
 * @brief INI-style configuration reader
 *
 *   # comment            ; comment
 *   [SECTION]
 *   key = value
 *
 * Keys that appear before any section header are stored under "DEFAULT".
 */
class ConfigLoader
{
public:
    ConfigLoader();
    ~ConfigLoader();

    // Load configuration from file
    bool load(const QString &filePath);

    // Load configuration from in-memory INI text (same syntax as load())
    bool loadFromString(const QString &text);

    // Get configuration values
    QString getValue(const QString &section, const QString &key, const QString &defaultValue = "") const;
    int getInt(const QString &section, const QString &key, int defaultValue = 0) const;
    bool getBool(const QString &section, const QString &key, bool defaultValue = false) const;
    bool contains(const QString &section, const QString &key) const;

    // Check if configuration is loaded
    bool isLoaded() const { return m_loaded; }

    QStringList sections() const { return m_config.keys(); }

private:
    bool m_loaded;
    QMap<QString, QMap<QString, QString>> m_config;

    void parseLines(const QStringList &lines);
};

#endif // CONFIGLOADER_H
