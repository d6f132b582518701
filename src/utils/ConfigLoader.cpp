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
        qWarning() << "[ConfigLoader] Failed to open config file:" << filePath;
        return false;
    }

    QTextStream in(&file);
    QStringList lines;
    while (!in.atEnd())
        lines.append(in.readLine());
    file.close();

    parseLines(lines);
    m_loaded = true;

    qDebug() << "[ConfigLoader] Configuration loaded from:" << filePath
             << "sections:" << m_config.keys();
    return true;
}

bool ConfigLoader::loadFromString(const QString &text)
{
    parseLines(text.split(QLatin1Char('\n')));
    m_loaded = true;
    return true;
}

void ConfigLoader::parseLines(const QStringList &lines)
{
    QString currentSection;

    for (const QString &raw : lines) {
        QString line = raw.trimmed();

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

            // Store in default section if no section defined yet
            if (currentSection.isEmpty()) {
                currentSection = "DEFAULT";
            }

            m_config[currentSection][key] = value;
        } else {
            qWarning() << "[ConfigLoader] Ignoring malformed line:" << line;
        }
    }
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
        qWarning() << "[ConfigLoader] Not an integer:" << section << key << value;
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

bool ConfigLoader::contains(const QString &section, const QString &key) const
{
    return m_config.contains(section) && m_config[section].contains(key);
}
