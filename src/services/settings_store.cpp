module;
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QStandardPaths>
#include <QString>

module kite.services.settings_store;

import kite.services.interfaces;

JsonSettingsStore::JsonSettingsStore(const QString& filePath)
    : m_filePath(filePath)
    , m_settings(defaults())
{
    load();
}

AppSettings JsonSettingsStore::defaults()
{
    AppSettings s;
    s.downloadPath = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (s.downloadPath.isEmpty()) s.downloadPath = QDir::homePath();
    return s;
}

QString JsonSettingsStore::defaultFilePath()
{
    const QString baseDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (baseDir.isEmpty()) return QString();
    return baseDir + "/settings.json";
}

void JsonSettingsStore::load()
{
    if (m_filePath.isEmpty()) return;
    QFile file(m_filePath);
    if (!file.exists()) return;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Failed to open settings file:" << m_filePath << file.errorString();
        return;
    }
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject()) {
        qWarning() << "Ignoring malformed settings file:" << m_filePath;
        return;
    }
    m_settings = settingsFromJson(doc.object(), m_settings);
}

bool JsonSettingsStore::save() const
{
    if (m_filePath.isEmpty()) return false;
    const QString dirPath = QFileInfo(m_filePath).absolutePath();
    if (!QDir().mkpath(dirPath)) {
        qWarning() << "Failed to create settings directory:" << dirPath;
        return false;
    }
    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Failed to write settings file:" << m_filePath << file.errorString();
        return false;
    }
    file.write(QJsonDocument(settingsToJson(m_settings)).toJson(QJsonDocument::Indented));
    return file.commit();
}
