module;
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QStandardPaths>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

module kite.services.json_history_store;

import kite.services.interfaces;

namespace {
constexpr int kHistoryVersion = 1;
}

JsonHistoryStore::JsonHistoryStore(const QString& filePath)
    : m_filePath(filePath)
{
    load();
}

QString JsonHistoryStore::defaultFilePath()
{
    const QString baseDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (baseDir.isEmpty()) return QString();
    return baseDir + "/history.json";
}

std::optional<HistoryItem> JsonHistoryStore::getById(const QString& id) const
{
    auto it = m_items.constFind(id);
    if (it == m_items.cend()) return std::nullopt;
    return it.value();
}

void JsonHistoryStore::put(const HistoryItem& item)
{
    const QString& id = item.record.id;
    if (id.isEmpty()) return;
    if (!m_items.contains(id)) m_order.append(id);
    m_items.insert(id, item);
    save();
}

bool JsonHistoryStore::remove(const QString& id)
{
    if (!m_items.remove(id)) return false;
    m_order.removeOne(id);
    save();
    return true;
}

int JsonHistoryStore::removeMany(const QStringList& ids)
{
    int removed = 0;
    for (const QString& id : ids) {
        if (!m_items.remove(id)) continue;
        m_order.removeOne(id);
        ++removed;
    }
    if (removed > 0) save();
    return removed;
}

QVector<HistoryItem> JsonHistoryStore::items() const
{
    QVector<HistoryItem> out;
    out.reserve(m_order.size());
    for (const QString& id : m_order) out.append(m_items.value(id));
    return out;
}

void JsonHistoryStore::load()
{
    if (m_filePath.isEmpty()) return;
    QFile file(m_filePath);
    if (!file.exists()) return;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Failed to open history file:" << m_filePath << file.errorString();
        return;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject()) {
        qWarning() << "Ignoring malformed history file:" << m_filePath;
        return;
    }
    const QJsonObject root = doc.object();
    if (root.value("version").toInt() != kHistoryVersion) {
        qWarning() << "Ignoring history file with unsupported version:" << m_filePath;
        return;
    }

    const QJsonArray items = root.value("items").toArray();
    for (const QJsonValue& v : items) {
        if (!v.isObject()) continue;
        const HistoryItem item = historyFromJson(v.toObject());
        if (item.record.id.isEmpty()) continue;
        if (!m_items.contains(item.record.id)) m_order.append(item.record.id);
        m_items.insert(item.record.id, item);
    }
}

bool JsonHistoryStore::save() const
{
    if (m_filePath.isEmpty()) return true;
    const QString dirPath = QFileInfo(m_filePath).absolutePath();
    if (!QDir().mkpath(dirPath)) {
        qWarning() << "Failed to create history directory:" << dirPath;
        return false;
    }

    QJsonArray items;
    for (const QString& id : m_order) items.append(historyToJson(m_items.value(id)));
    QJsonObject root;
    root.insert("version", kHistoryVersion);
    root.insert("items", items);

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Failed to write history file:" << m_filePath << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        qWarning() << "Failed to commit history file:" << m_filePath;
        return false;
    }
    return true;
}
