module;
#include <QDateTime>
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

module kite.core.sessionsnapshotter;

import kite.services.interfaces;
import kite.core.downloadqueue;
import kite.core.historyreconciler;
import kite.utils.coalescing_timer;
import kite.utils.path_utils;

namespace utils = kite::utils;

namespace {
constexpr int kSessionVersion = 1;
constexpr int kPersistDelayMs = 1000;
}

SessionSnapshotter::SessionSnapshotter(DownloadQueue& queue, HistoryReconciler& history,
                                       const QString& filePath, QObject* parent)
    : QObject(parent)
    , m_queue(queue)
    , m_history(history)
    , m_filePath(filePath)
    , m_timer(kPersistDelayMs, [this]() { persist(); })
{
    connect(&m_queue, &DownloadQueue::queueUpdated, this, &SessionSnapshotter::schedule);
    connect(&m_queue, &DownloadQueue::recordChanged, this, [this](const QString&, const RecordPatch&) {
        schedule();
    });
}

SessionSnapshotter::~SessionSnapshotter()
{
    flush();
}

QString SessionSnapshotter::defaultFilePath()
{
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(dir).filePath(QStringLiteral("session.json"));
}

void SessionSnapshotter::schedule()
{
    if (m_filePath.isEmpty()) return;
    m_timer.schedule();
}

void SessionSnapshotter::flush()
{
    if (!m_timer.isPending()) return;
    m_timer.flush();
}

bool SessionSnapshotter::persist()
{
    if (m_filePath.isEmpty()) return true;

    QJsonArray items;
    auto append = [&items](const QVector<QueueEntry>& entries) {
        for (const QueueEntry& entry : entries) {
            QJsonObject item;
            item["id"] = entry.record.id;
            item["request"] = requestToJson(entry.request);
            item["record"] = recordToJson(entry.record);
            items.append(item);
        }
    };
    append(m_queue.activeEntries());
    append(m_queue.queuedEntries());

    if (items.isEmpty()) {
        if (QFile::exists(m_filePath) && !QFile::remove(m_filePath)) {
            qWarning() << "Failed to remove session file" << m_filePath;
            return false;
        }
        return true;
    }

    if (!utils::ensureDirectoryExists(QFileInfo(m_filePath).absolutePath())) return false;

    QJsonObject root;
    root["version"] = kSessionVersion;
    root["updatedAt"] = QDateTime::currentMSecsSinceEpoch();
    root["items"] = items;

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Failed to open session file for writing:" << m_filePath << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "Failed to write session file:" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

QVector<SessionItem> SessionSnapshotter::load() const
{
    QVector<SessionItem> result;
    if (m_filePath.isEmpty() || !QFile::exists(m_filePath)) return result;

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Failed to open session file:" << m_filePath << file.errorString();
        return result;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Ignoring malformed session file:" << m_filePath << parseError.errorString();
        return result;
    }

    const QJsonObject root = doc.object();
    if (root.value("version").toInt() != kSessionVersion || !root.value("items").isArray()) {
        qWarning() << "Ignoring session file with unexpected layout:" << m_filePath;
        return result;
    }

    for (const QJsonValue& value : root.value("items").toArray()) {
        if (!value.isObject()) continue;
        const QJsonObject obj = value.toObject();
        SessionItem item;
        item.id = obj.value("id").toString();
        item.request = requestFromJson(obj.value("request").toObject());
        item.record = recordFromJson(obj.value("record").toObject());
        if (item.id.isEmpty() || item.request.url.isEmpty()) continue;
        item.record.id = item.id;
        if (item.record.url.isEmpty()) item.record.url = item.request.url;
        result.append(item);
    }
    return result;
}

QStringList SessionSnapshotter::restore()
{
    QStringList restored;
    if (m_restored) return restored;
    m_restored = true;

    for (const SessionItem& item : load()) {
        if (m_queue.contains(item.id) || m_queue.finishedEntry(item.id)) continue;

        const auto stored = m_history.storedStatus(item.id);
        if (stored && isTerminalStatus(*stored)) continue;

        DownloadRecord record = item.record;
        record.status = DownloadStatus::Pending;
        record.completedAt = 0;
        record.progress = DownloadProgress();
        record.error.clear();
        record.speed.clear();
        if (record.createdAt <= 0) record.createdAt = QDateTime::currentMSecsSinceEpoch();

        if (record.title.trimmed().isEmpty()) {
            const auto row = m_history.row(item.id);
            record.title = row && !row->record.title.isEmpty()
                               ? row->record.title
                               : QStringLiteral("Download %1").arg(item.id);
        }

        const SubmitResult result = m_queue.submit(item.request, record);
        if (result == SubmitResult::AlreadyExists || result == SubmitResult::Duplicate) {
            qWarning() << "Skipping restored download" << item.id << "(already queued)";
            continue;
        }

        RecordPatch patch;
        patch.status = DownloadStatus::Pending;
        patch.title = record.title;
        patch.completedAt = qint64(0);
        patch.error = QString();
        m_history.upsert(record, patch);
        restored.append(item.id);
    }

    if (!restored.isEmpty()) {
        qInfo() << "Restored" << restored.size() << "download(s) from the previous session";
        schedule();
    }
    return restored;
}
