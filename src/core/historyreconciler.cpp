module;
#include <QDateTime>
#include <QString>

#include <optional>

module kite.core.historyreconciler;

import kite.services.interfaces;

namespace {

/**
 * Patch that rewrites every persisted field of @p record.
 */
RecordPatch fullPatch(const DownloadRecord& record)
{
    RecordPatch patch;
    patch.title = record.title;
    patch.thumbnail = record.thumbnail;
    patch.duration = record.duration;
    patch.uploader = record.uploader;
    patch.description = record.description;
    patch.viewCount = record.viewCount;
    patch.status = record.status;
    patch.startedAt = record.startedAt;
    patch.completedAt = record.completedAt;
    patch.selectedFormat = record.selectedFormat;
    patch.formatExtension = record.formatExtension;
    patch.savedFileName = record.savedFileName;
    patch.fileSize = record.fileSize;
    patch.error = record.error;
    patch.command = record.command;
    return patch;
}

} // namespace

HistoryReconciler::HistoryReconciler(HistoryStore& store)
    : m_store(store)
{
}

void HistoryReconciler::upsert(const DownloadRecord& base, const RecordPatch& patch,
                               const std::optional<QString>& downloadPath)
{
    if (base.id.isEmpty()) return;

    HistoryItem item;
    if (auto existing = m_store.getById(base.id)) {
        item = *existing;
    } else {
        item.record = base;
        item.record.log.clear();
    }
    applyPatch(item.record, patch);
    // Runtime-only fields never reach history.
    item.record.log.clear();
    item.record.progress = DownloadProgress();
    item.record.speed.clear();
    if (downloadPath) item.downloadPath = *downloadPath;
    item.downloadedAt = QDateTime::currentMSecsSinceEpoch();
    m_store.put(item);
}

void HistoryReconciler::writeRecord(const DownloadRecord& record, const std::optional<QString>& downloadPath)
{
    upsert(record, fullPatch(record), downloadPath);
}

bool HistoryReconciler::remove(const QString& id)
{
    return m_store.remove(id);
}

std::optional<DownloadStatus> HistoryReconciler::storedStatus(const QString& id) const
{
    if (auto existing = m_store.getById(id)) return existing->record.status;
    return std::nullopt;
}

std::optional<HistoryItem> HistoryReconciler::row(const QString& id) const
{
    return m_store.getById(id);
}
