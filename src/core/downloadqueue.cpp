module;
#include <QDebug>
#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include <optional>

module kite.core.downloadqueue;

import kite.core.downloadtypes;
import kite.utils.download_utils;

namespace utils = kite::utils;

DownloadQueue::DownloadQueue(int concurrency, QObject* parent)
    : QObject(parent)
    , m_concurrency(qMax(1, concurrency))
{
}

SubmitResult DownloadQueue::submit(const DownloadRequest& request, const DownloadRecord& record)
{
    const QString& id = record.id;
    if (m_entries.contains(id) || m_finished.contains(id)) {
        qWarning() << "Download already exists:" << id;
        return SubmitResult::AlreadyExists;
    }

    if (const auto existing = duplicateOf(request)) {
        qWarning() << "Duplicate download ignored:" << id << "matches" << *existing;
        return SubmitResult::Duplicate;
    }

    QueueEntry entry;
    entry.request = request;
    entry.record = record;
    entry.signature = utils::buildDownloadSignature(request);
    m_entries.insert(id, entry);
    m_queued.append(id);

    promote();
    emit queueUpdated();
    return m_active.contains(id) ? SubmitResult::Started : SubmitResult::Queued;
}

std::optional<QString> DownloadQueue::duplicateOf(const DownloadRequest& request) const
{
    const QString signature = utils::buildDownloadSignature(request);
    for (auto it = m_entries.cbegin(); it != m_entries.cend(); ++it) {
        if (it.value().signature == signature) return it.key();
    }
    return std::nullopt;
}

bool DownloadQueue::remove(const QString& id)
{
    if (m_queued.removeOne(id)) {
        m_entries.remove(id);
        emit queueUpdated();
        return true;
    }
    if (m_active.removeOne(id)) {
        m_entries.remove(id);
        promote();
        emit queueUpdated();
        return true;
    }
    return false;
}

void DownloadQueue::completed(const QString& id)
{
    if (m_active.removeOne(id)) {
        m_finished.insert(id, m_entries.take(id));
    }
    promote();
    emit queueUpdated();
}

void DownloadQueue::forget(const QString& id)
{
    m_finished.remove(id);
}

void DownloadQueue::setConcurrency(int concurrency)
{
    const int next = qMax(1, concurrency);
    if (next == m_concurrency) return;
    m_concurrency = next;
    if (promote() > 0) emit queueUpdated();
}

bool DownloadQueue::updateRecord(const QString& id, const RecordPatch& patch)
{
    DownloadRecord* record = findRecord(id);
    if (!record) return false;
    applyPatch(*record, patch);
    emit recordChanged(id, patch);
    return true;
}

bool DownloadQueue::updateDownloadPath(const QString& id, const QString& path)
{
    auto it = m_entries.find(id);
    if (it == m_entries.end()) return false;
    it->request.customDownloadPath = path;
    emit queueUpdated();
    return true;
}

QVector<QueueEntry> DownloadQueue::activeEntries() const
{
    QVector<QueueEntry> out;
    out.reserve(m_active.size());
    for (const QString& id : m_active) out.append(m_entries.value(id));
    return out;
}

QVector<QueueEntry> DownloadQueue::queuedEntries() const
{
    QVector<QueueEntry> out;
    out.reserve(m_queued.size());
    for (const QString& id : m_queued) out.append(m_entries.value(id));
    return out;
}

std::optional<QueueEntry> DownloadQueue::entry(const QString& id) const
{
    auto it = m_entries.constFind(id);
    if (it == m_entries.cend()) return std::nullopt;
    return it.value();
}

std::optional<QueueEntry> DownloadQueue::finishedEntry(const QString& id) const
{
    auto it = m_finished.constFind(id);
    if (it == m_finished.cend()) return std::nullopt;
    return it.value();
}

bool DownloadQueue::contains(const QString& id) const
{
    return m_entries.contains(id);
}

bool DownloadQueue::isActive(const QString& id) const
{
    return m_active.contains(id);
}

bool DownloadQueue::isQueued(const QString& id) const
{
    return m_queued.contains(id);
}

QueueStatus DownloadQueue::status() const
{
    QueueStatus s;
    s.queued = static_cast<int>(m_queued.size());
    s.active = static_cast<int>(m_active.size());
    s.activeIds = m_active;
    return s;
}

int DownloadQueue::promote()
{
    int promoted = 0;
    while (m_active.size() < m_concurrency && !m_queued.isEmpty()) {
        const QString id = m_queued.takeFirst();
        m_active.append(id);
        ++promoted;
        emit startRequested(id);
    }
    return promoted;
}

DownloadRecord* DownloadQueue::findRecord(const QString& id)
{
    auto it = m_entries.find(id);
    if (it != m_entries.end()) return &it->record;
    auto fin = m_finished.find(id);
    if (fin != m_finished.end()) return &fin->record;
    return nullptr;
}
