module;
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QObject>
#include <QPointer>
#include <QRandomGenerator>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>

#include <algorithm>
#include <functional>
#include <optional>
#include <utility>

module kite.core.downloadengine;

import kite.services.interfaces;
import kite.core.downloadqueue;
import kite.core.downloadjob;
import kite.core.historyreconciler;
import kite.core.outputresolver;
import kite.core.sessionsnapshotter;
import kite.utils.download_utils;
import kite.utils.format_utils;
import kite.utils.path_utils;
import kite.utils.progress_utils;

namespace utils = kite::utils;

namespace {

qint64 nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

QString randomToken(int length)
{
    static const QString alphabet = QStringLiteral("0123456789abcdefghijklmnopqrstuvwxyz");
    QString token;
    token.reserve(length);
    for (int i = 0; i < length; ++i) {
        token.append(alphabet.at(QRandomGenerator::global()->bounded(alphabet.size())));
    }
    return token;
}

QString targetDirectory(const DownloadRequest& request, const AppSettings& settings)
{
    const QString custom = request.customDownloadPath.trimmed();
    return custom.isEmpty() ? settings.downloadPath : utils::resolvePathWithHome(custom);
}

QString filenameTemplate(const DownloadRequest& request)
{
    const QString custom = request.customFilenameTemplate.trimmed();
    return custom.isEmpty() ? utils::defaultFilenameTemplate() : custom;
}

} // namespace

DownloadEngine::DownloadEngine(SettingsProvider& settings, HistoryStore& history, InfoProvider& info,
                               ArgumentBuilder& args, ProcessRunner& runner, Transcoder& transcoder,
                               const QString& sessionPath, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_info(info)
    , m_args(args)
    , m_runner(runner)
    , m_transcoder(transcoder)
    , m_queue(settings.settings().maxConcurrentDownloads)
    , m_history(history)
    , m_session(m_queue, m_history, sessionPath)
{
    connect(&m_queue, &DownloadQueue::startRequested, this, &DownloadEngine::onStartRequested,
            Qt::QueuedConnection);
}

DownloadEngine::~DownloadEngine()
{
    shutdown();
}

SubmitResult DownloadEngine::startDownload(const QString& id, const DownloadRequest& request)
{
    return submit(id, request, QStringLiteral("Downloading..."), true);
}

SubmitResult DownloadEngine::submit(const QString& id, const DownloadRequest& request, const QString& title,
                                    bool prefetch)
{
    if (m_queue.contains(id) || m_queue.finishedEntry(id)) {
        qWarning() << "Download" << id << "already exists, ignoring";
        return SubmitResult::AlreadyExists;
    }
    if (const auto existing = m_queue.duplicateOf(request)) {
        qWarning() << "Download" << id << "duplicates" << *existing;
        return SubmitResult::Duplicate;
    }

    const AppSettings settings = m_settings.settings();
    const QString downloadPath = targetDirectory(request, settings);
    const QString historyPath = utils::resolveHistoryDownloadPath(downloadPath, filenameTemplate(request));

    DownloadRecord record;
    record.id = id;
    record.url = request.url;
    record.kind = request.kind;
    record.title = title;
    record.status = DownloadStatus::Pending;
    record.createdAt = nowMs();
    record.tags = request.tags;
    record.origin = request.origin;
    record.subscriptionId = request.subscriptionId;
    record.playlistId = request.playlistId;
    record.playlistTitle = request.playlistTitle;
    record.playlistIndex = request.playlistIndex;
    record.playlistSize = request.playlistSize;

    utils::ensureDirectoryExists(downloadPath);
    if (historyPath != downloadPath) utils::ensureDirectoryExists(historyPath);

    const SubmitResult result = m_queue.submit(request, record);
    if (result == SubmitResult::AlreadyExists || result == SubmitResult::Duplicate) return result;

    RecordPatch patch;
    patch.status = DownloadStatus::Pending;
    m_history.upsert(record, patch, historyPath);

    qInfo().noquote() << "[" + id + "] queued" << request.url;
    emit downloadQueued(id, record);

    if (prefetch) this->prefetch(id, request.url);
    return result;
}

void DownloadEngine::startPlaylistDownload(const PlaylistRequest& request,
                                           std::function<void(const PlaylistSubmission&)> callback)
{
    const AppSettings settings = m_settings.settings();
    QPointer<DownloadEngine> self(this);
    m_info.fetchPlaylist(request.url, settings, [self, request, callback](const PlaylistResult& result) {
        if (!self) return;

        PlaylistSubmission submission;
        submission.kind = request.kind;
        submission.groupId = QStringLiteral("playlist_group_%1_%2").arg(nowMs()).arg(randomToken(6));

        if (!result.ok) {
            qWarning() << "Failed to fetch playlist" << request.url << result.error;
            submission.error = result.error;
            if (callback) callback(submission);
            return;
        }

        submission.ok = true;
        submission.playlistId = result.info.id;
        submission.playlistTitle = result.info.title;

        const QVector<PlaylistEntry>& entries = result.info.entries;
        if (entries.isEmpty()) {
            qWarning() << "Playlist has no entries:" << request.url;
            if (callback) callback(submission);
            return;
        }

        const int total = entries.size();
        const int requestedStart = qMax(request.startIndex - 1, 0);
        const int requestedEnd = request.endIndex > 0 ? qMin(request.endIndex - 1, total - 1) : total - 1;
        const int rangeStart = qMin(requestedStart, requestedEnd);
        const int rangeEnd = qMin(qMax(requestedStart, requestedEnd), total - 1);

        const QString custom = request.customDownloadPath.trimmed();
        const QString downloadPath = custom.isEmpty()
            ? utils::resolveAutoPlaylistDownloadPath(settings.downloadPath, result.info.title, request.url)
            : utils::resolvePathWithHome(custom);
        utils::ensureDirectoryExists(downloadPath);

        QVector<PlaylistEntry> selected;
        for (int i = rangeStart; i <= rangeEnd; ++i) {
            if (entries.at(i).url.trimmed().isEmpty()) {
                qWarning() << "Skipping playlist entry with missing URL:" << entries.at(i).id;
                continue;
            }
            selected.append(entries.at(i));
        }

        QSet<QString> titleKeys;
        bool duplicateTitles = false;
        int maxIndex = 0;
        for (const PlaylistEntry& entry : selected) {
            const QString key = utils::sanitizeTemplateValue(entry.title).toLower();
            if (titleKeys.contains(key)) duplicateTitles = true;
            titleKeys.insert(key);
            maxIndex = qMax(maxIndex, entry.index);
        }
        const int indexWidth = QString::number(maxIndex).size();

        qInfo().noquote() << "Starting playlist download:" << selected.size()
                          << "items from" << result.info.title;

        for (const PlaylistEntry& entry : selected) {
            DownloadRequest job;
            job.url = entry.url;
            job.kind = request.kind;
            job.format = request.format;
            if (request.kind == MediaKind::Audio) job.audioFormat = request.format;
            job.customDownloadPath = downloadPath;
            if (duplicateTitles) {
                job.customFilenameTemplate = QStringLiteral("%1 - %(title)s via Kite.%(ext)s")
                                                 .arg(entry.index, indexWidth, 10, QLatin1Char('0'));
            }
            job.tags = request.tags;
            job.playlistId = submission.groupId;
            job.playlistTitle = result.info.title;
            job.playlistIndex = entry.index;
            job.playlistSize = selected.size();

            const QString downloadId = submission.groupId + QLatin1Char('_') + randomToken(8);
            const SubmitResult admitted = self->submit(downloadId, job, entry.title, false);
            if (admitted == SubmitResult::AlreadyExists || admitted == SubmitResult::Duplicate) continue;

            PlaylistSubmissionEntry submitted;
            submitted.downloadId = downloadId;
            submitted.entryId = entry.id;
            submitted.title = entry.title;
            submitted.url = entry.url;
            submitted.index = entry.index;
            submission.entries.append(submitted);
        }

        submission.totalCount = submission.entries.size();
        submission.startIndex = selected.isEmpty() ? rangeStart + 1 : selected.first().index;
        submission.endIndex = selected.isEmpty() ? rangeEnd + 1 : selected.last().index;
        if (callback) callback(submission);
    });
}

bool DownloadEngine::cancelDownload(const QString& id)
{
    DownloadJob* job = m_jobs.take(id);
    const bool transforming = m_processing.remove(id);
    if (job || transforming) {
        RecordPatch patch;
        patch.status = DownloadStatus::Cancelling;
        if (m_queue.updateRecord(id, patch)) emit downloadUpdated(id, patch);
    }

    const bool removed = m_queue.remove(id);
    // Completed and failed jobs keep their history row.
    if (!removed && !job && !transforming) return false;

    m_queue.forget(id);
    m_history.remove(id);
    clearPrefetch(id);

    // May finish synchronously when the process never started.
    if (job) job->cancel();
    qInfo().noquote() << "[" + id + "] cancelled";
    emit downloadCancelled(id);
    return true;
}

void DownloadEngine::forgetDownload(const QString& id)
{
    m_queue.forget(id);
}

void DownloadEngine::updateMaxConcurrent(int maxConcurrent)
{
    m_queue.setConcurrency(maxConcurrent);
}

QueueStatus DownloadEngine::queueStatus() const
{
    return m_queue.status();
}

QVector<DownloadRecord> DownloadEngine::activeDownloads() const
{
    QVector<DownloadRecord> records;
    for (const QueueEntry& entry : m_queue.activeEntries()) records.append(entry.record);
    for (const QueueEntry& entry : m_queue.queuedEntries()) records.append(entry.record);
    std::stable_sort(records.begin(), records.end(), [](const DownloadRecord& a, const DownloadRecord& b) {
        return a.createdAt > b.createdAt;
    });
    return records;
}

std::optional<DownloadRecord> DownloadEngine::record(const QString& id) const
{
    return currentRecord(id);
}

QStringList DownloadEngine::restoreSession()
{
    const QStringList restored = m_session.restore();
    for (const QString& id : restored) {
        if (const auto entry = m_queue.entry(id)) prefetch(id, entry->request.url);
    }
    return restored;
}

void DownloadEngine::flushSession()
{
    m_session.flush();
}

void DownloadEngine::shutdown()
{
    for (DownloadJob* job : std::as_const(m_jobs)) job->flushLog();
    m_session.flush();

    const auto jobs = m_jobs.values();
    for (DownloadJob* job : jobs) {
        if (job->state() == DownloadJob::State::Running) {
            qInfo().noquote() << "[" + job->id() + "] terminating on shutdown";
            job->disconnect(this);
            job->cancel();
        }
    }
}

void DownloadEngine::prefetch(const QString& id, const QString& url)
{
    if (m_prefetchTokens.contains(id) || m_prefetched.contains(id)) return;

    const quint64 token = ++m_prefetchGeneration;
    m_prefetchTokens.insert(id, token);

    QPointer<DownloadEngine> self(this);
    m_info.fetchMetadata(url, m_settings.settings(), [self, id, token](const MetadataResult& result) {
        if (!self) return;
        // Superseded or cleared by cancellation.
        if (self->m_prefetchTokens.value(id) != token) return;
        self->m_prefetchTokens.remove(id);

        std::optional<MediaInfo> info;
        if (result.ok) {
            info = result.info;
            self->m_prefetched.insert(id, result.info);
            self->applyMetadata(id, result.info);
        } else {
            qWarning().noquote() << "[" + id + "] metadata prefetch failed:" << result.error;
        }

        const auto waiters = self->m_waiters.take(id);
        for (const MetadataWaiter& waiter : waiters) waiter(info);
    });
}

void DownloadEngine::clearPrefetch(const QString& id)
{
    m_prefetched.remove(id);
    m_prefetchTokens.remove(id);
    m_waiters.remove(id);
}

void DownloadEngine::obtainMetadata(const QString& id, const QString& url, MetadataWaiter waiter)
{
    if (m_prefetched.contains(id)) {
        waiter(m_prefetched.take(id));
        return;
    }
    m_waiters[id].append(std::move(waiter));
    if (!m_prefetchTokens.contains(id)) prefetch(id, url);
}

void DownloadEngine::applyMetadata(const QString& id, const MediaInfo& info)
{
    RecordPatch patch;
    if (!info.title.isEmpty()) patch.title = info.title;
    if (!info.thumbnail.isEmpty()) patch.thumbnail = info.thumbnail;
    if (info.duration > 0) patch.duration = info.duration;
    if (!info.uploader.isEmpty()) patch.uploader = info.uploader;
    if (!info.description.isEmpty()) patch.description = info.description;
    if (info.viewCount > 0) patch.viewCount = info.viewCount;
    if (!patch.isEmpty()) updateRecord(id, patch);
}

void DownloadEngine::onStartRequested(const QString& id)
{
    if (!m_queue.isActive(id) || m_jobs.contains(id)) return;
    const auto entry = m_queue.entry(id);
    if (!entry) return;

    QPointer<DownloadEngine> self(this);
    obtainMetadata(id, entry->request.url, [self, id](const std::optional<MediaInfo>& info) {
        if (self) self->launch(id, info);
    });
}

void DownloadEngine::launch(const QString& id, const std::optional<MediaInfo>& info)
{
    // Cancelled or already started while metadata was in flight.
    if (!m_queue.isActive(id) || m_jobs.contains(id)) return;
    m_prefetched.remove(id);

    const AppSettings settings = m_settings.settings();
    const MediaInfo* infoPtr = info ? &*info : nullptr;

    if (info) applyMetadata(id, *info);

    auto entry = m_queue.entry(id);
    if (!entry) return;

    int totalParts = utils::estimateProgressParts(entry->request);
    QString actualExt;
    if (info) {
        if (const auto selected = utils::resolveSelectedFormat(info->formats, entry->request, settings.qualityPreset)) {
            RecordPatch patch;
            patch.selectedFormat = selected->formatId;
            patch.formatExtension = selected->ext;
            updateRecord(id, patch);
            actualExt = selected->ext;
            if (entry->request.kind == MediaKind::Video && entry->request.audioFormatIds.isEmpty()
                && utils::isMuxedFormat(*selected)) {
                totalParts = 1;
            }
        }
    }

    if (entry->request.customDownloadPath.trimmed().isEmpty()) {
        m_queue.updateDownloadPath(id, utils::resolveAutoVideoDownloadPath(settings.downloadPath, infoPtr));
        entry = m_queue.entry(id);
        if (!entry) return;
    }

    const DownloadRequest& request = entry->request;
    const QString downloadPath = targetDirectory(request, settings);
    utils::ensureDirectoryExists(downloadPath);
    const QString historyPath = utils::resolveHistoryDownloadPath(downloadPath, filenameTemplate(request), infoPtr);
    if (historyPath != downloadPath) utils::ensureDirectoryExists(historyPath);
    m_history.upsert(entry->record, RecordPatch(), historyPath);

    QStringList args = m_args.buildArgs(request, downloadPath, settings);
    if (args.isEmpty() || args.last() != request.url) {
        failDownload(id, QStringLiteral("Download arguments missing URL."));
        return;
    }
    const QString url = args.takeLast();

    QString transcoderError;
    const QString transcoder = m_transcoder.locateExecutable(settings, &transcoderError);
    if (transcoder.isEmpty()) {
        failDownload(id, transcoderError.isEmpty() ? QStringLiteral("ffmpeg not found.") : transcoderError);
        return;
    }
    args << QStringLiteral("--ffmpeg-location") << QFileInfo(transcoder).absolutePath() << url;

    const QString program = m_runner.program(settings);
    RecordPatch commandPatch;
    commandPatch.command = utils::formatCommandLine(program, args);
    updateRecord(id, commandPatch);

    auto* job = new DownloadJob(id, request, downloadPath, this);
    if (info) job->setMediaInfo(*info);
    job->setTotalParts(totalParts);
    job->setActualExtension(actualExt);
    attachJob(job);
    m_jobs.insert(id, job);
    job->start(m_runner, program, args);
}

void DownloadEngine::attachJob(DownloadJob* job)
{
    connect(job, &DownloadJob::started, this, [this, job](const QString& id) {
        if (m_jobs.value(id) != job) return;
        RecordPatch patch;
        patch.status = DownloadStatus::Downloading;
        patch.startedAt = nowMs();
        updateRecord(id, patch);
        emit downloadStarted(id);
    });
    connect(job, &DownloadJob::recordUpdated, this, [this, job](const QString& id, const RecordPatch& patch) {
        if (m_jobs.value(id) != job) return;
        updateRecord(id, patch);
    });
    connect(job, &DownloadJob::succeeded, this, [this, job](const QString&, const ResolvedOutput& output) {
        onJobSucceeded(job, output);
    });
    connect(job, &DownloadJob::failed, this, [this, job](const QString& id, const QString& message) {
        const bool current = m_jobs.value(id) == job;
        releaseJob(job);
        if (current) failDownload(id, message);
    });
    connect(job, &DownloadJob::cancelled, this, [this, job](const QString&) {
        releaseJob(job);
    });
}

void DownloadEngine::releaseJob(DownloadJob* job)
{
    if (m_jobs.value(job->id()) == job) m_jobs.remove(job->id());
    job->deleteLater();
}

void DownloadEngine::onJobSucceeded(DownloadJob* job, const ResolvedOutput& output)
{
    const QString id = job->id();
    const bool current = m_jobs.value(id) == job;
    releaseJob(job);
    if (!current) return;

    m_queue.completed(id);

    const AppSettings settings = m_settings.settings();
    const auto finished = m_queue.finishedEntry(id);
    const bool watermark = settings.shareWatermark && finished
        && finished->request.kind == MediaKind::Video
        && !output.path.isEmpty() && utils::fileExistsPath(output.path);
    if (!watermark) {
        completeDownload(id, output.path, output.size);
        return;
    }

    QString error;
    const QString executable = m_transcoder.locateExecutable(settings, &error);
    if (executable.isEmpty()) {
        qWarning().noquote() << "[" + id + "] watermark skipped:" << error;
        completeDownload(id, output.path, output.size);
        return;
    }

    RecordPatch processing;
    processing.status = DownloadStatus::Processing;
    updateRecord(id, processing);

    TranscodeRequest request;
    request.inputPath = output.path;
    request.executable = executable;
    request.title = finished->record.title;
    request.author = finished->record.uploader;

    m_processing.insert(id);
    QPointer<DownloadEngine> self(this);
    m_transcoder.transform(request, [self, id, output](const TranscodeResult& result) {
        // Cancelled while transcoding.
        if (!self || !self->m_processing.remove(id)) return;
        if (result.ok && !result.outputPath.isEmpty()) {
            self->completeDownload(id, result.outputPath, result.fileSize);
            return;
        }
        qWarning().noquote() << "[" + id + "] watermark failed, keeping original file:" << result.error;
        self->completeDownload(id, output.path, output.size);
    });
}

void DownloadEngine::completeDownload(const QString& id, const QString& filePath, qint64 fileSize)
{
    const auto finished = m_queue.finishedEntry(id);
    if (!finished) return;

    qint64 size = fileSize;
    if (size < 0 && !filePath.isEmpty()) {
        const QFileInfo info(filePath);
        if (info.isFile()) size = info.size();
    }

    RecordPatch patch;
    patch.status = DownloadStatus::Completed;
    patch.completedAt = nowMs();
    if (size >= 0) patch.fileSize = size;
    if (!filePath.isEmpty()) patch.savedFileName = QFileInfo(filePath).fileName();
    updateRecord(id, patch);

    const auto updated = m_queue.finishedEntry(id);
    if (!updated) return;
    m_history.writeRecord(updated->record);
    qInfo().noquote() << "[" + id + "] completed:" << filePath;
    emit downloadCompleted(id, updated->record);
}

void DownloadEngine::failDownload(const QString& id, const QString& message)
{
    RecordPatch patch;
    patch.status = DownloadStatus::Error;
    patch.error = message;
    patch.completedAt = nowMs();
    updateRecord(id, patch);

    m_queue.completed(id);
    if (const auto finished = m_queue.finishedEntry(id)) m_history.writeRecord(finished->record);
    qWarning().noquote() << "[" + id + "] download failed:" << message;
    emit downloadError(id, message);
}

void DownloadEngine::updateRecord(const QString& id, const RecordPatch& patch,
                                  const std::optional<QString>& downloadPath)
{
    if (!m_queue.updateRecord(id, patch)) return;

    if (patch.touchesHistory() || downloadPath) {
        if (const auto current = currentRecord(id)) m_history.upsert(*current, patch, downloadPath);
    }

    emit downloadUpdated(id, patch);
    if (patch.progress) emit downloadProgress(id, *patch.progress);
}

std::optional<DownloadRecord> DownloadEngine::currentRecord(const QString& id) const
{
    if (const auto entry = m_queue.entry(id)) return entry->record;
    if (const auto finished = m_queue.finishedEntry(id)) return finished->record;
    return std::nullopt;
}
