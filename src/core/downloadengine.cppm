/*!
 * @file        downloadengine.cppm
 * @brief       Download orchestration engine.
 * @details     Owns the job queue, the running jobs, the metadata prefetch
 *              cache and the session snapshotter. Collaborators (settings,
 *              history, metadata, argument building, process spawning and
 *              transcoding) are injected by reference.
 *
 *              Responsibilities include:
 *              - Admission, deduplication and concurrency of jobs
 *              - Metadata prefetch and format selection
 *              - Process lifecycle, progress and log propagation
 *              - Output resolution, optional watermarking and history writes
 *              - Cancellation and session restore
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>
#include <optional>

#ifndef Q_MOC_RUN
export module kite.core.downloadengine;
import kite.services.interfaces;
import kite.core.downloadqueue;
import kite.core.downloadjob;
import kite.core.historyreconciler;
import kite.core.outputresolver;
import kite.core.sessionsnapshotter;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

/**
 * @brief Playlist download parameters.
 */
KITE_MODULE_EXPORT struct PlaylistRequest {
    QString url;                        //!< Playlist or channel URL.
    MediaKind kind = MediaKind::Video;  //!< Kind applied to every entry.
    QString format;                     //!< Format selector applied to every entry.
    int startIndex = 1;                 //!< First entry (1-based).
    int endIndex = 0;                   //!< Last entry (1-based, 0 = last).
    QString customDownloadPath;         //!< Destination override.
    QStringList tags;                   //!< Labels copied to every entry.
};

/**
 * @brief One submitted playlist entry.
 */
KITE_MODULE_EXPORT struct PlaylistSubmissionEntry {
    QString downloadId;     //!< Engine id of the job.
    QString entryId;        //!< Provider id of the entry.
    QString title;          //!< Entry title.
    QString url;            //!< Entry URL.
    int index = 0;          //!< 1-based playlist position.
};

/**
 * @brief Result of DownloadEngine::startPlaylistDownload().
 */
KITE_MODULE_EXPORT struct PlaylistSubmission {
    bool ok = false;                            //!< Listing succeeded.
    QString error;                              //!< Listing failure message.
    QString groupId;                            //!< Group id shared by the entries.
    QString playlistId;                         //!< Provider playlist id.
    QString playlistTitle;                      //!< Playlist title.
    MediaKind kind = MediaKind::Video;          //!< Kind of every entry.
    int totalCount = 0;                         //!< Submitted entries.
    int startIndex = 0;                         //!< First submitted position.
    int endIndex = 0;                           //!< Last submitted position.
    QVector<PlaylistSubmissionEntry> entries;   //!< Submitted entries.
};

/**
 * @brief Central coordinator for download jobs.
 *
 * All methods must be called from the thread that owns the engine.
 */
KITE_MODULE_EXPORT class DownloadEngine : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct the engine.
     * @param settings Settings source, read on every job start.
     * @param history Durable history.
     * @param info Metadata provider.
     * @param args Fetcher argument builder.
     * @param runner Fetcher process factory.
     * @param transcoder Transcoder used for executable lookup and watermarking.
     * @param sessionPath Session snapshot file; empty disables persistence.
     * @param parent Optional parent QObject.
     */
    DownloadEngine(SettingsProvider& settings, HistoryStore& history, InfoProvider& info,
                   ArgumentBuilder& args, ProcessRunner& runner, Transcoder& transcoder,
                   const QString& sessionPath = QString(), QObject* parent = nullptr);
    ~DownloadEngine() override;

    /**
     * @brief Submits a job.
     * @param id Caller supplied id.
     * @param request Job request.
     * @return Admission result; AlreadyExists and Duplicate leave no trace.
     */
    SubmitResult startDownload(const QString& id, const DownloadRequest& request);

    /**
     * @brief Lists a playlist and submits one job per selected entry.
     * @param request Playlist parameters.
     * @param callback Invoked once with the submission summary.
     */
    void startPlaylistDownload(const PlaylistRequest& request,
                               std::function<void(const PlaylistSubmission&)> callback);

    /**
     * @brief Cancels a queued, running or transcoding job.
     * @return False for unknown and already finished ids, whose history is kept.
     */
    bool cancelDownload(const QString& id);

    /**
     * @brief Drops a finished job kept for reconciliation so its id can be reused.
     */
    void forgetDownload(const QString& id);

    /**
     * @brief Changes the number of concurrent processes.
     */
    void updateMaxConcurrent(int maxConcurrent);

    QueueStatus queueStatus() const;

    /**
     * @brief Active and queued records, newest first.
     */
    QVector<DownloadRecord> activeDownloads() const;

    /**
     * @brief Record of a queued, active or finished job.
     */
    std::optional<DownloadRecord> record(const QString& id) const;

    /**
     * @brief Resubmits the previous session and prefetches its metadata.
     * @return Restored ids.
     */
    QStringList restoreSession();

    /**
     * @brief Writes the session snapshot now.
     */
    void flushSession();

    /**
     * @brief Flushes timers and terminates running processes.
     */
    void shutdown();

    /**
     * @brief Number of jobs with a live process object.
     */
    int runningJobCount() const { return m_jobs.size(); }

    const DownloadQueue& queue() const { return m_queue; }

signals:
    //!< @brief A job was admitted.
    void downloadQueued(const QString& id, const DownloadRecord& record);

    //!< @brief The fetcher process of a job started.
    void downloadStarted(const QString& id);

    //!< @brief Fields of a job record changed.
    void downloadUpdated(const QString& id, const RecordPatch& patch);

    //!< @brief A job reported progress.
    void downloadProgress(const QString& id, const DownloadProgress& progress);

    //!< @brief A job finished and its artifact was recorded.
    void downloadCompleted(const QString& id, const DownloadRecord& record);

    //!< @brief A job failed.
    void downloadError(const QString& id, const QString& message);

    //!< @brief A job was cancelled.
    void downloadCancelled(const QString& id);

private:
    using MetadataWaiter = std::function<void(const std::optional<MediaInfo>&)>;

    SubmitResult submit(const QString& id, const DownloadRequest& request, const QString& title,
                        bool prefetch);
    void prefetch(const QString& id, const QString& url);
    void clearPrefetch(const QString& id);
    void obtainMetadata(const QString& id, const QString& url, MetadataWaiter waiter);
    void applyMetadata(const QString& id, const MediaInfo& info);

    void onStartRequested(const QString& id);
    void launch(const QString& id, const std::optional<MediaInfo>& info);
    void attachJob(DownloadJob* job);
    void onJobSucceeded(DownloadJob* job, const ResolvedOutput& output);
    void completeDownload(const QString& id, const QString& filePath, qint64 fileSize);
    void failDownload(const QString& id, const QString& message);
    void releaseJob(DownloadJob* job);

    void updateRecord(const QString& id, const RecordPatch& patch,
                      const std::optional<QString>& downloadPath = std::nullopt);
    std::optional<DownloadRecord> currentRecord(const QString& id) const;

    SettingsProvider& m_settings;               //!< Settings source.
    InfoProvider& m_info;                       //!< Metadata provider.
    ArgumentBuilder& m_args;                    //!< Argument builder.
    ProcessRunner& m_runner;                    //!< Process factory.
    Transcoder& m_transcoder;                   //!< Transcoder.

    DownloadQueue m_queue;                      //!< Admission and concurrency.
    HistoryReconciler m_history;                //!< History writes.
    QHash<QString, DownloadJob*> m_jobs;        //!< Running jobs by id.
    QSet<QString> m_processing;                 //!< Ids with a watermark transform in flight.

    QHash<QString, MediaInfo> m_prefetched;             //!< Settled prefetch results.
    QHash<QString, quint64> m_prefetchTokens;           //!< In-flight prefetch generation.
    QHash<QString, QVector<MetadataWaiter>> m_waiters;  //!< Starts waiting on a prefetch.
    quint64 m_prefetchGeneration = 0;                   //!< Token source.

    SessionSnapshotter m_session;               //!< Declared after the queue it mirrors.
};

#include "downloadengine.moc"
