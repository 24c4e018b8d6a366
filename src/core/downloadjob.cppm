/*!
 * @file        downloadjob.cppm
 * @brief       Runtime state of one running download.
 * @details     DownloadJob owns the fetcher process of a single active queue
 *              entry and turns its output into record updates:
 *
 *              - raw output is appended to a log buffer that is flushed to the
 *                record by a 500 ms coalescing timer, only when it changed;
 *              - progress lines are blended across parts;
 *              - tagged lines switch the status to processing, refine the
 *                selected format and feed the output resolver;
 *              - the exit handler resolves the artifact or reports the failure.
 *
 *              Cancellation is a job state: once cancel() is called the job
 *              stops reporting and its exit handler only emits cancelled().
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QVector>

#ifndef Q_MOC_RUN
export module kite.core.downloadjob;
import kite.services.interfaces;
import kite.core.outputresolver;
import kite.utils.progress_utils;
import kite.utils.coalescing_timer;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT class DownloadJob : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Lifecycle of the job's process.
     */
    enum class State {
        Idle,           //!< Created, process not started.
        Running,        //!< Process running.
        Cancelling,     //!< Cancel requested, waiting for the exit handler.
        Finished        //!< Exit handler ran.
    };

    /**
     * @brief Construct a job.
     * @param id Queue entry id.
     * @param request Job request with its final destination.
     * @param downloadDir Directory the fetcher writes into.
     * @param parent Optional parent QObject.
     */
    DownloadJob(const QString& id, const DownloadRequest& request, const QString& downloadDir, QObject* parent = nullptr);
    ~DownloadJob() override;

    /**
     * @brief Supplies metadata used for format refinement and artifact matching.
     */
    void setMediaInfo(const MediaInfo& info);

    /**
     * @brief Sets the expected number of progress parts.
     */
    void setTotalParts(int parts);

    /**
     * @brief Extension of the selected format, if known.
     */
    void setActualExtension(const QString& ext);

    /**
     * @brief Spawns and starts the fetcher.
     * @param runner Process factory.
     * @param program Fetcher executable.
     * @param args Complete argument vector.
     */
    void start(ProcessRunner& runner, const QString& program, const QStringList& args);

    /**
     * @brief Marks the job cancelling and terminates the process.
     */
    void cancel();

    /**
     * @brief Pushes pending log text to the record now.
     */
    void flushLog();

    QString id() const { return m_id; }
    State state() const { return m_state; }
    bool isCancelling() const { return m_state == State::Cancelling; }
    QString log() const { return m_log; }
    int totalParts() const { return m_blender.totalParts(); }
    bool willMerge() const { return m_willMerge; }
    const OutputResolver& resolver() const { return m_resolver; }

signals:
    /**
     * @brief The process was started.
     */
    void started(const QString& id);

    /**
     * @brief Fields of the record changed (progress, speed, status, format or log).
     */
    void recordUpdated(const QString& id, const RecordPatch& patch);

    /**
     * @brief Exit code 0; @p output holds the resolved artifact.
     */
    void succeeded(const QString& id, const ResolvedOutput& output);

    /**
     * @brief Nonzero exit or spawn failure.
     */
    void failed(const QString& id, const QString& message);

    /**
     * @brief The process ended after cancel().
     */
    void cancelled(const QString& id);

private:
    void onOutput(const QString& text);
    void onProgress(const ProgressEvent& event);
    void onEvent(const QString& type, const QString& text);
    void onExited(int exitCode);
    void onFailed(const QString& message);
    void applySelectedFormat(const QString& rawFormatId);
    bool finish();

    QString m_id;                               //!< Queue entry id.
    DownloadRequest m_request;                  //!< Job request.
    QString m_title;                            //!< Metadata title.
    QVector<MediaFormat> m_formats;             //!< Advertised formats.
    QString m_actualExt;                        //!< Selected format extension.
    QString m_selectedFormatId;                 //!< Selected format id.
    bool m_processing = false;                  //!< Processing status reported.
    bool m_willMerge = false;                   //!< Format selector merges streams.
    State m_state = State::Idle;                //!< Process lifecycle.
    kite::utils::ProgressBlender m_blender;     //!< Part blending.
    OutputResolver m_resolver;                  //!< Artifact candidates.
    QString m_log;                              //!< Normalized output.
    QString m_flushedLog;                       //!< Last text pushed to the record.
    QPointer<DownloadProcess> m_process;        //!< Running fetcher.
    kite::utils::CoalescingTimer m_logTimer;    //!< Debounced log flush.
};

#include "downloadjob.moc"
