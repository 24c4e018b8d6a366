/*!
 * @file        sessionsnapshotter.cppm
 * @brief       Durable snapshot of in-flight queue state.
 * @details     Mirrors the active and queued entries of a DownloadQueue into a
 *              JSON session file with a debounced writer, and resubmits the
 *              snapshot on the next start.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#ifndef Q_MOC_RUN
export module kite.core.sessionsnapshotter;
import kite.services.interfaces;
import kite.core.downloadqueue;
import kite.core.historyreconciler;
import kite.utils.coalescing_timer;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

/**
 * @brief One persisted queue entry.
 */
KITE_MODULE_EXPORT struct SessionItem {
    QString id;                 //!< Entry id.
    DownloadRequest request;    //!< Request as submitted.
    DownloadRecord record;      //!< Record at snapshot time.
};

KITE_MODULE_EXPORT class SessionSnapshotter : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a snapshotter watching @p queue.
     * @param queue Queue to mirror.
     * @param history History used to skip finished entries on restore.
     * @param filePath Session file; empty disables persistence.
     * @param parent Optional parent QObject.
     */
    SessionSnapshotter(DownloadQueue& queue, HistoryReconciler& history,
                       const QString& filePath, QObject* parent = nullptr);
    ~SessionSnapshotter() override;

    /**
     * @brief Writes the current snapshot, or deletes the file when the queue is empty.
     * @return False on I/O failure.
     */
    bool persist();

    /**
     * @brief Reads the session file; bad input yields an empty list.
     */
    QVector<SessionItem> load() const;

    /**
     * @brief Resubmits unfinished entries of the previous session.
     *
     * Runs at most once per instance.
     * @return Ids submitted to the queue.
     */
    QStringList restore();

    /**
     * @brief Writes a pending snapshot now.
     */
    void flush();

    /**
     * @brief Requests a debounced write.
     */
    void schedule();

    QString filePath() const { return m_filePath; }
    bool isRestored() const { return m_restored; }

    static QString defaultFilePath();

private:
    DownloadQueue& m_queue;                     //!< Mirrored queue.
    HistoryReconciler& m_history;               //!< Terminal status lookup.
    QString m_filePath;                         //!< Session file.
    bool m_restored = false;                    //!< restore() already ran.
    kite::utils::CoalescingTimer m_timer;       //!< Debounced writer.
};

#include "sessionsnapshotter.moc"
