/*!
 * @file        downloadqueue.cppm
 * @brief       Bounded-concurrency FIFO queue of download jobs.
 * @details     Owns every submitted request/record pair until it finishes or
 *              is removed. Entries are either queued or active; at most
 *              concurrency() entries are active at any time and queued entries
 *              are promoted in strict submission order whenever a slot frees.
 *
 *              The queue has no knowledge of processes. It announces promotion
 *              through startRequested() and expects completed() once the job's
 *              process has exited.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#ifndef Q_MOC_RUN
export module kite.core.downloadqueue;
import kite.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

/**
 * @brief Outcome of DownloadQueue::submit().
 */
KITE_MODULE_EXPORT enum class SubmitResult {
    Queued,         //!< Admitted, waiting for a free slot.
    Started,        //!< Admitted and promoted immediately.
    AlreadyExists,  //!< Id is queued, active or retained as finished.
    Duplicate       //!< Same signature as a queued or active entry.
};

/**
 * @brief Request/record pair tracked by the queue.
 */
KITE_MODULE_EXPORT struct QueueEntry {
    DownloadRequest request;    //!< Immutable input (destination may be filled in once).
    DownloadRecord record;      //!< Observable state.
    QString signature;          //!< Deduplication fingerprint.
};

/**
 * @brief Snapshot of queue occupancy.
 */
KITE_MODULE_EXPORT struct QueueStatus {
    int queued = 0;             //!< Entries waiting for a slot.
    int active = 0;             //!< Entries holding a slot.
    QStringList activeIds;      //!< Active ids in promotion order.
};

/**
 * @brief FIFO scheduler with a bounded active set.
 */
KITE_MODULE_EXPORT class DownloadQueue : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a queue.
     * @param concurrency Maximum active entries (clamped to at least 1).
     * @param parent Optional parent QObject.
     */
    explicit DownloadQueue(int concurrency = 5, QObject* parent = nullptr);

    /**
     * @brief Admits a new entry.
     *
     * The record id identifies the entry. On admission the entry is either
     * queued or, when a slot is free, promoted and startRequested() emitted.
     *
     * @param request Job request.
     * @param record Initial record; record.id must be set.
     * @return Admission outcome.
     */
    SubmitResult submit(const DownloadRequest& request, const DownloadRecord& record);

    /**
     * @brief Drops a queued or active entry.
     *
     * Removing an active entry frees its slot and promotes queued entries.
     *
     * @param id Entry id.
     * @return True if the entry was queued or active.
     */
    bool remove(const QString& id);

    /**
     * @brief Reports that the job's process has finished.
     *
     * An active entry moves to the finished set and its slot is released.
     * For an id that is no longer active only promotion runs.
     *
     * @param id Entry id.
     */
    void completed(const QString& id);

    /**
     * @brief Drops a retained finished entry.
     */
    void forget(const QString& id);

    /**
     * @brief Changes the active limit; an increase promotes queued entries at once.
     * @param concurrency New limit (clamped to at least 1).
     */
    void setConcurrency(int concurrency);

    int concurrency() const { return m_concurrency; }

    /**
     * @brief Merges @p patch into a queued, active or finished record.
     * @return False if the id is unknown.
     */
    bool updateRecord(const QString& id, const RecordPatch& patch);

    /**
     * @brief Replaces the destination override of a queued or active request.
     */
    bool updateDownloadPath(const QString& id, const QString& path);

    QVector<QueueEntry> activeEntries() const;                  //!< Active entries in promotion order.
    QVector<QueueEntry> queuedEntries() const;                  //!< Queued entries in FIFO order.
    std::optional<QueueEntry> entry(const QString& id) const;   //!< Queued or active entry.
    std::optional<QueueEntry> finishedEntry(const QString& id) const;   //!< Retained finished entry.

    /**
     * @brief Id of the queued or active entry whose signature equals the one of @p request.
     */
    std::optional<QString> duplicateOf(const DownloadRequest& request) const;

    bool contains(const QString& id) const;     //!< Queued or active.
    bool isActive(const QString& id) const;     //!< Holding a slot.
    bool isQueued(const QString& id) const;     //!< Waiting for a slot.
    QueueStatus status() const;

signals:
    /**
     * @brief An entry was promoted to active and its job should start.
     */
    void startRequested(const QString& id);

    /**
     * @brief Membership or order changed.
     */
    void queueUpdated();

    /**
     * @brief A record was patched.
     */
    void recordChanged(const QString& id, const RecordPatch& patch);

private:
    /**
     * @brief Promotes queued entries while slots are free.
     * @return Number of promoted entries.
     */
    int promote();

    DownloadRecord* findRecord(const QString& id);

    int m_concurrency = 5;                          //!< Active limit.
    QHash<QString, QueueEntry> m_entries;           //!< Queued and active entries by id.
    QStringList m_queued;                           //!< Queued ids, FIFO.
    QStringList m_active;                           //!< Active ids, promotion order.
    QHash<QString, QueueEntry> m_finished;          //!< Finished entries kept for reconciliation.
};

#include "downloadqueue.moc"
