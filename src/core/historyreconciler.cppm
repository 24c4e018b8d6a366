/*!
 * @file        historyreconciler.cppm
 * @brief       Merges job record changes into the history store.
 * @details     Every record mutation that touches a persisted field is turned
 *              into an idempotent upsert: the existing history row (or a row
 *              built from the current record when none exists yet) receives
 *              only the fields carried by the patch, so repeated partial
 *              updates never lose data written earlier.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QString>

#include <optional>

#ifndef Q_MOC_RUN
export module kite.core.historyreconciler;
import kite.services.interfaces;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT class HistoryReconciler {
public:
    explicit HistoryReconciler(HistoryStore& store);

    /**
     * @brief Merges @p patch into the history row of @p base.id.
     * @param base Current record, used when no row exists yet.
     * @param patch Fields to write.
     * @param downloadPath New download directory, if it changed.
     */
    void upsert(const DownloadRecord& base, const RecordPatch& patch,
                const std::optional<QString>& downloadPath = std::nullopt);

    /**
     * @brief Writes the full record, keeping the stored download directory.
     */
    void writeRecord(const DownloadRecord& record, const std::optional<QString>& downloadPath = std::nullopt);

    /**
     * @brief Drops the history row of a cancelled job.
     */
    bool remove(const QString& id);

    /**
     * @brief Status stored in history, if the row exists.
     */
    std::optional<DownloadStatus> storedStatus(const QString& id) const;

    std::optional<HistoryItem> row(const QString& id) const;

private:
    HistoryStore& m_store;  //!< Backing store.
};
