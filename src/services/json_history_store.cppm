/*!
 * @file        json_history_store.cppm
 * @brief       History store persisted as a JSON document.
 * @details     Keeps every history row in memory, keyed by job id, and writes
 *              the whole document atomically with QSaveFile after each change.
 *              Row order follows first insertion.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#ifndef Q_MOC_RUN
export module kite.services.json_history_store;
import kite.services.interfaces;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT class JsonHistoryStore : public HistoryStore {
public:
    /**
     * @brief Opens the store and loads existing rows.
     * @param filePath History file; an empty path keeps the store in memory only.
     */
    explicit JsonHistoryStore(const QString& filePath = QString());

    std::optional<HistoryItem> getById(const QString& id) const override;
    void put(const HistoryItem& item) override;
    bool remove(const QString& id) override;
    int removeMany(const QStringList& ids) override;
    QVector<HistoryItem> items() const override;

    QString filePath() const { return m_filePath; }

    /**
     * @brief Default location: history.json in the application data directory.
     */
    static QString defaultFilePath();

private:
    void load();
    bool save() const;

    QString m_filePath;                     //!< Backing file.
    QHash<QString, HistoryItem> m_items;    //!< Rows by id.
    QStringList m_order;                    //!< Insertion order.
};
