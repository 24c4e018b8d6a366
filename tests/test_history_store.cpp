#include <QDir>
#include <QString>
#include <QStringList>
#include <QTemporaryDir>

#include <gtest/gtest.h>

import kite.services.interfaces;
import kite.services.json_history_store;
import kite.core.historyreconciler;

namespace {

HistoryItem makeItem(const QString& id, const QString& title)
{
    HistoryItem item;
    item.record.id = id;
    item.record.url = QStringLiteral("https://example.com/") + id;
    item.record.title = title;
    item.downloadPath = QStringLiteral("/data");
    return item;
}

} // namespace

TEST(JsonHistoryStore, KeepsInsertionOrderAndReplacesById)
{
    JsonHistoryStore store;
    store.put(makeItem(QStringLiteral("a"), QStringLiteral("A")));
    store.put(makeItem(QStringLiteral("b"), QStringLiteral("B")));
    store.put(makeItem(QStringLiteral("a"), QStringLiteral("A2")));

    const auto items = store.items();
    ASSERT_EQ(items.size(), 2);
    EXPECT_EQ(items.at(0).record.title, QStringLiteral("A2"));
    EXPECT_EQ(items.at(1).record.id, QStringLiteral("b"));
}

TEST(JsonHistoryStore, RemovesSingleAndMany)
{
    JsonHistoryStore store;
    for (const QString& id : {QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c")}) {
        store.put(makeItem(id, id));
    }
    EXPECT_TRUE(store.remove(QStringLiteral("b")));
    EXPECT_FALSE(store.remove(QStringLiteral("b")));
    EXPECT_EQ(store.removeMany({QStringLiteral("a"), QStringLiteral("zzz")}), 1);
    ASSERT_EQ(store.items().size(), 1);
    EXPECT_EQ(store.items().first().record.id, QStringLiteral("c"));
}

TEST(JsonHistoryStore, PersistsWithoutRuntimeFields)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString path = QDir(tmp.path()).filePath(QStringLiteral("nested/history.json"));
    {
        JsonHistoryStore store(path);
        HistoryItem item = makeItem(QStringLiteral("a"), QStringLiteral("Title"));
        item.record.status = DownloadStatus::Completed;
        item.record.log = QStringLiteral("noise");
        item.record.fileSize = 1234;
        item.downloadedAt = 99;
        store.put(item);
    }
    JsonHistoryStore reloaded(path);
    const auto item = reloaded.getById(QStringLiteral("a"));
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->record.status, DownloadStatus::Completed);
    EXPECT_EQ(item->record.fileSize, 1234);
    EXPECT_EQ(item->downloadPath, QStringLiteral("/data"));
    EXPECT_EQ(item->downloadedAt, 99);
    EXPECT_TRUE(item->record.log.isEmpty());
}

TEST(HistoryReconciler, MergesPatchIntoExistingRow)
{
    JsonHistoryStore store;
    HistoryReconciler history(store);

    DownloadRecord base;
    base.id = QStringLiteral("a");
    base.url = QStringLiteral("https://example.com/a");
    base.title = QStringLiteral("Downloading...");
    base.log = QStringLiteral("should not persist");

    RecordPatch pending;
    pending.status = DownloadStatus::Pending;
    history.upsert(base, pending, QStringLiteral("/data/Videos"));

    RecordPatch meta;
    meta.title = QStringLiteral("Real Title");
    meta.uploader = QStringLiteral("Alice");
    DownloadRecord changed = base;
    changed.title = QStringLiteral("ignored base");
    history.upsert(changed, meta);

    const auto row = history.row(QStringLiteral("a"));
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->record.title, QStringLiteral("Real Title"));
    EXPECT_EQ(row->record.uploader, QStringLiteral("Alice"));
    EXPECT_EQ(row->record.status, DownloadStatus::Pending);
    EXPECT_EQ(row->downloadPath, QStringLiteral("/data/Videos"));
    EXPECT_TRUE(row->record.log.isEmpty());
    EXPECT_GT(row->downloadedAt, 0);
    EXPECT_TRUE(history.storedStatus(QStringLiteral("a")) == DownloadStatus::Pending);

    EXPECT_TRUE(history.remove(QStringLiteral("a")));
    EXPECT_FALSE(history.storedStatus(QStringLiteral("a")).has_value());
}

TEST(HistoryReconciler, WriteRecordReplacesPersistedFields)
{
    JsonHistoryStore store;
    HistoryReconciler history(store);

    DownloadRecord record;
    record.id = QStringLiteral("a");
    record.title = QStringLiteral("T");
    history.upsert(record, RecordPatch(), QStringLiteral("/data"));

    record.status = DownloadStatus::Error;
    record.error = QStringLiteral("Download exited with code 1");
    record.progress.percent = 40;
    history.writeRecord(record);

    const auto row = history.row(QStringLiteral("a"));
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->record.status, DownloadStatus::Error);
    EXPECT_EQ(row->record.error, QStringLiteral("Download exited with code 1"));
    EXPECT_DOUBLE_EQ(row->record.progress.percent, 0.0);
    EXPECT_EQ(row->downloadPath, QStringLiteral("/data"));
}
