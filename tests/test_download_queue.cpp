#include <QObject>
#include <QString>
#include <QStringList>

#include <gtest/gtest.h>

import kite.core.downloadtypes;
import kite.core.downloadqueue;

namespace {

DownloadRequest makeRequest(const QString& url)
{
    DownloadRequest request;
    request.url = url;
    return request;
}

DownloadRecord makeRecord(const QString& id, const QString& url)
{
    DownloadRecord record;
    record.id = id;
    record.url = url;
    return record;
}

SubmitResult submitNumbered(DownloadQueue& queue, int n)
{
    const QString url = QStringLiteral("https://example.com/%1").arg(n);
    return queue.submit(makeRequest(url), makeRecord(QStringLiteral("id%1").arg(n), url));
}

} // namespace

TEST(DownloadQueue, PromotesUpToConcurrencyInFifoOrder)
{
    DownloadQueue queue(2);
    QStringList started;
    QObject::connect(&queue, &DownloadQueue::startRequested, [&started](const QString& id) { started << id; });

    EXPECT_EQ(submitNumbered(queue, 1), SubmitResult::Started);
    EXPECT_EQ(submitNumbered(queue, 2), SubmitResult::Started);
    EXPECT_EQ(submitNumbered(queue, 3), SubmitResult::Queued);
    EXPECT_EQ(submitNumbered(queue, 4), SubmitResult::Queued);

    EXPECT_EQ(started, (QStringList{QStringLiteral("id1"), QStringLiteral("id2")}));
    const QueueStatus status = queue.status();
    EXPECT_EQ(status.active, 2);
    EXPECT_EQ(status.queued, 2);

    queue.completed(QStringLiteral("id1"));
    EXPECT_EQ(started.last(), QStringLiteral("id3"));
    EXPECT_TRUE(queue.isActive(QStringLiteral("id3")));
    EXPECT_TRUE(queue.isQueued(QStringLiteral("id4")));
    EXPECT_TRUE(queue.finishedEntry(QStringLiteral("id1")).has_value());
}

TEST(DownloadQueue, RejectsDuplicatesAndKnownIds)
{
    DownloadQueue queue(1);
    const QString url = QStringLiteral("https://example.com/a");
    EXPECT_EQ(queue.submit(makeRequest(url), makeRecord(QStringLiteral("a"), url)), SubmitResult::Started);
    EXPECT_EQ(queue.submit(makeRequest(url), makeRecord(QStringLiteral("b"), url)), SubmitResult::Duplicate);
    EXPECT_EQ(queue.submit(makeRequest(QStringLiteral("https://example.com/other")), makeRecord(QStringLiteral("a"), url)),
              SubmitResult::AlreadyExists);
    EXPECT_EQ(queue.duplicateOf(makeRequest(url)), QStringLiteral("a"));
    EXPECT_FALSE(queue.duplicateOf(makeRequest(QStringLiteral("https://example.com/other"))).has_value());

    queue.completed(QStringLiteral("a"));
    // Finished ids stay reserved until forgotten; the signature is free again.
    EXPECT_EQ(queue.submit(makeRequest(url), makeRecord(QStringLiteral("a"), url)), SubmitResult::AlreadyExists);
    EXPECT_FALSE(queue.duplicateOf(makeRequest(url)).has_value());
    EXPECT_EQ(queue.submit(makeRequest(url), makeRecord(QStringLiteral("b"), url)), SubmitResult::Started);

    queue.forget(QStringLiteral("a"));
    EXPECT_FALSE(queue.finishedEntry(QStringLiteral("a")).has_value());
}

TEST(DownloadQueue, RemovingActiveEntryPromotesHead)
{
    DownloadQueue queue(1);
    submitNumbered(queue, 1);
    submitNumbered(queue, 2);

    EXPECT_TRUE(queue.remove(QStringLiteral("id1")));
    EXPECT_TRUE(queue.isActive(QStringLiteral("id2")));
    EXPECT_FALSE(queue.contains(QStringLiteral("id1")));
    EXPECT_FALSE(queue.finishedEntry(QStringLiteral("id1")).has_value());
    EXPECT_FALSE(queue.remove(QStringLiteral("id1")));
}

TEST(DownloadQueue, RaisingConcurrencyStartsSeveral)
{
    DownloadQueue queue(1);
    for (int i = 1; i <= 4; ++i) submitNumbered(queue, i);
    QStringList started;
    QObject::connect(&queue, &DownloadQueue::startRequested, [&started](const QString& id) { started << id; });

    queue.setConcurrency(3);
    EXPECT_EQ(started, (QStringList{QStringLiteral("id2"), QStringLiteral("id3")}));
    EXPECT_EQ(queue.status().activeIds,
              (QStringList{QStringLiteral("id1"), QStringLiteral("id2"), QStringLiteral("id3")}));

    queue.setConcurrency(0);
    EXPECT_EQ(queue.concurrency(), 1);
    EXPECT_EQ(queue.status().active, 3);
}

TEST(DownloadQueue, UpdatesRecordsOfFinishedEntries)
{
    DownloadQueue queue(1);
    submitNumbered(queue, 1);
    queue.completed(QStringLiteral("id1"));

    int changes = 0;
    QObject::connect(&queue, &DownloadQueue::recordChanged, [&changes](const QString&, const RecordPatch&) { ++changes; });

    RecordPatch patch;
    patch.status = DownloadStatus::Completed;
    patch.fileSize = 42;
    EXPECT_TRUE(queue.updateRecord(QStringLiteral("id1"), patch));
    EXPECT_EQ(changes, 1);
    EXPECT_EQ(queue.finishedEntry(QStringLiteral("id1"))->record.status, DownloadStatus::Completed);
    EXPECT_EQ(queue.finishedEntry(QStringLiteral("id1"))->record.fileSize, 42);
    EXPECT_FALSE(queue.updateRecord(QStringLiteral("missing"), patch));
}

TEST(DownloadQueue, DownloadPathIsWrittenBack)
{
    DownloadQueue queue(1);
    submitNumbered(queue, 1);
    EXPECT_TRUE(queue.updateDownloadPath(QStringLiteral("id1"), QStringLiteral("/data/Videos/Alice")));
    EXPECT_EQ(queue.entry(QStringLiteral("id1"))->request.customDownloadPath, QStringLiteral("/data/Videos/Alice"));
}
