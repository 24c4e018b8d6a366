#include <QFile>
#include <QString>
#include <QStringList>
#include <QVector>

#include <gtest/gtest.h>

import kite.services.interfaces;
import kite.services.ytdlp_process;
import kite.tests.fakes;

TEST(YtDlpProcess, ParsesProgressLine)
{
    ProgressEvent event;
    ASSERT_TRUE(YtDlpProcess::parseProgressLine(
        QStringLiteral("[download]  42.0% of ~10.00MiB at 1.00MiB/s ETA 00:05"), &event));
    EXPECT_DOUBLE_EQ(event.percent, 42.0);
    EXPECT_EQ(event.total, QStringLiteral("~10.00MiB"));
    EXPECT_EQ(event.currentSpeed, QStringLiteral("1.00MiB/s"));
    EXPECT_EQ(event.eta, QStringLiteral("00:05"));
}

TEST(YtDlpProcess, ParsesBareProgressLine)
{
    ProgressEvent event;
    ASSERT_TRUE(YtDlpProcess::parseProgressLine(QStringLiteral("[download] 100%"), &event));
    EXPECT_DOUBLE_EQ(event.percent, 100.0);
    EXPECT_TRUE(event.total.isEmpty());
}

TEST(YtDlpProcess, DestinationLineIsNotProgress)
{
    EXPECT_FALSE(YtDlpProcess::parseProgressLine(QStringLiteral("[download] Destination: /tmp/a.mp4"), nullptr));
}

TEST(YtDlpProcess, ParsesEventLines)
{
    QString type;
    QString text;
    ASSERT_TRUE(YtDlpProcess::parseEventLine(QStringLiteral("[Merger] Merging formats into \"a.mkv\""), &type, &text));
    EXPECT_EQ(type, QStringLiteral("merger"));
    EXPECT_EQ(text, QStringLiteral("Merging formats into \"a.mkv\""));

    ASSERT_TRUE(YtDlpProcess::parseEventLine(QStringLiteral("[youtube:tab] Downloading page 1"), &type, &text));
    EXPECT_EQ(type, QStringLiteral("youtube:tab"));
    EXPECT_FALSE(YtDlpProcess::parseEventLine(QStringLiteral("WARNING: something"), &type, &text));
}

TEST(YtDlpProcess, StreamsLinesFromRealProcess)
{
    const QString shell = QStringLiteral("/bin/sh");
    if (!QFile::exists(shell)) GTEST_SKIP() << "no /bin/sh";

    YtDlpProcess process(shell, {QStringLiteral("-c"),
        QStringLiteral("printf '[info] abc: Downloading 1 format(s): 22\\r\\n[download]  50.0%% of 2.00MiB\\rplain tail'; exit 3")});

    QStringList events;
    QVector<double> percents;
    QString output;
    int exitCode = -100;
    QObject::connect(&process, &DownloadProcess::eventReported, [&events](const QString& type, const QString& text) {
        events << type + QLatin1Char('|') + text;
    });
    QObject::connect(&process, &DownloadProcess::progressReported, [&percents](const ProgressEvent& event) {
        percents << event.percent;
    });
    QObject::connect(&process, &DownloadProcess::outputReceived, [&output](const QString& text) { output += text; });
    QObject::connect(&process, &DownloadProcess::exited, [&exitCode](int code) { exitCode = code; });

    process.start();
    ASSERT_TRUE(waitUntil([&exitCode]() { return exitCode != -100; }, 5000));
    EXPECT_EQ(exitCode, 3);
    EXPECT_EQ(percents, QVector<double>{50.0});
    EXPECT_EQ(events, (QStringList{QStringLiteral("info|abc: Downloading 1 format(s): 22"), QStringLiteral("|plain tail")}));
    EXPECT_TRUE(output.contains(QStringLiteral("plain tail")));
}

TEST(YtDlpProcess, MissingProgramReportsFailure)
{
    YtDlpProcess process(QStringLiteral("/nonexistent/kite-fetcher"), {});
    QString message;
    bool exited = false;
    QObject::connect(&process, &DownloadProcess::failed, [&message](const QString& m) { message = m; });
    QObject::connect(&process, &DownloadProcess::exited, [&exited](int) { exited = true; });
    process.start();
    ASSERT_TRUE(waitUntil([&message]() { return !message.isEmpty(); }));
    spinFor(50);
    EXPECT_FALSE(exited);
}

TEST(YtDlpProcessRunner, ProgramDefaultsToYtDlp)
{
    YtDlpProcessRunner runner;
    AppSettings settings;
    settings.ytDlpPath.clear();
    EXPECT_EQ(runner.program(settings), QStringLiteral("yt-dlp"));
    settings.ytDlpPath = QStringLiteral("/usr/local/bin/yt-dlp");
    EXPECT_EQ(runner.program(settings), QStringLiteral("/usr/local/bin/yt-dlp"));
}
