#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringList>
#include <QString>
#include <QTemporaryDir>

#include <gtest/gtest.h>

import kite.core.downloadtypes;
import kite.core.outputresolver;

namespace {

QString touch(const QDir& dir, const QString& name, const QByteArray& bytes = QByteArrayLiteral("data"),
              const QDateTime& modified = QDateTime())
{
    const QString path = dir.filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) return QString();
    file.write(bytes);
    if (modified.isValid()) file.setFileTime(modified, QFileDevice::FileModificationTime);
    file.close();
    return path;
}

} // namespace

TEST(OutputResolver, CapturesDestinationMergeAndMoveLines)
{
    OutputResolver resolver(QStringLiteral("/downloads"));
    EXPECT_TRUE(resolver.captureFromLogLine(QStringLiteral("Destination: Clip via Kite.f137.mp4")));
    EXPECT_EQ(resolver.lastKnownPath(), QStringLiteral("/downloads/Clip via Kite.f137.mp4"));

    EXPECT_TRUE(resolver.captureFromLogLine(QStringLiteral("Merging formats into \"/downloads/Clip via Kite.mkv\"")));
    EXPECT_EQ(resolver.lastKnownPath(), QStringLiteral("/downloads/Clip via Kite.mkv"));

    EXPECT_TRUE(resolver.captureFromLogLine(QStringLiteral("Moving file to \"/final/../final/Clip.mkv\"")));
    EXPECT_EQ(resolver.lastKnownPath(), QStringLiteral("/final/Clip.mkv"));

    EXPECT_FALSE(resolver.captureFromLogLine(QStringLiteral("Downloading webpage")));
    EXPECT_EQ(resolver.candidates().size(), 3);
}

TEST(OutputResolver, CandidatesNewestFirstThenFallback)
{
    OutputResolver resolver(QStringLiteral("/d"));
    resolver.addCandidate(QStringLiteral("/d/a.mp4"));
    resolver.addCandidate(QStringLiteral("/d/b.mkv"));
    EXPECT_EQ(resolver.candidatePaths(QStringLiteral("/d/fallback.mp4")),
              (QStringList{QStringLiteral("/d/b.mkv"), QStringLiteral("/d/a.mp4"), QStringLiteral("/d/fallback.mp4")}));
}

TEST(OutputResolver, PrefersExistingCapturedFile)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QDir dir(tmp.path());
    const QString merged = touch(dir, QStringLiteral("Clip via Kite.mkv"), QByteArrayLiteral("0123456789"));

    OutputResolver resolver(tmp.path());
    resolver.captureFromLogLine(QStringLiteral("Merging formats into \"%1\"").arg(merged));
    // Intermediate part removed after merging.
    resolver.captureFromLogLine(QStringLiteral("Destination: Clip via Kite.f140.m4a"));

    const ResolvedOutput output = resolver.resolve(QStringLiteral("Clip"), QStringLiteral("mkv"));
    EXPECT_TRUE(output.located);
    EXPECT_EQ(output.path, merged);
    EXPECT_EQ(output.size, 10);
}

TEST(OutputResolver, ScanPrefersTitleMatchThenBranding)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QDir dir(tmp.path());
    const QDateTime old = QDateTime::currentDateTime().addSecs(-3600);
    const QString titled = touch(dir, QStringLiteral("My Song via Kite.mp4"), QByteArrayLiteral("a"), old);
    const QString branded = touch(dir, QStringLiteral("Something via Kite.mp4"));
    touch(dir, QStringLiteral("notes.txt"));

    EXPECT_EQ(OutputResolver::findInDirectory(tmp.path(), QStringLiteral("My Song"), QStringLiteral("mp4")),
              QFileInfo(titled).absoluteFilePath());
    EXPECT_EQ(OutputResolver::findInDirectory(tmp.path(), QStringLiteral("Unrelated"), QStringLiteral("mp4")),
              QFileInfo(branded).absoluteFilePath());
    EXPECT_TRUE(OutputResolver::findInDirectory(tmp.path() + QStringLiteral("/missing"), QStringLiteral("x"),
                                                QStringLiteral("mp4")).isEmpty());
}

TEST(OutputResolver, FallsBackToAnyFileWithoutExtensionMatch)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString only = touch(QDir(tmp.path()), QStringLiteral("video.webm"));
    EXPECT_EQ(OutputResolver::findInDirectory(tmp.path(), QStringLiteral("Clip"), QStringLiteral("mp4")),
              QFileInfo(only).absoluteFilePath());
}

TEST(OutputResolver, EstimatesSizeWhenNothingFound)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    OutputResolver resolver(tmp.path());
    resolver.noteProgressSizes(QStringLiteral("~10.00MiB"), QString());
    resolver.noteProgressSizes(QStringLiteral("not a size"), QStringLiteral("1KiB"));
    EXPECT_EQ(resolver.latestKnownSizeBytes(), 10485760);

    const ResolvedOutput output = resolver.resolve(QStringLiteral("Clip"), QStringLiteral("mp4"));
    EXPECT_FALSE(output.located);
    EXPECT_TRUE(output.estimated);
    EXPECT_EQ(output.size, 10485760);
    EXPECT_EQ(output.path, QDir(tmp.path()).filePath(QStringLiteral("Clip.mp4")));
}

TEST(OutputResolver, FallbackNamesAndExtensions)
{
    EXPECT_EQ(OutputResolver::fallbackFileName(QStringLiteral("a/b:c?"), QStringLiteral("mp4")), QStringLiteral("a_b_c_.mp4"));
    EXPECT_EQ(OutputResolver::fallbackFileName(QString(), QStringLiteral("m4a")), QStringLiteral("Unknown.m4a"));
    EXPECT_EQ(OutputResolver::fallbackFileName(QString(60, QLatin1Char('x')), QStringLiteral("mp4")).size(), 54);

    EXPECT_EQ(OutputResolver::resolveExtension(MediaKind::Audio, QString(), false), QStringLiteral("m4a"));
    EXPECT_EQ(OutputResolver::resolveExtension(MediaKind::Video, QString(), true), QStringLiteral("mkv"));
    EXPECT_EQ(OutputResolver::resolveExtension(MediaKind::Video, QString(), false), QStringLiteral("mp4"));
    EXPECT_EQ(OutputResolver::resolveExtension(MediaKind::Video, QStringLiteral("webm"), true), QStringLiteral("webm"));
}
