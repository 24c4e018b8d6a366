#include <QDir>
#include <QFile>
#include <QString>
#include <QStringList>
#include <QTemporaryDir>

#include <gtest/gtest.h>

import kite.services.interfaces;
import kite.services.watermark_transcoder;
import kite.tests.fakes;

namespace {

bool writeFile(const QString& path, const QByteArray& bytes)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) return false;
    return file.write(bytes) == bytes.size();
}

QByteArray readFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) return QByteArray();
    return file.readAll();
}

} // namespace

TEST(WatermarkTranscoder, BuildsThreePartText)
{
    EXPECT_EQ(WatermarkTranscoder::buildWatermarkText(QStringLiteral("My Video"), QStringLiteral("Alice")),
              QStringLiteral("My Video by Alice Downloaded with Kite"));
    EXPECT_EQ(WatermarkTranscoder::buildWatermarkText(QString(), QString()),
              QStringLiteral("Untitled video Unknown author Downloaded with Kite"));
}

TEST(WatermarkTranscoder, TruncatesLongLines)
{
    const QString line = WatermarkTranscoder::normalizeWatermarkLine(QString(40, QLatin1Char('a')), QStringLiteral("x"), 28);
    EXPECT_EQ(line.size(), 28);
    EXPECT_TRUE(line.endsWith(QStringLiteral("...")));
    EXPECT_EQ(WatermarkTranscoder::normalizeWatermarkLine(QStringLiteral("  a\u200B  b "), QStringLiteral("x"), 28),
              QStringLiteral("a b"));
}

TEST(WatermarkTranscoder, OutputKeepsVideoContainers)
{
    EXPECT_EQ(WatermarkTranscoder::outputPathFor(QStringLiteral("/d/clip.mkv")), QStringLiteral("/d/clip.mkv"));
    EXPECT_EQ(WatermarkTranscoder::outputPathFor(QStringLiteral("/d/clip.webm")), QStringLiteral("/d/clip.mp4"));
}

TEST(WatermarkTranscoder, ArgumentsEndWithTempOutput)
{
    const QStringList args = WatermarkTranscoder::buildArgs(QStringLiteral("/d/in.webm"), QStringLiteral("drawtext=x"),
                                                            QStringLiteral("/d/in.kite-watermark.1.mp4"));
    EXPECT_EQ(args.last(), QStringLiteral("/d/in.kite-watermark.1.mp4"));
    EXPECT_TRUE(args.contains(QStringLiteral("+faststart")));
    EXPECT_EQ(args.at(args.indexOf(QStringLiteral("-vf")) + 1), QStringLiteral("drawtext=x"));
}

TEST(WatermarkTranscoder, FilterEscapesPaths)
{
    const QString filter = WatermarkTranscoder::buildDrawTextFilter(QStringLiteral("C:/tmp/it's.txt"), QString());
    EXPECT_TRUE(filter.startsWith(QStringLiteral("drawtext=textfile=C\\:/tmp/it\\'s.txt:")));
    EXPECT_FALSE(filter.contains(QStringLiteral("fontfile=")));
}

TEST(WatermarkTranscoder, ReplaceSwapsFileIntoPlace)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QDir dir(tmp.path());
    const QString output = dir.filePath(QStringLiteral("clip.mp4"));
    const QString temp = dir.filePath(QStringLiteral("clip.kite-watermark.1.mp4"));
    ASSERT_TRUE(writeFile(output, QByteArrayLiteral("old")));
    ASSERT_TRUE(writeFile(temp, QByteArrayLiteral("new")));

    QString error;
    ASSERT_TRUE(WatermarkTranscoder::replaceOutputFile(output, temp, &error)) << error.toStdString();
    EXPECT_EQ(readFile(output), QByteArrayLiteral("new"));
    EXPECT_FALSE(QFile::exists(temp));
    EXPECT_EQ(dir.entryList(QDir::Files).size(), 1);
}

TEST(WatermarkTranscoder, ReplaceRestoresBackupWhenTempMissing)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QDir dir(tmp.path());
    const QString output = dir.filePath(QStringLiteral("clip.mp4"));
    ASSERT_TRUE(writeFile(output, QByteArrayLiteral("old")));

    QString error;
    EXPECT_FALSE(WatermarkTranscoder::replaceOutputFile(output, dir.filePath(QStringLiteral("missing.mp4")), &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_EQ(readFile(output), QByteArrayLiteral("old"));
}

TEST(WatermarkTranscoder, LocateRejectsMissingAbsolutePath)
{
    WatermarkTranscoder transcoder;
    AppSettings settings;
    settings.ffmpegPath = QStringLiteral("/nonexistent/bin/ffmpeg");
    QString error;
    EXPECT_TRUE(transcoder.locateExecutable(settings, &error).isEmpty());
    EXPECT_TRUE(error.contains(QStringLiteral("/nonexistent/bin/ffmpeg")));
}

TEST(WatermarkTranscoder, MissingInputFailsImmediately)
{
    WatermarkTranscoder transcoder;
    bool called = false;
    TranscodeResult result;
    transcoder.transform(TranscodeRequest{}, [&](const TranscodeResult& r) {
        called = true;
        result = r;
    });
    EXPECT_TRUE(called);
    EXPECT_FALSE(result.ok);
}

TEST(WatermarkTranscoder, FailedProcessKeepsOriginal)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString input = QDir(tmp.path()).filePath(QStringLiteral("clip.mp4"));
    ASSERT_TRUE(writeFile(input, QByteArrayLiteral("video")));

    WatermarkTranscoder transcoder;
    TranscodeRequest request;
    request.inputPath = input;
    request.executable = QStringLiteral("/nonexistent/ffmpeg");
    request.title = QStringLiteral("Clip");

    bool called = false;
    TranscodeResult result;
    transcoder.transform(request, [&](const TranscodeResult& r) {
        called = true;
        result = r;
    });
    ASSERT_TRUE(waitUntil([&called]() { return called; }));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(readFile(input), QByteArrayLiteral("video"));
    EXPECT_EQ(QDir(tmp.path()).entryList(QDir::Files).size(), 1);
}
