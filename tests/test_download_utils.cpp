#include <QString>
#include <QStringList>

#include <gtest/gtest.h>

import kite.core.downloadtypes;
import kite.utils.download_utils;

namespace utils = kite::utils;

TEST(DownloadSignature, NormalizesAudioIdsAndOrigin)
{
    DownloadRequest a;
    a.url = QStringLiteral(" https://example.com/v ");
    a.format = QStringLiteral("137");
    a.audioFormatIds = {QStringLiteral("251"), QStringLiteral(" 140"), QStringLiteral("140")};
    a.origin = QString();

    DownloadRequest b;
    b.url = QStringLiteral("https://example.com/v");
    b.format = QStringLiteral("137 ");
    b.audioFormatIds = {QStringLiteral("140"), QStringLiteral("251")};

    EXPECT_EQ(utils::buildDownloadSignature(a), utils::buildDownloadSignature(b));
    EXPECT_TRUE(utils::buildDownloadSignature(a).contains(QStringLiteral("140,251")));
    EXPECT_TRUE(utils::buildDownloadSignature(a).contains(QStringLiteral("|manual|")));
}

TEST(DownloadSignature, DistinguishesKindAndSection)
{
    DownloadRequest video;
    video.url = QStringLiteral("https://example.com/v");
    DownloadRequest audio = video;
    audio.kind = MediaKind::Audio;
    DownloadRequest trimmed = video;
    trimmed.startTime = QStringLiteral("00:01");

    EXPECT_NE(utils::buildDownloadSignature(video), utils::buildDownloadSignature(audio));
    EXPECT_NE(utils::buildDownloadSignature(video), utils::buildDownloadSignature(trimmed));
}

TEST(SizeParsing, ParsesBinaryAndDecimalUnits)
{
    bool ok = false;
    EXPECT_EQ(utils::parseSizeToBytes(QStringLiteral("~10.00MiB"), &ok), 10485760);
    EXPECT_TRUE(ok);
    EXPECT_EQ(utils::parseSizeToBytes(QStringLiteral("1.5KB")), 1500);
    EXPECT_EQ(utils::parseSizeToBytes(QStringLiteral("1,024B")), 1024);
    EXPECT_EQ(utils::parseSizeToBytes(QStringLiteral("2GiB")), qint64(2) * 1073741824);
}

TEST(SizeParsing, RejectsGarbage)
{
    bool ok = true;
    EXPECT_EQ(utils::parseSizeToBytes(QStringLiteral("Unknown"), &ok), 0);
    EXPECT_FALSE(ok);
    ok = true;
    utils::parseSizeToBytes(QString(), &ok);
    EXPECT_FALSE(ok);
}

TEST(CommandLine, QuotesArgumentsWithSpaces)
{
    const QString line = utils::formatCommandLine(QStringLiteral("yt-dlp"),
        {QStringLiteral("-o"), QStringLiteral("/tmp/a b/%(title)s.%(ext)s"), QString(), QStringLiteral("url")});
    EXPECT_EQ(line, QStringLiteral("yt-dlp -o \"/tmp/a b/%(title)s.%(ext)s\" \"\" url"));
}

TEST(FilenameKey, StripsBrandingAndPunctuation)
{
    EXPECT_EQ(utils::buildFilenameKey(QStringLiteral("Hello, World! via Kite.mp4")), QStringLiteral("helloworldmp4"));
    EXPECT_EQ(utils::buildFilenameKey(QStringLiteral("東京 Tower")), QStringLiteral("東京tower"));
}

TEST(UrlHosts, RecognizesKnownSites)
{
    EXPECT_TRUE(utils::isYouTubeUrl(QStringLiteral("https://www.youtube.com/watch?v=x")));
    EXPECT_TRUE(utils::isYouTubeUrl(QStringLiteral("https://youtu.be/x")));
    EXPECT_FALSE(utils::isYouTubeUrl(QStringLiteral("https://notyoutube.com/x")));
    EXPECT_TRUE(utils::isBilibiliUrl(QStringLiteral("https://www.bilibili.com/video/BV1")));
    EXPECT_EQ(utils::normalizeHost(QStringLiteral("HTTPS://Example.COM/path")), QStringLiteral("example.com"));
}
