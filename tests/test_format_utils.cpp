#include <QString>
#include <QVector>

#include <gtest/gtest.h>

import kite.core.downloadtypes;
import kite.utils.format_utils;

namespace utils = kite::utils;

namespace {

MediaFormat videoFormat(const QString& id, int height, const QString& acodec = QStringLiteral("none"))
{
    MediaFormat format;
    format.formatId = id;
    format.ext = QStringLiteral("mp4");
    format.videoExt = QStringLiteral("mp4");
    format.vcodec = QStringLiteral("avc1");
    format.acodec = acodec;
    format.height = height;
    return format;
}

MediaFormat audioFormat(const QString& id, double tbr)
{
    MediaFormat format;
    format.formatId = id;
    format.ext = QStringLiteral("m4a");
    format.videoExt = QStringLiteral("none");
    format.vcodec = QStringLiteral("none");
    format.acodec = QStringLiteral("mp4a");
    format.tbr = tbr;
    return format;
}

QVector<MediaFormat> sampleFormats()
{
    return {
        videoFormat(QStringLiteral("18"), 360, QStringLiteral("mp4a")),
        videoFormat(QStringLiteral("136"), 720),
        videoFormat(QStringLiteral("137"), 1080),
        videoFormat(QStringLiteral("401"), 2160),
        audioFormat(QStringLiteral("140"), 129),
        audioFormat(QStringLiteral("251"), 160),
        audioFormat(QStringLiteral("599"), 31)
    };
}

} // namespace

TEST(FormatUtils, MuxedNeedsBothCodecs)
{
    EXPECT_TRUE(utils::isMuxedFormat(videoFormat(QStringLiteral("22"), 720, QStringLiteral("mp4a"))));
    EXPECT_FALSE(utils::isMuxedFormat(videoFormat(QStringLiteral("137"), 1080)));
    EXPECT_FALSE(utils::isMuxedFormat(audioFormat(QStringLiteral("140"), 129)));
}

TEST(FormatUtils, SelectorPicksFirstKnownAlternative)
{
    const auto formats = sampleFormats();
    EXPECT_EQ(utils::findFormatBySelector(formats, QStringLiteral("999/137+140"))->formatId, QStringLiteral("137"));
    EXPECT_FALSE(utils::findFormatBySelector(formats, QStringLiteral("bestvideo+bestaudio")).has_value());
}

TEST(FormatUtils, IdCandidatesTryEveryMergedId)
{
    const auto formats = sampleFormats();
    EXPECT_EQ(utils::findFormatByIdCandidates(formats, QStringLiteral("999+140"))->formatId, QStringLiteral("140"));
    EXPECT_FALSE(utils::findFormatByIdCandidates(formats, QString()).has_value());
}

TEST(FormatUtils, VideoPresetCapsHeight)
{
    const auto formats = sampleFormats();
    EXPECT_EQ(utils::selectVideoFormatForPreset(formats, QStringLiteral("best"))->formatId, QStringLiteral("401"));
    EXPECT_EQ(utils::selectVideoFormatForPreset(formats, QStringLiteral("good"))->formatId, QStringLiteral("137"));
    EXPECT_EQ(utils::selectVideoFormatForPreset(formats, QStringLiteral("normal"))->formatId, QStringLiteral("136"));
}

TEST(FormatUtils, ResolveUsesDirectSelectorFirst)
{
    DownloadRequest request;
    request.kind = MediaKind::Video;
    request.format = QStringLiteral("136+251");
    EXPECT_EQ(utils::resolveSelectedFormat(sampleFormats(), request, QStringLiteral("best"))->formatId,
              QStringLiteral("136"));
}

TEST(FormatUtils, ResolveAudioByBitrateCeiling)
{
    DownloadRequest request;
    request.kind = MediaKind::Audio;
    EXPECT_EQ(utils::resolveSelectedFormat(sampleFormats(), request, QStringLiteral("best"))->formatId,
              QStringLiteral("251"));
    EXPECT_EQ(utils::resolveSelectedFormat(sampleFormats(), request, QStringLiteral("bad"))->formatId,
              QStringLiteral("599"));
    EXPECT_EQ(utils::resolveSelectedFormat(sampleFormats(), request, QStringLiteral("worst"))->formatId,
              QStringLiteral("599"));
}

TEST(FormatUtils, ResolveWithoutFormatsIsEmpty)
{
    DownloadRequest request;
    EXPECT_FALSE(utils::resolveSelectedFormat({}, request, QStringLiteral("best")).has_value());
}
