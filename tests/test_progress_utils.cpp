#include <QString>
#include <QStringList>

#include <gtest/gtest.h>

#include <limits>

import kite.core.downloadtypes;
import kite.utils.progress_utils;

using kite::utils::ProgressBlender;
using kite::utils::clampPercent;
using kite::utils::estimateProgressParts;

namespace {

DownloadRequest videoRequest(const QString& format)
{
    DownloadRequest request;
    request.url = QStringLiteral("https://example.com/watch");
    request.kind = MediaKind::Video;
    request.format = format;
    return request;
}

} // namespace

TEST(ProgressParts, AudioIsSinglePart)
{
    DownloadRequest request = videoRequest(QStringLiteral("137+140"));
    request.kind = MediaKind::Audio;
    EXPECT_EQ(estimateProgressParts(request), 1);
}

TEST(ProgressParts, EmptySelectorAssumesVideoAndAudio)
{
    EXPECT_EQ(estimateProgressParts(videoRequest(QString())), 2);
    EXPECT_EQ(estimateProgressParts(videoRequest(QStringLiteral("  "))), 2);
}

TEST(ProgressParts, CountsPrimaryAlternativeOnly)
{
    EXPECT_EQ(estimateProgressParts(videoRequest(QStringLiteral("22"))), 1);
    EXPECT_EQ(estimateProgressParts(videoRequest(QStringLiteral("137+140"))), 2);
    EXPECT_EQ(estimateProgressParts(videoRequest(QStringLiteral("137+140/best"))), 2);
    EXPECT_EQ(estimateProgressParts(videoRequest(QStringLiteral("bestvideo+none"))), 1);
}

TEST(ProgressParts, SecondaryAudioIdsAddParts)
{
    DownloadRequest request = videoRequest(QStringLiteral("137"));
    request.audioFormatIds = {QStringLiteral("140"), QStringLiteral(" "), QStringLiteral("251")};
    EXPECT_EQ(estimateProgressParts(request), 3);
}

TEST(ProgressBlender, BlendsTwoPartsAcrossBoundary)
{
    ProgressBlender blender(2);
    EXPECT_DOUBLE_EQ(blender.update(10), 5.0);
    EXPECT_DOUBLE_EQ(blender.update(50), 25.0);
    EXPECT_DOUBLE_EQ(blender.update(95), 47.5);
    EXPECT_DOUBLE_EQ(blender.update(5), 52.5);
    EXPECT_DOUBLE_EQ(blender.update(40), 70.0);
    EXPECT_DOUBLE_EQ(blender.update(90), 95.0);
    EXPECT_EQ(blender.completedParts(), 1);
}

TEST(ProgressBlender, NeverAdvancesPastLastPart)
{
    ProgressBlender blender(2);
    blender.update(95);
    blender.update(5);
    blender.update(95);
    blender.update(5);
    EXPECT_EQ(blender.completedParts(), 1);
    EXPECT_DOUBLE_EQ(blender.update(100), 100.0);
}

TEST(ProgressBlender, SinglePartPassesThroughClamped)
{
    ProgressBlender blender;
    EXPECT_DOUBLE_EQ(blender.update(42.5), 42.5);
    EXPECT_DOUBLE_EQ(blender.update(150), 100.0);
    EXPECT_DOUBLE_EQ(blender.update(-3), 0.0);
}

TEST(ProgressBlender, ShrinkingPartsClampsCompletedCount)
{
    ProgressBlender blender(3);
    blender.update(95);
    blender.update(1);
    blender.update(95);
    blender.update(1);
    EXPECT_EQ(blender.completedParts(), 2);
    blender.setTotalParts(1);
    EXPECT_EQ(blender.totalParts(), 1);
    EXPECT_EQ(blender.completedParts(), 0);
}

TEST(ProgressBlender, ClampHandlesNonFinite)
{
    EXPECT_DOUBLE_EQ(clampPercent(std::numeric_limits<double>::quiet_NaN()), 0.0);
    EXPECT_DOUBLE_EQ(clampPercent(std::numeric_limits<double>::infinity()), 0.0);
    EXPECT_DOUBLE_EQ(clampPercent(55.5), 55.5);
}
