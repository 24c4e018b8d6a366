module;
#include <QString>
#include <QStringList>
#include <QVector>

#include <algorithm>
#include <optional>

module kite.utils.format_utils;

import kite.core.downloadtypes;

namespace kite::utils {

namespace {

int presetHeightLimit(const QString& preset)
{
    if (preset == "good") return 1080;
    if (preset == "normal") return 720;
    if (preset == "bad") return 480;
    if (preset == "worst") return 360;
    return 0;
}

int presetAudioLimit(const QString& preset)
{
    if (preset == "good") return 256;
    if (preset == "normal") return 192;
    if (preset == "bad") return 128;
    if (preset == "worst") return 96;
    return 320;
}

bool hasCodec(const QString& codec)
{
    return !codec.isEmpty() && codec != "none";
}

std::optional<MediaFormat> findById(const QVector<MediaFormat>& formats, const QString& id)
{
    for (const MediaFormat& format : formats) {
        if (format.formatId == id) return format;
    }
    return std::nullopt;
}

} // namespace

bool isMuxedFormat(const MediaFormat& format)
{
    return hasCodec(format.vcodec) && hasCodec(format.acodec);
}

std::optional<MediaFormat> findFormatBySelector(const QVector<MediaFormat>& formats, const QString& selector)
{
    if (selector.isEmpty()) return std::nullopt;
    for (const QString& option : selector.split('/')) {
        const QString candidate = option.section('+', 0, 0).trimmed();
        if (candidate.isEmpty()) continue;
        if (auto match = findById(formats, candidate)) return match;
    }
    return std::nullopt;
}

std::optional<MediaFormat> findFormatByIdCandidates(const QVector<MediaFormat>& formats, const QString& rawFormatId)
{
    if (rawFormatId.isEmpty()) return std::nullopt;
    for (const QString& part : rawFormatId.split('+')) {
        const QString candidate = part.trimmed();
        if (candidate.isEmpty()) continue;
        if (auto match = findById(formats, candidate)) return match;
    }
    return std::nullopt;
}

std::optional<MediaFormat> selectVideoFormatForPreset(const QVector<MediaFormat>& formats, const QString& preset)
{
    if (formats.isEmpty()) return std::nullopt;

    QVector<MediaFormat> sorted = formats;
    std::stable_sort(sorted.begin(), sorted.end(), [](const MediaFormat& a, const MediaFormat& b) {
        if (a.height != b.height) return a.height > b.height;
        if (a.fps != b.fps) return a.fps > b.fps;
        return a.tbr > b.tbr;
    });

    if (preset == "worst") return sorted.last();

    const int heightLimit = presetHeightLimit(preset);
    if (heightLimit <= 0) return sorted.first();

    for (const MediaFormat& format : sorted) {
        if (format.height > 0 && format.height <= heightLimit) return format;
    }
    return sorted.first();
}

std::optional<MediaFormat> selectAudioFormatForPreset(const QVector<MediaFormat>& formats, const QString& preset)
{
    if (formats.isEmpty()) return std::nullopt;

    QVector<MediaFormat> sorted = formats;
    std::stable_sort(sorted.begin(), sorted.end(), [](const MediaFormat& a, const MediaFormat& b) {
        if (a.tbr != b.tbr) return a.tbr > b.tbr;
        const qint64 sizeA = a.filesize > 0 ? a.filesize : a.filesizeApprox;
        const qint64 sizeB = b.filesize > 0 ? b.filesize : b.filesizeApprox;
        return sizeA > sizeB;
    });

    if (preset == "worst") return sorted.last();

    const int abrLimit = presetAudioLimit(preset);
    for (const MediaFormat& format : sorted) {
        if (format.tbr > 0 && format.tbr <= abrLimit) return format;
    }
    return sorted.first();
}

std::optional<MediaFormat> resolveSelectedFormat(const QVector<MediaFormat>& formats,
                                                 const DownloadRequest& request,
                                                 const QString& preset)
{
    if (auto direct = findFormatBySelector(formats, request.format)) return direct;

    const QString effectivePreset = preset.isEmpty() ? QStringLiteral("best") : preset;

    if (request.kind == MediaKind::Video) {
        QVector<MediaFormat> videoFormats;
        for (const MediaFormat& format : formats) {
            if (format.videoExt != "none" && hasCodec(format.vcodec)) videoFormats.append(format);
        }
        return selectVideoFormatForPreset(videoFormats, effectivePreset);
    }

    QVector<MediaFormat> audioFormats;
    for (const MediaFormat& format : formats) {
        if (hasCodec(format.acodec) && (format.videoExt.isEmpty() || format.videoExt == "none")) {
            audioFormats.append(format);
        }
    }
    return selectAudioFormatForPreset(audioFormats, effectivePreset);
}

} // namespace kite::utils
