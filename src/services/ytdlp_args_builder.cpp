module;
#include <QDir>
#include <QString>
#include <QStringList>

module kite.services.ytdlp_args_builder;

import kite.services.interfaces;
import kite.utils.download_utils;
import kite.utils.path_utils;

namespace utils = kite::utils;

namespace {

const QString kYouTubeSafeClients = QStringLiteral("youtube:player_client=default,-web,-web_safari");

bool isComplexSelector(const QString& format)
{
    return format.contains('/') || format.contains('+') || format.contains('[');
}

} // namespace

QString YtDlpArgsBuilder::resolveVideoFormatSelector(const DownloadRequest& request)
{
    const QString& format = request.format;
    const QString& audioFormat = request.audioFormat;
    QStringList audioIds;
    for (const QString& id : request.audioFormatIds) {
        if (!id.trimmed().isEmpty()) audioIds.append(id);
    }

    // An explicit empty audio selector keeps the video selector untouched.
    if (!format.isEmpty() && !audioFormat.isNull() && audioFormat.isEmpty()) return format;
    if (!format.isEmpty() && isComplexSelector(format)) return format;

    if (!audioIds.isEmpty()) {
        const QString baseVideo = !format.isEmpty() && format != "best" ? format : QStringLiteral("bestvideo*");
        return baseVideo + QLatin1Char('+') + audioIds.join('+');
    }

    if (format.isEmpty() || format == "best") {
        if (audioFormat == "none") return QStringLiteral("bestvideo+none");
        if (audioFormat.isEmpty() || audioFormat == "best") return QStringLiteral("bestvideo+bestaudio/best");
        return QStringLiteral("bestvideo+") + audioFormat;
    }

    if (audioFormat == "none") return format + QStringLiteral("+none");
    if (audioFormat.isEmpty() || audioFormat == "best") return format + QStringLiteral("+bestaudio/best");
    return format + QLatin1Char('+') + audioFormat;
}

QString YtDlpArgsBuilder::resolveAudioFormatSelector(const DownloadRequest& request)
{
    return request.format.isEmpty() ? QStringLiteral("bestaudio") : request.format;
}

QStringList YtDlpArgsBuilder::buildArgs(const DownloadRequest& request, const QString& downloadPath,
                                        const AppSettings& settings) const
{
    QStringList args = {
        QStringLiteral("--no-playlist"),
        QStringLiteral("--no-mtime"),
        QStringLiteral("--encoding"), QStringLiteral("utf-8"),
        QStringLiteral("--newline")
    };

    if (request.kind == MediaKind::Video) {
        const QString selector = resolveVideoFormatSelector(request);
        if (!selector.isEmpty()) args << QStringLiteral("-f") << selector;
        if (!request.audioFormatIds.isEmpty() || selector.contains("mergeall")) {
            args << QStringLiteral("--audio-multistreams");
        }
    } else {
        args << QStringLiteral("-f") << resolveAudioFormatSelector(request);
    }

    if (!request.startTime.isEmpty() || !request.endTime.isEmpty()) {
        const QString start = request.startTime.isEmpty() ? QStringLiteral("0") : request.startTime;
        args << QStringLiteral("--download-sections") << QStringLiteral("*%1-%2").arg(start, request.endTime);
    }

    const QString browser = settings.browserForCookies.trimmed();
    const QString cookiesPath = settings.cookiesPath.trimmed();
    const bool hasSubtitleAuth = (!browser.isEmpty() && browser != "none") || !cookiesPath.isEmpty();
    const bool attemptSubtitles = !utils::isBilibiliUrl(request.url) || hasSubtitleAuth;

    if (attemptSubtitles) {
        if (settings.embedSubs) args << QStringLiteral("--sub-langs") << QStringLiteral("all");
        else args << QStringLiteral("--write-subs");
        args << (settings.embedSubs ? QStringLiteral("--embed-subs") : QStringLiteral("--no-embed-subs"));
    } else {
        args << QStringLiteral("--no-embed-subs");
    }
    args << (settings.embedThumbnail ? QStringLiteral("--embed-thumbnail") : QStringLiteral("--no-embed-thumbnail"));
    args << (settings.embedMetadata ? QStringLiteral("--embed-metadata") : QStringLiteral("--no-embed-metadata"));
    args << (settings.embedChapters ? QStringLiteral("--embed-chapters") : QStringLiteral("--no-embed-chapters"));

    QString basePath = request.customDownloadPath.trimmed();
    if (basePath.isEmpty()) basePath = downloadPath.trimmed();
    if (basePath.isEmpty()) basePath = settings.downloadPath.trimmed();
    const QString filenameTemplate = utils::sanitizeFilenameTemplate(
        request.customFilenameTemplate.isEmpty() ? utils::defaultFilenameTemplate() : request.customFilenameTemplate);
    args << QStringLiteral("-o") << QDir(basePath).filePath(filenameTemplate);
    args << QStringLiteral("--continue") << QStringLiteral("--no-playlist-reverse");

#ifdef Q_OS_WIN
    args << QStringLiteral("--windows-filenames");
#endif

    appendAccessArgs(args, request.url, settings);
    args << request.url;
    return args;
}

QStringList YtDlpArgsBuilder::buildVideoInfoArgs(const QString& url, const AppSettings& settings)
{
    QStringList args = {
        QStringLiteral("-J"), QStringLiteral("--no-playlist"), QStringLiteral("--no-warnings"),
        QStringLiteral("--encoding"), QStringLiteral("utf-8")
    };
    appendAccessArgs(args, url, settings);
    args << url;
    return args;
}

QStringList YtDlpArgsBuilder::buildPlaylistInfoArgs(const QString& url, const AppSettings& settings)
{
    QStringList args = {
        QStringLiteral("-J"), QStringLiteral("--flat-playlist"), QStringLiteral("--no-warnings"),
        QStringLiteral("--encoding"), QStringLiteral("utf-8")
    };
    appendAccessArgs(args, url, settings);
    args << url;
    return args;
}

void YtDlpArgsBuilder::appendAccessArgs(QStringList& args, const QString& url, const AppSettings& settings)
{
    const QString browser = settings.browserForCookies.trimmed();
    if (!browser.isEmpty() && browser != "none") args << QStringLiteral("--cookies-from-browser") << browser;

    const QString cookiesPath = settings.cookiesPath.trimmed();
    if (!cookiesPath.isEmpty()) args << QStringLiteral("--cookies") << cookiesPath;

    const QString proxy = settings.proxy.trimmed();
    if (!proxy.isEmpty()) args << QStringLiteral("--proxy") << proxy;

    const QString configPath = utils::resolvePathWithHome(settings.configPath);
    if (!configPath.isEmpty()) {
        args << QStringLiteral("--config-location") << configPath;
    } else if (utils::isYouTubeUrl(url)) {
        args << QStringLiteral("--extractor-args") << kYouTubeSafeClients;
    }
}
