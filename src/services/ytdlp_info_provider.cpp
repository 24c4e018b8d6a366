module;
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <functional>
#include <utility>

module kite.services.ytdlp_info_provider;

import kite.services.interfaces;
import kite.services.ytdlp_args_builder;

namespace {

QString programFor(const AppSettings& settings)
{
    return settings.ytDlpPath.isEmpty() ? QStringLiteral("yt-dlp") : settings.ytDlpPath;
}

MediaFormat parseFormat(const QJsonObject& obj, int duration)
{
    MediaFormat format;
    format.formatId = obj.value("format_id").toString();
    format.ext = obj.value("ext").toString();
    format.videoExt = obj.value("video_ext").toString();
    format.width = obj.value("width").toInt(0);
    format.height = obj.value("height").toInt(0);
    format.fps = obj.value("fps").toDouble(0.0);
    format.vcodec = obj.value("vcodec").toString();
    format.acodec = obj.value("acodec").toString();
    format.filesize = static_cast<qint64>(obj.value("filesize").toDouble(0));
    format.filesizeApprox = static_cast<qint64>(obj.value("filesize_approx").toDouble(0));
    format.tbr = obj.value("tbr").toDouble(0.0);
    format.formatNote = obj.value("format_note").toString();
    if (format.filesize <= 0 && format.filesizeApprox <= 0 && format.tbr > 0 && duration > 0) {
        format.filesizeApprox = static_cast<qint64>(format.tbr * 1000.0 / 8.0 * duration);
    }
    return format;
}

} // namespace

YtDlpInfoProvider::YtDlpInfoProvider(QObject* parent)
    : QObject(parent)
{
}

void YtDlpInfoProvider::fetchMetadata(const QString& url, const AppSettings& settings,
                                      std::function<void(const MetadataResult&)> callback)
{
    runJsonQuery(programFor(settings), YtDlpArgsBuilder::buildVideoInfoArgs(url, settings),
                 [callback = std::move(callback)](bool ok, const QJsonObject& root, const QString& error) {
        MetadataResult result;
        result.ok = ok;
        result.error = error;
        if (ok) result.info = parseMediaInfo(root);
        if (callback) callback(result);
    });
}

void YtDlpInfoProvider::fetchPlaylist(const QString& url, const AppSettings& settings,
                                      std::function<void(const PlaylistResult&)> callback)
{
    runJsonQuery(programFor(settings), YtDlpArgsBuilder::buildPlaylistInfoArgs(url, settings),
                 [callback = std::move(callback)](bool ok, const QJsonObject& root, const QString& error) {
        PlaylistResult result;
        result.ok = ok;
        result.error = error;
        if (ok) result.info = parsePlaylistInfo(root);
        if (callback) callback(result);
    });
}

MediaInfo YtDlpInfoProvider::parseMediaInfo(const QJsonObject& obj)
{
    MediaInfo info;
    info.id = obj.value("id").toString();
    info.title = obj.value("title").toString();
    info.thumbnail = obj.value("thumbnail").toString();
    info.duration = static_cast<int>(obj.value("duration").toDouble(0));
    info.uploader = obj.value("uploader").toString();
    if (info.uploader.isEmpty()) info.uploader = obj.value("channel").toString();
    info.description = obj.value("description").toString();
    info.viewCount = static_cast<qint64>(obj.value("view_count").toDouble(0));
    info.extractorKey = obj.value("extractor_key").toString();
    info.webpageUrl = obj.value("webpage_url").toString();

    const QJsonArray formats = obj.value("formats").toArray();
    for (const QJsonValue& v : formats) {
        if (!v.isObject()) continue;
        info.formats.append(parseFormat(v.toObject(), info.duration));
    }
    return info;
}

PlaylistInfo YtDlpInfoProvider::parsePlaylistInfo(const QJsonObject& obj)
{
    PlaylistInfo info;
    info.id = obj.value("id").toString();
    info.title = obj.value("title").toString();

    const QJsonArray entries = obj.value("entries").toArray();
    int index = 0;
    for (const QJsonValue& v : entries) {
        ++index;
        if (!v.isObject()) continue;
        const QJsonObject e = v.toObject();
        PlaylistEntry entry;
        entry.id = e.value("id").toString();
        entry.title = e.value("title").toString();
        entry.url = e.value("url").toString();
        if (entry.url.isEmpty()) entry.url = e.value("webpage_url").toString();
        if (entry.url.isEmpty() && !entry.id.isEmpty()
            && e.value("ie_key").toString().compare("Youtube", Qt::CaseInsensitive) == 0) {
            entry.url = QStringLiteral("https://www.youtube.com/watch?v=%1").arg(entry.id);
        }
        entry.index = index;
        info.entries.append(entry);
    }
    return info;
}

void YtDlpInfoProvider::runJsonQuery(const QString& program, const QStringList& args,
                                     std::function<void(bool, const QJsonObject&, const QString&)> done)
{
    auto* proc = new QProcess(this);
    proc->setProcessChannelMode(QProcess::SeparateChannels);

    connect(proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this,
            [proc, done](int exitCode, QProcess::ExitStatus status) {
        const QByteArray out = proc->readAllStandardOutput();
        const QString err = QString::fromUtf8(proc->readAllStandardError()).trimmed();
        proc->deleteLater();

        if (status != QProcess::NormalExit || exitCode != 0) {
            done(false, QJsonObject(), err.isEmpty()
                 ? QStringLiteral("yt-dlp exited with code %1").arg(exitCode)
                 : err);
            return;
        }
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(out, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            done(false, QJsonObject(), QStringLiteral("Invalid metadata JSON: %1").arg(parseError.errorString()));
            return;
        }
        done(true, doc.object(), QString());
    });

    connect(proc, &QProcess::errorOccurred, this, [proc, done](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) return;
        const QString message = proc->errorString();
        proc->deleteLater();
        done(false, QJsonObject(), message);
    });

    proc->start(program, args);
}
