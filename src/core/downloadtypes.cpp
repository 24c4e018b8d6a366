module;
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <optional>

module kite.core.downloadtypes;

namespace {

QJsonArray toJsonArray(const QStringList& values)
{
    QJsonArray arr;
    for (const QString& v : values) arr.append(v);
    return arr;
}

QStringList toStringList(const QJsonValue& value)
{
    QStringList out;
    const QJsonArray arr = value.toArray();
    for (const QJsonValue& v : arr) {
        if (v.isString()) out.append(v.toString());
    }
    return out;
}

qint64 toInt64(const QJsonValue& value, qint64 fallback = 0)
{
    if (!value.isDouble()) return fallback;
    return static_cast<qint64>(value.toDouble());
}

QJsonObject progressToJson(const DownloadProgress& progress)
{
    QJsonObject obj;
    obj.insert("percent", progress.percent);
    if (!progress.currentSpeed.isEmpty()) obj.insert("currentSpeed", progress.currentSpeed);
    if (!progress.eta.isEmpty()) obj.insert("eta", progress.eta);
    if (!progress.downloaded.isEmpty()) obj.insert("downloaded", progress.downloaded);
    if (!progress.total.isEmpty()) obj.insert("total", progress.total);
    return obj;
}

DownloadProgress progressFromJson(const QJsonObject& obj)
{
    DownloadProgress progress;
    progress.percent = obj.value("percent").toDouble(0.0);
    progress.currentSpeed = obj.value("currentSpeed").toString();
    progress.eta = obj.value("eta").toString();
    progress.downloaded = obj.value("downloaded").toString();
    progress.total = obj.value("total").toString();
    return progress;
}

} // namespace

QString mediaKindToString(MediaKind kind)
{
    return kind == MediaKind::Audio ? QStringLiteral("audio") : QStringLiteral("video");
}

MediaKind mediaKindFromString(const QString& value)
{
    return value.trimmed().compare("audio", Qt::CaseInsensitive) == 0 ? MediaKind::Audio : MediaKind::Video;
}

QString statusToString(DownloadStatus status)
{
    switch (status) {
    case DownloadStatus::Pending: return QStringLiteral("pending");
    case DownloadStatus::Downloading: return QStringLiteral("downloading");
    case DownloadStatus::Processing: return QStringLiteral("processing");
    case DownloadStatus::Completed: return QStringLiteral("completed");
    case DownloadStatus::Error: return QStringLiteral("error");
    case DownloadStatus::Cancelling: return QStringLiteral("cancelling");
    case DownloadStatus::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("pending");
}

DownloadStatus statusFromString(const QString& value, DownloadStatus fallback)
{
    const QString v = value.trimmed().toLower();
    if (v == "pending") return DownloadStatus::Pending;
    if (v == "downloading") return DownloadStatus::Downloading;
    if (v == "processing") return DownloadStatus::Processing;
    if (v == "completed") return DownloadStatus::Completed;
    if (v == "error") return DownloadStatus::Error;
    if (v == "cancelling") return DownloadStatus::Cancelling;
    if (v == "cancelled") return DownloadStatus::Cancelled;
    return fallback;
}

bool isTerminalStatus(DownloadStatus status)
{
    return status == DownloadStatus::Completed
        || status == DownloadStatus::Error
        || status == DownloadStatus::Cancelled;
}

bool RecordPatch::isEmpty() const
{
    return !title && !thumbnail && !duration && !uploader && !description && !viewCount
        && !status && !progress && !speed && !startedAt && !completedAt && !selectedFormat
        && !formatExtension && !savedFileName && !fileSize && !error && !command && !log;
}

bool RecordPatch::touchesHistory() const
{
    return title || thumbnail || duration || uploader || description || viewCount
        || status || startedAt || completedAt || selectedFormat || formatExtension
        || savedFileName || fileSize || error || command;
}

void applyPatch(DownloadRecord& record, const RecordPatch& patch)
{
    if (patch.title) record.title = *patch.title;
    if (patch.thumbnail) record.thumbnail = *patch.thumbnail;
    if (patch.duration) record.duration = *patch.duration;
    if (patch.uploader) record.uploader = *patch.uploader;
    if (patch.description) record.description = *patch.description;
    if (patch.viewCount) record.viewCount = *patch.viewCount;
    if (patch.status) record.status = *patch.status;
    if (patch.progress) record.progress = *patch.progress;
    if (patch.speed) record.speed = *patch.speed;
    if (patch.startedAt) record.startedAt = *patch.startedAt;
    if (patch.completedAt) record.completedAt = *patch.completedAt;
    if (patch.selectedFormat) record.selectedFormat = *patch.selectedFormat;
    if (patch.formatExtension) record.formatExtension = *patch.formatExtension;
    if (patch.savedFileName) record.savedFileName = *patch.savedFileName;
    if (patch.fileSize) record.fileSize = *patch.fileSize;
    if (patch.error) record.error = *patch.error;
    if (patch.command) record.command = *patch.command;
    if (patch.log) record.log = *patch.log;
}

QJsonObject requestToJson(const DownloadRequest& request)
{
    QJsonObject obj;
    obj.insert("url", request.url);
    obj.insert("type", mediaKindToString(request.kind));
    if (!request.format.isEmpty()) obj.insert("format", request.format);
    // Null and empty audio selectors mean different things.
    if (!request.audioFormat.isNull()) obj.insert("audioFormat", request.audioFormat);
    if (!request.audioFormatIds.isEmpty()) obj.insert("audioFormatIds", toJsonArray(request.audioFormatIds));
    if (!request.startTime.isEmpty()) obj.insert("startTime", request.startTime);
    if (!request.endTime.isEmpty()) obj.insert("endTime", request.endTime);
    if (!request.customDownloadPath.isEmpty()) obj.insert("customDownloadPath", request.customDownloadPath);
    if (!request.customFilenameTemplate.isEmpty()) obj.insert("customFilenameTemplate", request.customFilenameTemplate);
    if (!request.tags.isEmpty()) obj.insert("tags", toJsonArray(request.tags));
    obj.insert("origin", request.origin);
    if (!request.subscriptionId.isEmpty()) obj.insert("subscriptionId", request.subscriptionId);
    if (!request.playlistId.isEmpty()) {
        obj.insert("playlistId", request.playlistId);
        obj.insert("playlistTitle", request.playlistTitle);
        obj.insert("playlistIndex", request.playlistIndex);
        obj.insert("playlistSize", request.playlistSize);
    }
    return obj;
}

DownloadRequest requestFromJson(const QJsonObject& obj)
{
    DownloadRequest request;
    request.url = obj.value("url").toString();
    request.kind = mediaKindFromString(obj.value("type").toString());
    request.format = obj.value("format").toString();
    if (obj.contains("audioFormat")) {
        const QString audio = obj.value("audioFormat").toString();
        request.audioFormat = audio.isNull() ? QStringLiteral("") : audio;
    }
    request.audioFormatIds = toStringList(obj.value("audioFormatIds"));
    request.startTime = obj.value("startTime").toString();
    request.endTime = obj.value("endTime").toString();
    request.customDownloadPath = obj.value("customDownloadPath").toString();
    request.customFilenameTemplate = obj.value("customFilenameTemplate").toString();
    request.tags = toStringList(obj.value("tags"));
    request.origin = obj.value("origin").toString(QStringLiteral("manual"));
    request.subscriptionId = obj.value("subscriptionId").toString();
    request.playlistId = obj.value("playlistId").toString();
    request.playlistTitle = obj.value("playlistTitle").toString();
    request.playlistIndex = obj.value("playlistIndex").toInt(0);
    request.playlistSize = obj.value("playlistSize").toInt(0);
    return request;
}

QJsonObject recordToJson(const DownloadRecord& record)
{
    QJsonObject obj;
    obj.insert("id", record.id);
    obj.insert("url", record.url);
    obj.insert("type", mediaKindToString(record.kind));
    obj.insert("title", record.title);
    if (!record.thumbnail.isEmpty()) obj.insert("thumbnail", record.thumbnail);
    if (record.duration > 0) obj.insert("duration", record.duration);
    if (!record.uploader.isEmpty()) obj.insert("uploader", record.uploader);
    if (!record.description.isEmpty()) obj.insert("description", record.description);
    if (record.viewCount > 0) obj.insert("viewCount", static_cast<double>(record.viewCount));
    obj.insert("status", statusToString(record.status));
    obj.insert("progress", progressToJson(record.progress));
    if (!record.speed.isEmpty()) obj.insert("speed", record.speed);
    obj.insert("createdAt", static_cast<double>(record.createdAt));
    if (record.startedAt > 0) obj.insert("startedAt", static_cast<double>(record.startedAt));
    if (record.completedAt > 0) obj.insert("completedAt", static_cast<double>(record.completedAt));
    if (!record.selectedFormat.isEmpty()) obj.insert("selectedFormat", record.selectedFormat);
    if (!record.formatExtension.isEmpty()) obj.insert("formatExtension", record.formatExtension);
    if (!record.savedFileName.isEmpty()) obj.insert("savedFileName", record.savedFileName);
    if (record.fileSize >= 0) obj.insert("fileSize", static_cast<double>(record.fileSize));
    if (!record.error.isEmpty()) obj.insert("error", record.error);
    if (!record.command.isEmpty()) obj.insert("ytDlpCommand", record.command);
    if (!record.log.isEmpty()) obj.insert("ytDlpLog", record.log);
    if (!record.tags.isEmpty()) obj.insert("tags", toJsonArray(record.tags));
    obj.insert("origin", record.origin);
    if (!record.subscriptionId.isEmpty()) obj.insert("subscriptionId", record.subscriptionId);
    if (!record.playlistId.isEmpty()) {
        obj.insert("playlistId", record.playlistId);
        obj.insert("playlistTitle", record.playlistTitle);
        obj.insert("playlistIndex", record.playlistIndex);
        obj.insert("playlistSize", record.playlistSize);
    }
    return obj;
}

DownloadRecord recordFromJson(const QJsonObject& obj)
{
    DownloadRecord record;
    record.id = obj.value("id").toString();
    record.url = obj.value("url").toString();
    record.kind = mediaKindFromString(obj.value("type").toString());
    record.title = obj.value("title").toString();
    record.thumbnail = obj.value("thumbnail").toString();
    record.duration = obj.value("duration").toInt(0);
    record.uploader = obj.value("uploader").toString();
    record.description = obj.value("description").toString();
    record.viewCount = toInt64(obj.value("viewCount"));
    record.status = statusFromString(obj.value("status").toString());
    record.progress = progressFromJson(obj.value("progress").toObject());
    record.speed = obj.value("speed").toString();
    record.createdAt = toInt64(obj.value("createdAt"));
    record.startedAt = toInt64(obj.value("startedAt"));
    record.completedAt = toInt64(obj.value("completedAt"));
    record.selectedFormat = obj.value("selectedFormat").toString();
    record.formatExtension = obj.value("formatExtension").toString();
    record.savedFileName = obj.value("savedFileName").toString();
    record.fileSize = toInt64(obj.value("fileSize"), -1);
    record.error = obj.value("error").toString();
    record.command = obj.value("ytDlpCommand").toString();
    record.log = obj.value("ytDlpLog").toString();
    record.tags = toStringList(obj.value("tags"));
    record.origin = obj.value("origin").toString(QStringLiteral("manual"));
    record.subscriptionId = obj.value("subscriptionId").toString();
    record.playlistId = obj.value("playlistId").toString();
    record.playlistTitle = obj.value("playlistTitle").toString();
    record.playlistIndex = obj.value("playlistIndex").toInt(0);
    record.playlistSize = obj.value("playlistSize").toInt(0);
    return record;
}

QJsonObject historyToJson(const HistoryItem& item)
{
    QJsonObject obj = recordToJson(item.record);
    // The fetcher log is runtime-only.
    obj.remove("ytDlpLog");
    obj.remove("progress");
    obj.remove("speed");
    obj.insert("downloadPath", item.downloadPath);
    obj.insert("downloadedAt", static_cast<double>(item.downloadedAt));
    return obj;
}

HistoryItem historyFromJson(const QJsonObject& obj)
{
    HistoryItem item;
    item.record = recordFromJson(obj);
    item.downloadPath = obj.value("downloadPath").toString();
    item.downloadedAt = toInt64(obj.value("downloadedAt"));
    return item;
}

AppSettings settingsFromJson(const QJsonObject& obj, const AppSettings& defaults)
{
    AppSettings s = defaults;
    s.downloadPath = obj.value("downloadPath").toString(defaults.downloadPath);
    s.maxConcurrentDownloads = qMax(1, obj.value("maxConcurrentDownloads").toInt(defaults.maxConcurrentDownloads));
    s.browserForCookies = obj.value("browserForCookies").toString(defaults.browserForCookies);
    s.cookiesPath = obj.value("cookiesPath").toString(defaults.cookiesPath);
    s.proxy = obj.value("proxy").toString(defaults.proxy);
    s.configPath = obj.value("configPath").toString(defaults.configPath);
    s.qualityPreset = obj.value("oneClickQuality").toString(defaults.qualityPreset);
    s.shareWatermark = obj.value("shareWatermark").toBool(defaults.shareWatermark);
    s.embedSubs = obj.value("embedSubs").toBool(defaults.embedSubs);
    s.embedThumbnail = obj.value("embedThumbnail").toBool(defaults.embedThumbnail);
    s.embedMetadata = obj.value("embedMetadata").toBool(defaults.embedMetadata);
    s.embedChapters = obj.value("embedChapters").toBool(defaults.embedChapters);
    s.ytDlpPath = obj.value("ytDlpPath").toString(defaults.ytDlpPath);
    s.ffmpegPath = obj.value("ffmpegPath").toString(defaults.ffmpegPath);
    return s;
}

QJsonObject settingsToJson(const AppSettings& settings)
{
    QJsonObject obj;
    obj.insert("downloadPath", settings.downloadPath);
    obj.insert("maxConcurrentDownloads", settings.maxConcurrentDownloads);
    obj.insert("browserForCookies", settings.browserForCookies);
    obj.insert("cookiesPath", settings.cookiesPath);
    obj.insert("proxy", settings.proxy);
    obj.insert("configPath", settings.configPath);
    obj.insert("oneClickQuality", settings.qualityPreset);
    obj.insert("shareWatermark", settings.shareWatermark);
    obj.insert("embedSubs", settings.embedSubs);
    obj.insert("embedThumbnail", settings.embedThumbnail);
    obj.insert("embedMetadata", settings.embedMetadata);
    obj.insert("embedChapters", settings.embedChapters);
    obj.insert("ytDlpPath", settings.ytDlpPath);
    obj.insert("ffmpegPath", settings.ffmpegPath);
    return obj;
}
