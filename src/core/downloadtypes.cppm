/*!
 * @file        downloadtypes.cppm
 * @brief       Value types shared by the download orchestration core.
 * @details     Declares the request, record, history, metadata and settings
 *              value types used across the queue, the execution engine, the
 *              session snapshotter and the external collaborators.
 *
 *              Every persisted type provides a JSON conversion pair so that
 *              the session file, the history file and the settings file share
 *              one field naming scheme.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include <optional>

#ifndef Q_MOC_RUN
export module kite.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

/**
 * @brief Kind of media a job produces.
 */
KITE_MODULE_EXPORT enum class MediaKind {
    Video,      //!< Video stream, optionally merged with audio.
    Audio       //!< Audio-only extraction.
};

/**
 * @brief Observable lifecycle status of a download job.
 */
KITE_MODULE_EXPORT enum class DownloadStatus {
    Pending,        //!< Submitted, waiting for a slot or for metadata.
    Downloading,    //!< External fetcher is transferring data.
    Processing,     //!< Merging, post-processing or transcoding.
    Completed,      //!< Artifact resolved and recorded.
    Error,          //!< Terminal failure.
    Cancelling,     //!< Cancel requested, process not yet exited.
    Cancelled       //!< Cancelled by the user.
};

KITE_MODULE_EXPORT QString mediaKindToString(MediaKind kind);
KITE_MODULE_EXPORT MediaKind mediaKindFromString(const QString& value);

KITE_MODULE_EXPORT QString statusToString(DownloadStatus status);

/**
 * @brief Parses a status string.
 * @param value Status name as written by statusToString().
 * @param fallback Returned for unknown names.
 */
KITE_MODULE_EXPORT DownloadStatus statusFromString(const QString& value, DownloadStatus fallback = DownloadStatus::Pending);

/**
 * @brief True for statuses a job never leaves (completed, error, cancelled).
 */
KITE_MODULE_EXPORT bool isTerminalStatus(DownloadStatus status);

/**
 * @brief Immutable description of what to fetch and how.
 *
 * A null @c audioFormat means the caller did not choose one; an empty but
 * non-null value means the caller explicitly asked for no separate audio.
 */
KITE_MODULE_EXPORT struct DownloadRequest {
    QString url;                            //!< Source URL.
    MediaKind kind = MediaKind::Video;      //!< Video or audio job.
    QString format;                         //!< Format selector expression.
    QString audioFormat;                    //!< Audio selector (null = unspecified).
    QStringList audioFormatIds;             //!< Secondary audio stream ids.
    QString startTime;                      //!< Trim start marker.
    QString endTime;                        //!< Trim end marker.
    QString customDownloadPath;             //!< Destination directory override.
    QString customFilenameTemplate;         //!< Filename template override.
    QStringList tags;                       //!< Free-form labels.
    QString origin = QStringLiteral("manual");  //!< manual or subscription.
    QString subscriptionId;                 //!< Owning subscription, if any.

    QString playlistId;                     //!< Playlist group id.
    QString playlistTitle;                  //!< Playlist title.
    int playlistIndex = 0;                  //!< 1-based position inside the playlist.
    int playlistSize = 0;                   //!< Number of selected playlist entries.
};

/**
 * @brief Latest blended progress snapshot of a job.
 */
KITE_MODULE_EXPORT struct DownloadProgress {
    double percent = 0.0;   //!< Blended percentage in [0,100].
    QString currentSpeed;   //!< Speed text as reported by the fetcher.
    QString eta;            //!< ETA text as reported by the fetcher.
    QString downloaded;     //!< Downloaded size text.
    QString total;          //!< Total size text.
};

/**
 * @brief Mutable, observable state of one submitted job.
 */
KITE_MODULE_EXPORT struct DownloadRecord {
    QString id;                                     //!< Caller supplied id.
    QString url;                                    //!< Source URL.
    MediaKind kind = MediaKind::Video;              //!< Job kind.
    QString title;                                  //!< Display title.
    QString thumbnail;                              //!< Thumbnail URL.
    int duration = 0;                               //!< Duration in seconds.
    QString uploader;                               //!< Uploader or channel.
    QString description;                            //!< Media description.
    qint64 viewCount = 0;                           //!< View count.
    DownloadStatus status = DownloadStatus::Pending;    //!< Lifecycle status.
    DownloadProgress progress;                      //!< Latest progress.
    QString speed;                                  //!< Latest speed text.
    qint64 createdAt = 0;                           //!< Submission time (epoch ms).
    qint64 startedAt = 0;                           //!< Process start time (epoch ms).
    qint64 completedAt = 0;                         //!< Terminal time (epoch ms).
    QString selectedFormat;                         //!< Selected format id.
    QString formatExtension;                        //!< Container of the selected format.
    QString savedFileName;                          //!< Final artifact file name.
    qint64 fileSize = -1;                           //!< Final artifact size (-1 = unknown).
    QString error;                                  //!< Error message.
    QString command;                                //!< Printable fetcher invocation.
    QString log;                                    //!< Accumulated fetcher output.
    QStringList tags;                               //!< Labels copied from the request.
    QString origin = QStringLiteral("manual");      //!< Origin copied from the request.
    QString subscriptionId;                         //!< Subscription id.
    QString playlistId;                             //!< Playlist group id.
    QString playlistTitle;                          //!< Playlist title.
    int playlistIndex = 0;                          //!< Playlist position.
    int playlistSize = 0;                           //!< Playlist selection size.
};

/**
 * @brief Partial update of a DownloadRecord.
 *
 * Only engaged fields are written by applyPatch().
 */
KITE_MODULE_EXPORT struct RecordPatch {
    std::optional<QString> title;
    std::optional<QString> thumbnail;
    std::optional<int> duration;
    std::optional<QString> uploader;
    std::optional<QString> description;
    std::optional<qint64> viewCount;
    std::optional<DownloadStatus> status;
    std::optional<DownloadProgress> progress;
    std::optional<QString> speed;
    std::optional<qint64> startedAt;
    std::optional<qint64> completedAt;
    std::optional<QString> selectedFormat;
    std::optional<QString> formatExtension;
    std::optional<QString> savedFileName;
    std::optional<qint64> fileSize;
    std::optional<QString> error;
    std::optional<QString> command;
    std::optional<QString> log;

    /**
     * @brief True when no field is engaged.
     */
    bool isEmpty() const;

    /**
     * @brief True when a field persisted in history is engaged.
     *
     * Speed, progress and log are runtime-only and never trigger a history write.
     */
    bool touchesHistory() const;
};

/**
 * @brief Merges the engaged fields of @p patch into @p record.
 */
KITE_MODULE_EXPORT void applyPatch(DownloadRecord& record, const RecordPatch& patch);

/**
 * @brief Durable history row.
 */
KITE_MODULE_EXPORT struct HistoryItem {
    DownloadRecord record;      //!< Snapshot of the job record.
    QString downloadPath;       //!< Directory the artifact was written to.
    qint64 downloadedAt = 0;    //!< Last history write (epoch ms).
};

/**
 * @brief One format advertised by the metadata provider.
 */
KITE_MODULE_EXPORT struct MediaFormat {
    QString formatId;           //!< Provider format id.
    QString ext;                //!< Container extension.
    QString videoExt;           //!< Video extension ("none" for audio-only).
    int width = 0;              //!< Frame width.
    int height = 0;             //!< Frame height.
    double fps = 0.0;           //!< Frame rate.
    QString vcodec;             //!< Video codec ("none" when absent).
    QString acodec;             //!< Audio codec ("none" when absent).
    qint64 filesize = 0;        //!< Exact size in bytes.
    qint64 filesizeApprox = 0;  //!< Estimated size in bytes.
    double tbr = 0.0;           //!< Total bitrate (kbit/s).
    QString formatNote;         //!< Human readable note.
};

/**
 * @brief Metadata of a single media item.
 */
KITE_MODULE_EXPORT struct MediaInfo {
    QString id;
    QString title;
    QString thumbnail;
    int duration = 0;
    QString uploader;
    QString description;
    qint64 viewCount = 0;
    QString extractorKey;
    QString webpageUrl;
    QVector<MediaFormat> formats;
};

/**
 * @brief One entry of a playlist listing.
 */
KITE_MODULE_EXPORT struct PlaylistEntry {
    QString id;
    QString title;
    QString url;
    int index = 0;      //!< 1-based position.
};

/**
 * @brief Flat playlist listing.
 */
KITE_MODULE_EXPORT struct PlaylistInfo {
    QString id;
    QString title;
    QVector<PlaylistEntry> entries;
};

/**
 * @brief User settings consumed by the engine and the default collaborators.
 */
KITE_MODULE_EXPORT struct AppSettings {
    QString downloadPath;                                   //!< Base download directory.
    int maxConcurrentDownloads = 5;                         //!< Queue concurrency.
    QString browserForCookies = QStringLiteral("none");     //!< Browser to read cookies from.
    QString cookiesPath;                                    //!< Cookies file.
    QString proxy;                                          //!< Proxy URL.
    QString configPath;                                     //!< Fetcher config file.
    QString qualityPreset = QStringLiteral("best");         //!< best, good, normal, bad, worst.
    bool shareWatermark = false;                            //!< Overlay the share watermark.
    bool embedSubs = true;
    bool embedThumbnail = false;
    bool embedMetadata = true;
    bool embedChapters = true;
    QString ytDlpPath = QStringLiteral("yt-dlp");           //!< Fetcher executable.
    QString ffmpegPath = QStringLiteral("ffmpeg");          //!< Transcoder executable.
};

KITE_MODULE_EXPORT QJsonObject requestToJson(const DownloadRequest& request);
KITE_MODULE_EXPORT DownloadRequest requestFromJson(const QJsonObject& obj);

KITE_MODULE_EXPORT QJsonObject recordToJson(const DownloadRecord& record);
KITE_MODULE_EXPORT DownloadRecord recordFromJson(const QJsonObject& obj);

KITE_MODULE_EXPORT QJsonObject historyToJson(const HistoryItem& item);
KITE_MODULE_EXPORT HistoryItem historyFromJson(const QJsonObject& obj);

/**
 * @brief Reads settings, keeping @p defaults for every missing key.
 */
KITE_MODULE_EXPORT AppSettings settingsFromJson(const QJsonObject& obj, const AppSettings& defaults);
KITE_MODULE_EXPORT QJsonObject settingsToJson(const AppSettings& settings);
