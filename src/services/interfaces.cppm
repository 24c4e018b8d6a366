/*!
 * @file        interfaces.cppm
 * @brief       Collaborator interfaces consumed by the download engine.
 * @details     The engine reaches every external system through one of the
 *              abstract classes declared here: user settings, the history
 *              store, the metadata provider, the fetcher argument builder,
 *              the process runner and the post-processing transcoder.
 *
 *              Asynchronous operations complete through a callback invoked on
 *              the thread that owns the collaborator. Callers guard their own
 *              lifetime (QPointer) inside the callback.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include <functional>
#include <optional>

#ifndef Q_MOC_RUN
export module kite.services.interfaces;
export import kite.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT struct MetadataResult {
    bool ok = false;        //!< True on success.
    MediaInfo info;         //!< Parsed metadata.
    QString error;          //!< Failure message.
};

KITE_MODULE_EXPORT struct PlaylistResult {
    bool ok = false;        //!< True on success.
    PlaylistInfo info;      //!< Flat playlist listing.
    QString error;          //!< Failure message.
};

/**
 * @brief One parsed progress line of the fetcher.
 */
KITE_MODULE_EXPORT struct ProgressEvent {
    double percent = 0.0;   //!< Raw per-part percentage.
    QString currentSpeed;   //!< e.g. "1.00MiB/s".
    QString eta;            //!< e.g. "00:05".
    QString downloaded;     //!< e.g. "5.00MiB".
    QString total;          //!< e.g. "~10.00MiB".
};

KITE_MODULE_EXPORT struct TranscodeRequest {
    QString inputPath;      //!< Artifact to transform.
    QString executable;     //!< Resolved transcoder executable.
    QString title;          //!< Media title.
    QString author;         //!< Uploader.
};

KITE_MODULE_EXPORT struct TranscodeResult {
    bool ok = false;        //!< True if @c outputPath holds the transformed artifact.
    QString outputPath;     //!< Final artifact path.
    qint64 fileSize = -1;   //!< Final artifact size.
    QString error;          //!< Failure message.
};

/**
 * @brief Read access to the user settings.
 */
KITE_MODULE_EXPORT class SettingsProvider {
public:
    virtual ~SettingsProvider() = default;
    virtual AppSettings settings() const = 0;
};

/**
 * @brief Durable store of history rows keyed by job id.
 */
KITE_MODULE_EXPORT class HistoryStore {
public:
    virtual ~HistoryStore() = default;

    virtual std::optional<HistoryItem> getById(const QString& id) const = 0;

    /**
     * @brief Inserts or replaces a row.
     */
    virtual void put(const HistoryItem& item) = 0;

    virtual bool remove(const QString& id) = 0;

    /**
     * @return Number of rows removed.
     */
    virtual int removeMany(const QStringList& ids) = 0;

    virtual QVector<HistoryItem> items() const = 0;
};

/**
 * @brief Metadata source for single items and playlists.
 */
KITE_MODULE_EXPORT class InfoProvider {
public:
    virtual ~InfoProvider() = default;
    virtual void fetchMetadata(const QString& url, const AppSettings& settings,
                               std::function<void(const MetadataResult&)> callback) = 0;
    virtual void fetchPlaylist(const QString& url, const AppSettings& settings,
                               std::function<void(const PlaylistResult&)> callback) = 0;
};

/**
 * @brief Builds the fetcher argument vector; the URL is always the last element.
 */
KITE_MODULE_EXPORT class ArgumentBuilder {
public:
    virtual ~ArgumentBuilder() = default;
    virtual QStringList buildArgs(const DownloadRequest& request, const QString& downloadPath,
                                  const AppSettings& settings) const = 0;
};

/**
 * @brief Handle of one running fetcher process.
 *
 * Signals are delivered in the order the process produced its output;
 * exactly one of exited() or failed() ends the stream.
 */
KITE_MODULE_EXPORT class DownloadProcess : public QObject {

    Q_OBJECT

public:
    explicit DownloadProcess(QObject* parent = nullptr) : QObject(parent) {}
    ~DownloadProcess() override = default;

    /**
     * @brief Starts the process.
     */
    virtual void start() = 0;

    /**
     * @brief Asks the process to stop; exited() or failed() still follows.
     */
    virtual void terminate() = 0;

signals:
    void outputReceived(const QString& text);                       //!< Raw stdout/stderr chunk.
    void progressReported(const ProgressEvent& event);              //!< Parsed progress line.
    void eventReported(const QString& type, const QString& text);   //!< "[type] text" line.
    void exited(int exitCode);                                      //!< Process finished.
    void failed(const QString& message);                            //!< Process could not run.
};

/**
 * @brief Factory of fetcher processes.
 */
KITE_MODULE_EXPORT class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Creates a process handle; the caller starts it.
     * @param program Executable.
     * @param args Arguments.
     * @param parent QObject owner of the handle.
     */
    virtual DownloadProcess* spawn(const QString& program, const QStringList& args, QObject* parent) = 0;

    /**
     * @brief Fetcher executable for the given settings.
     */
    virtual QString program(const AppSettings& settings) const = 0;
};

/**
 * @brief Post-processing step applied to finished artifacts.
 */
KITE_MODULE_EXPORT class Transcoder {
public:
    virtual ~Transcoder() = default;

    /**
     * @brief Resolves the transcoder executable.
     * @param settings User settings.
     * @param error Receives the failure message.
     * @return Executable path, or an empty string on failure.
     */
    virtual QString locateExecutable(const AppSettings& settings, QString* error) const = 0;

    virtual void transform(const TranscodeRequest& request,
                           std::function<void(const TranscodeResult&)> callback) = 0;
};

#include "interfaces.moc"
