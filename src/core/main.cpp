#include <QCoreApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QTimer>

import kite.services.interfaces;
import kite.services.json_history_store;
import kite.services.settings_store;
import kite.services.watermark_transcoder;
import kite.services.ytdlp_args_builder;
import kite.services.ytdlp_info_provider;
import kite.services.ytdlp_process;
import kite.core.downloadqueue;
import kite.core.downloadengine;
import kite.core.sessionsnapshotter;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Kite"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));
    qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{if-debug}D%{endif}%{if-info}I%{endif}"
                                      "%{if-warning}W%{endif}%{if-critical}C%{endif}%{if-fatal}F%{endif} %{message}"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Queue and run media downloads through yt-dlp."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("urls"), QStringLiteral("Media or playlist URLs."), QStringLiteral("[urls...]"));

    const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                          QStringLiteral("Destination directory."), QStringLiteral("dir"));
    const QCommandLineOption concurrencyOption({QStringLiteral("j"), QStringLiteral("concurrency")},
                                               QStringLiteral("Concurrent downloads."), QStringLiteral("n"));
    const QCommandLineOption audioOption(QStringLiteral("audio"), QStringLiteral("Extract audio only."));
    const QCommandLineOption formatOption({QStringLiteral("f"), QStringLiteral("format")},
                                          QStringLiteral("Format selector."), QStringLiteral("selector"));
    const QCommandLineOption audioFormatOption(QStringLiteral("audio-format"),
                                               QStringLiteral("Audio format selector for video jobs."), QStringLiteral("selector"));
    const QCommandLineOption sectionStartOption(QStringLiteral("section-start"),
                                                QStringLiteral("Trim start (e.g. 00:01:00)."), QStringLiteral("time"));
    const QCommandLineOption sectionEndOption(QStringLiteral("section-end"),
                                              QStringLiteral("Trim end (e.g. 00:02:00)."), QStringLiteral("time"));
    const QCommandLineOption templateOption(QStringLiteral("template"),
                                            QStringLiteral("Output filename template."), QStringLiteral("template"));
    const QCommandLineOption playlistOption(QStringLiteral("playlist"), QStringLiteral("Treat URLs as playlists."));
    const QCommandLineOption startOption(QStringLiteral("start"),
                                         QStringLiteral("First playlist entry (1-based)."), QStringLiteral("index"));
    const QCommandLineOption endOption(QStringLiteral("end"),
                                       QStringLiteral("Last playlist entry (1-based)."), QStringLiteral("index"));
    const QCommandLineOption watermarkOption(QStringLiteral("watermark"), QStringLiteral("Overlay the share watermark on videos."));
    const QCommandLineOption proxyOption(QStringLiteral("proxy"), QStringLiteral("Proxy URL."), QStringLiteral("url"));
    const QCommandLineOption cookiesOption(QStringLiteral("cookies"), QStringLiteral("Cookies file."), QStringLiteral("file"));
    const QCommandLineOption dataDirOption(QStringLiteral("data-dir"),
                                           QStringLiteral("Directory for settings, history and session files."), QStringLiteral("dir"));

    parser.addOptions({outputOption, concurrencyOption, audioOption, formatOption, audioFormatOption,
                       sectionStartOption, sectionEndOption, templateOption, playlistOption, startOption,
                       endOption, watermarkOption, proxyOption, cookiesOption, dataDirOption});
    parser.process(app);

    const QString dataDir = parser.isSet(dataDirOption) ? parser.value(dataDirOption) : QString();
    auto dataFile = [&dataDir](const QString& name, const QString& fallback) {
        return dataDir.isEmpty() ? fallback : QDir(dataDir).filePath(name);
    };

    JsonSettingsStore settingsStore(dataFile(QStringLiteral("settings.json"), JsonSettingsStore::defaultFilePath()));
    AppSettings settings = settingsStore.settings();
    if (parser.isSet(outputOption)) settings.downloadPath = parser.value(outputOption);
    if (parser.isSet(concurrencyOption)) {
        bool ok = false;
        const int value = parser.value(concurrencyOption).toInt(&ok);
        if (!ok || value < 1) {
            qCritical() << "Invalid concurrency:" << parser.value(concurrencyOption);
            return 1;
        }
        settings.maxConcurrentDownloads = value;
    }
    if (parser.isSet(watermarkOption)) settings.shareWatermark = true;
    if (parser.isSet(proxyOption)) settings.proxy = parser.value(proxyOption);
    if (parser.isSet(cookiesOption)) settings.cookiesPath = parser.value(cookiesOption);
    settingsStore.setSettings(settings);

    JsonHistoryStore history(dataFile(QStringLiteral("history.json"), JsonHistoryStore::defaultFilePath()));
    YtDlpInfoProvider infoProvider;
    YtDlpArgsBuilder argsBuilder;
    YtDlpProcessRunner runner;
    WatermarkTranscoder transcoder;
    DownloadEngine engine(settingsStore, history, infoProvider, argsBuilder, runner, transcoder,
                          dataFile(QStringLiteral("session.json"), SessionSnapshotter::defaultFilePath()));

    QSet<QString> pending;
    int pendingPlaylists = 0;
    bool allSucceeded = true;
    QHash<QString, int> lastPercent;

    auto finishIfIdle = [&]() {
        if (pending.isEmpty() && pendingPlaylists == 0) {
            engine.flushSession();
            QTimer::singleShot(0, &app, [&app, &allSucceeded]() { app.exit(allSucceeded ? 0 : 1); });
        }
    };

    QObject::connect(&engine, &DownloadEngine::downloadStarted, &app, [](const QString& id) {
        qInfo().noquote() << "[" + id + "] started";
    });
    QObject::connect(&engine, &DownloadEngine::downloadProgress, &app,
                     [&lastPercent](const QString& id, const DownloadProgress& progress) {
        const int percent = int(progress.percent);
        if (lastPercent.value(id, -1) == percent) return;
        lastPercent.insert(id, percent);
        qInfo().noquote() << QStringLiteral("[%1] %2% %3 ETA %4")
                                 .arg(id).arg(percent).arg(progress.currentSpeed, progress.eta);
    });
    QObject::connect(&engine, &DownloadEngine::downloadCompleted, &app,
                     [&](const QString& id, const DownloadRecord& record) {
        qInfo().noquote() << "[" + id + "] saved" << record.savedFileName;
        pending.remove(id);
        finishIfIdle();
    });
    QObject::connect(&engine, &DownloadEngine::downloadError, &app,
                     [&](const QString& id, const QString& message) {
        qCritical().noquote() << "[" + id + "]" << message;
        allSucceeded = false;
        pending.remove(id);
        finishIfIdle();
    });
    QObject::connect(&engine, &DownloadEngine::downloadCancelled, &app, [&](const QString& id) {
        allSucceeded = false;
        pending.remove(id);
        finishIfIdle();
    });

    for (const QString& id : engine.restoreSession()) pending.insert(id);

    const QStringList urls = parser.positionalArguments();
    int counter = 0;
    for (const QString& url : urls) {
        if (parser.isSet(playlistOption)) {
            PlaylistRequest request;
            request.url = url;
            request.kind = parser.isSet(audioOption) ? MediaKind::Audio : MediaKind::Video;
            request.format = parser.value(formatOption);
            request.startIndex = parser.isSet(startOption) ? parser.value(startOption).toInt() : 1;
            request.endIndex = parser.isSet(endOption) ? parser.value(endOption).toInt() : 0;
            request.customDownloadPath = parser.value(outputOption);
            ++pendingPlaylists;
            engine.startPlaylistDownload(request, [&](const PlaylistSubmission& submission) {
                --pendingPlaylists;
                if (!submission.ok) {
                    qCritical().noquote() << "Playlist failed:" << submission.error;
                    allSucceeded = false;
                }
                for (const PlaylistSubmissionEntry& entry : submission.entries) pending.insert(entry.downloadId);
                finishIfIdle();
            });
            continue;
        }

        DownloadRequest request;
        request.url = url;
        request.kind = parser.isSet(audioOption) ? MediaKind::Audio : MediaKind::Video;
        request.format = parser.value(formatOption);
        if (parser.isSet(audioFormatOption)) request.audioFormat = parser.value(audioFormatOption);
        else if (request.kind == MediaKind::Audio) request.audioFormat = request.format;
        request.startTime = parser.value(sectionStartOption);
        request.endTime = parser.value(sectionEndOption);
        request.customDownloadPath = parser.value(outputOption);
        request.customFilenameTemplate = parser.value(templateOption);

        const QString id = QStringLiteral("cli_%1_%2").arg(QCoreApplication::applicationPid()).arg(++counter);
        const SubmitResult result = engine.startDownload(id, request);
        if (result == SubmitResult::Queued || result == SubmitResult::Started) pending.insert(id);
        else allSucceeded = false;
    }

    if (pending.isEmpty() && pendingPlaylists == 0) {
        if (urls.isEmpty()) parser.showHelp(0);
        return allSucceeded ? 0 : 1;
    }

    const int code = app.exec();
    engine.shutdown();
    return code;
}
