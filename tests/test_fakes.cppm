/*!
 * @file        test_fakes.cppm
 * @brief       In-process collaborators for engine tests.
 * @details     Scriptable replacements for the metadata provider, argument
 *              builder, process runner and transcoder, plus an event loop
 *              helper for waiting on queued signals.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QHash>
#include <QMetaObject>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>
#include <utility>

#ifndef Q_MOC_RUN
export module kite.tests.fakes;
export import kite.services.interfaces;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

/**
 * @brief Spins the event loop until @p predicate holds or @p timeoutMs elapses.
 */
KITE_MODULE_EXPORT inline bool waitUntil(const std::function<bool()>& predicate, int timeoutMs = 2000)
{
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeoutMs) return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
    }
    return true;
}

/**
 * @brief Runs pending events for @p ms milliseconds.
 */
KITE_MODULE_EXPORT inline void spinFor(int ms)
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < ms) QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
}

KITE_MODULE_EXPORT class FakeSettings : public SettingsProvider {
public:
    AppSettings settings() const override { return value; }
    AppSettings value;
};

KITE_MODULE_EXPORT class FakeInfoProvider : public InfoProvider {
public:
    void fetchMetadata(const QString& url, const AppSettings&,
                       std::function<void(const MetadataResult&)> callback) override
    {
        ++metadataCalls;
        const MetadataResult result = metadata.value(url, fallback);
        if (deferred) {
            pending.append([callback, result]() { callback(result); });
            return;
        }
        callback(result);
    }

    void fetchPlaylist(const QString&, const AppSettings&,
                       std::function<void(const PlaylistResult&)> callback) override
    {
        callback(playlist);
    }

    /**
     * @brief Delivers every deferred metadata result.
     */
    void settle()
    {
        auto calls = std::move(pending);
        pending.clear();
        for (const auto& call : calls) call();
    }

    QHash<QString, MetadataResult> metadata;    //!< Results by URL.
    MetadataResult fallback;                    //!< Result for unknown URLs (failure).
    PlaylistResult playlist;                    //!< Playlist listing.
    bool deferred = false;                      //!< Hold results until settle().
    int metadataCalls = 0;
    QVector<std::function<void()>> pending;
};

/**
 * @brief Argument builder producing a minimal argv: -f, -o and the URL.
 */
KITE_MODULE_EXPORT class FakeArgumentBuilder : public ArgumentBuilder {
public:
    QStringList buildArgs(const DownloadRequest& request, const QString& downloadPath,
                          const AppSettings&) const override
    {
        QStringList args;
        args << QStringLiteral("-f") << (request.format.isEmpty() ? QStringLiteral("best") : request.format);
        args << QStringLiteral("-o") << downloadPath;
        if (!dropUrl) args << request.url;
        return args;
    }

    bool dropUrl = false;   //!< Omit the trailing URL.
};

KITE_MODULE_EXPORT class FakeProcess : public DownloadProcess {

    Q_OBJECT

public:
    FakeProcess(const QString& program, const QStringList& args, QObject* parent)
        : DownloadProcess(parent)
        , program(program)
        , args(args)
    {
    }

    void start() override { started = true; }

    void terminate() override
    {
        terminated = true;
        QMetaObject::invokeMethod(this, [this]() { emit exited(terminateExitCode); }, Qt::QueuedConnection);
    }

    QString url() const { return args.isEmpty() ? QString() : args.last(); }

    void output(const QString& text) { emit outputReceived(text); }

    void progress(double percent, const QString& total = QString(), const QString& speed = QString())
    {
        ProgressEvent event;
        event.percent = percent;
        event.total = total;
        event.currentSpeed = speed;
        emit progressReported(event);
    }

    void logLine(const QString& type, const QString& text) { emit eventReported(type, text); }

    void finish(int exitCode) { emit exited(exitCode); }

    void fail(const QString& message) { emit failed(message); }

    QString program;
    QStringList args;
    bool started = false;
    bool terminated = false;
    int terminateExitCode = 143;
};

KITE_MODULE_EXPORT class FakeProcessRunner : public ProcessRunner {
public:
    DownloadProcess* spawn(const QString& program, const QStringList& args, QObject* parent) override
    {
        auto* process = new FakeProcess(program, args, parent);
        processes.append(process);
        return process;
    }

    QString program(const AppSettings&) const override { return QStringLiteral("yt-dlp"); }

    /**
     * @brief Latest live process spawned for @p url.
     */
    FakeProcess* processFor(const QString& url) const
    {
        for (auto it = processes.crbegin(); it != processes.crend(); ++it) {
            if (*it && (*it)->url() == url) return *it;
        }
        return nullptr;
    }

    int liveCount() const
    {
        int count = 0;
        for (const auto& process : processes) {
            if (process) ++count;
        }
        return count;
    }

    QVector<QPointer<FakeProcess>> processes;
};

KITE_MODULE_EXPORT class FakeTranscoder : public Transcoder {
public:
    QString locateExecutable(const AppSettings&, QString* error) const override
    {
        if (executable.isEmpty() && error) *error = locateError;
        return executable;
    }

    void transform(const TranscodeRequest& request, std::function<void(const TranscodeResult&)> callback) override
    {
        requests.append(request);
        if (deferred) {
            const TranscodeResult held = result;
            pending.append([callback, held]() { callback(held); });
            return;
        }
        callback(result);
    }

    /**
     * @brief Delivers every deferred transform result.
     */
    void settle()
    {
        auto calls = std::move(pending);
        pending.clear();
        for (const auto& call : calls) call();
    }

    QString executable = QStringLiteral("/opt/ffmpeg/bin/ffmpeg");
    QString locateError = QStringLiteral("ffmpeg executable could not be located");
    TranscodeResult result;
    QVector<TranscodeRequest> requests;
    bool deferred = false;                      //!< Hold results until settle().
    QVector<std::function<void()>> pending;
};

#include "test_fakes.moc"
