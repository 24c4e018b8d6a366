/*!
 * @file        ytdlp_process.cppm
 * @brief       QProcess-backed fetcher process and its runner.
 * @details     Runs yt-dlp with merged output channels, splits the stream into
 *              lines (carriage returns count as line breaks) and turns each
 *              line into typed signals: progress lines become ProgressEvent
 *              values and "[type] text" lines become events. The raw text is
 *              forwarded unchanged for the per-job log.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module kite.services.ytdlp_process;
import kite.services.interfaces;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT class YtDlpProcess : public DownloadProcess {

    Q_OBJECT

public:
    /**
     * @brief Construct a process handle; nothing runs until start().
     * @param program Fetcher executable.
     * @param args Arguments.
     * @param parent Optional parent QObject.
     */
    YtDlpProcess(const QString& program, const QStringList& args, QObject* parent = nullptr);
    ~YtDlpProcess() override;

    void start() override;
    void terminate() override;

    /**
     * @brief Parses a "[download]  42.0% of ~10.00MiB at 1.00MiB/s ETA 00:05" line.
     * @param line One output line.
     * @param event Receives the parsed values.
     * @return True if @p line is a progress line.
     */
    static bool parseProgressLine(const QString& line, ProgressEvent* event);

    /**
     * @brief Parses a "[type] text" line.
     * @param line One output line.
     * @param type Receives the lowercased type.
     * @param text Receives the text after the tag.
     * @return True if @p line carries a tag.
     */
    static bool parseEventLine(const QString& line, QString* type, QString* text);

private:
    void onReadyRead();
    void onFinished(int exitCode, QProcess::ExitStatus status);
    void onError(QProcess::ProcessError error);
    void consume(const QString& text, bool flushTail);
    void handleLine(const QString& line);

    QString m_program;              //!< Executable.
    QStringList m_args;             //!< Arguments.
    QPointer<QProcess> m_process;   //!< Child process.
    QString m_pending;              //!< Incomplete trailing line.
    bool m_finished = false;        //!< Terminal signal emitted.
};

KITE_MODULE_EXPORT class YtDlpProcessRunner : public ProcessRunner {
public:
    DownloadProcess* spawn(const QString& program, const QStringList& args, QObject* parent) override;
    QString program(const AppSettings& settings) const override;
};

#include "ytdlp_process.moc"
