module;
#include <QDebug>
#include <QObject>
#include <QPointer>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QVector>

module kite.core.downloadjob;

import kite.services.interfaces;
import kite.core.outputresolver;
import kite.utils.progress_utils;
import kite.utils.coalescing_timer;
import kite.utils.format_utils;

namespace utils = kite::utils;

namespace {
constexpr int kLogFlushMs = 500;
}

DownloadJob::DownloadJob(const QString& id, const DownloadRequest& request, const QString& downloadDir, QObject* parent)
    : QObject(parent)
    , m_id(id)
    , m_request(request)
    , m_blender(utils::estimateProgressParts(request))
    , m_resolver(downloadDir)
    , m_logTimer(kLogFlushMs, [this]() { flushLog(); })
{
}

DownloadJob::~DownloadJob()
{
    m_logTimer.cancel();
    if (m_process) m_process->disconnect(this);
}

void DownloadJob::setMediaInfo(const MediaInfo& info)
{
    m_title = info.title;
    m_formats = info.formats;
}

void DownloadJob::setTotalParts(int parts)
{
    m_blender.setTotalParts(parts);
}

void DownloadJob::setActualExtension(const QString& ext)
{
    m_actualExt = ext;
}

void DownloadJob::start(ProcessRunner& runner, const QString& program, const QStringList& args)
{
    if (m_state != State::Idle) return;

    const qsizetype selectorIndex = args.indexOf(QStringLiteral("-f"));
    m_willMerge = m_request.kind == MediaKind::Video
        && selectorIndex >= 0
        && selectorIndex + 1 < args.size()
        && args.at(selectorIndex + 1).contains('+');

    m_process = runner.spawn(program, args, this);
    if (!m_process) {
        m_state = State::Finished;
        emit failed(m_id, QStringLiteral("Failed to create download process"));
        return;
    }

    connect(m_process, &DownloadProcess::outputReceived, this, &DownloadJob::onOutput);
    connect(m_process, &DownloadProcess::progressReported, this, &DownloadJob::onProgress);
    connect(m_process, &DownloadProcess::eventReported, this, &DownloadJob::onEvent);
    connect(m_process, &DownloadProcess::exited, this, &DownloadJob::onExited);
    connect(m_process, &DownloadProcess::failed, this, &DownloadJob::onFailed);

    m_state = State::Running;
    qInfo().noquote() << "[" + m_id + "] starting" << program;
    m_process->start();
    emit started(m_id);
}

void DownloadJob::cancel()
{
    if (m_state == State::Finished || m_state == State::Cancelling) return;
    const bool running = m_state == State::Running;
    m_state = State::Cancelling;
    m_logTimer.cancel();
    if (running && m_process) {
        m_process->terminate();
        return;
    }
    // Never started, nothing will call the exit handler.
    m_state = State::Finished;
    emit cancelled(m_id);
}

void DownloadJob::flushLog()
{
    m_logTimer.cancel();
    if (m_log == m_flushedLog) return;
    m_flushedLog = m_log;
    RecordPatch patch;
    patch.log = m_log;
    emit recordUpdated(m_id, patch);
}

void DownloadJob::onOutput(const QString& text)
{
    if (m_state != State::Running || text.isEmpty()) return;
    QString normalized = text;
    normalized.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    normalized.replace('\r', '\n');
    m_log += normalized;
    m_logTimer.schedule();
}

void DownloadJob::onProgress(const ProgressEvent& event)
{
    if (m_state != State::Running) return;
    m_resolver.noteProgressSizes(event.total, event.downloaded);

    DownloadProgress progress;
    progress.percent = qMin(100.0, m_blender.update(event.percent));
    progress.currentSpeed = event.currentSpeed;
    progress.eta = event.eta;
    progress.downloaded = event.downloaded;
    progress.total = event.total;

    RecordPatch patch;
    patch.progress = progress;
    patch.speed = progress.currentSpeed;
    emit recordUpdated(m_id, patch);
}

void DownloadJob::onEvent(const QString& type, const QString& text)
{
    if (m_state != State::Running) return;

    const QString lowered = text.toLower();
    if (!m_processing
        && (type == "postprocess" || lowered.contains("merging formats") || lowered.contains("post-process"))) {
        m_processing = true;
        RecordPatch patch;
        patch.status = DownloadStatus::Processing;
        emit recordUpdated(m_id, patch);
    }

    if (type == "info" && lowered.contains("format")) {
        static const QRegularExpression downloading(QStringLiteral("format\\(s\\):\\s*([0-9A-Za-z+_-]+)"));
        static const QRegularExpression idLine(QStringLiteral("^([^\\s:]+):\\s*(.+)$"));
        auto match = downloading.match(text);
        if (match.hasMatch()) {
            applySelectedFormat(match.captured(1));
        } else if ((match = idLine.match(text)).hasMatch()) {
            applySelectedFormat(match.captured(1));
        }
    }

    if (type == "download" && lowered.contains("format")) {
        static const QRegularExpression formatRe(QStringLiteral("format\\s*([0-9A-Za-z+-]+)"));
        const auto match = formatRe.match(text);
        if (match.hasMatch()) applySelectedFormat(match.captured(1));
    }

    m_resolver.captureFromLogLine(text);
}

void DownloadJob::onExited(int exitCode)
{
    const bool wasCancelling = m_state == State::Cancelling;
    if (!finish()) return;
    if (wasCancelling) {
        qInfo().noquote() << "[" + m_id + "] cancelled, exit code" << exitCode;
        emit cancelled(m_id);
        return;
    }
    if (exitCode != 0) {
        const QString message = QStringLiteral("Download exited with code %1").arg(exitCode);
        qWarning().noquote() << "[" + m_id + "]" << message;
        emit failed(m_id, message);
        return;
    }

    const QString extension = OutputResolver::resolveExtension(m_request.kind, m_actualExt, m_willMerge);
    const ResolvedOutput output = m_resolver.resolve(m_title, extension);
    qInfo().noquote() << "[" + m_id + "] finished:" << output.path << "size" << output.size;
    emit succeeded(m_id, output);
}

void DownloadJob::onFailed(const QString& message)
{
    const bool wasCancelling = m_state == State::Cancelling;
    if (!finish()) return;
    if (wasCancelling) {
        emit cancelled(m_id);
        return;
    }
    qWarning().noquote() << "[" + m_id + "] process error:" << message;
    emit failed(m_id, message);
}

void DownloadJob::applySelectedFormat(const QString& rawFormatId)
{
    const auto candidate = utils::findFormatByIdCandidates(m_formats, rawFormatId);
    if (!candidate || candidate->formatId == m_selectedFormatId) return;
    m_selectedFormatId = candidate->formatId;
    if (!candidate->ext.isEmpty()) m_actualExt = candidate->ext;

    RecordPatch patch;
    patch.selectedFormat = candidate->formatId;
    patch.formatExtension = candidate->ext;
    emit recordUpdated(m_id, patch);
}

bool DownloadJob::finish()
{
    if (m_state == State::Finished) return false;
    const bool flush = m_state == State::Running;
    m_state = State::Finished;
    if (flush) {
        m_logTimer.cancel();
        if (m_log != m_flushedLog) {
            m_flushedLog = m_log;
            RecordPatch patch;
            patch.log = m_log;
            emit recordUpdated(m_id, patch);
        }
    }
    return true;
}
