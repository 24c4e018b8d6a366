module;
#include <QDebug>
#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QTimer>

module kite.services.ytdlp_process;

import kite.services.interfaces;

namespace {
constexpr int kKillGraceMs = 5000;
}

YtDlpProcess::YtDlpProcess(const QString& program, const QStringList& args, QObject* parent)
    : DownloadProcess(parent)
    , m_program(program)
    , m_args(args)
{
}

YtDlpProcess::~YtDlpProcess()
{
    if (m_process && m_process->state() != QProcess::NotRunning) {
        m_process->disconnect(this);
        m_process->kill();
        m_process->waitForFinished(1000);
    }
}

void YtDlpProcess::start()
{
    if (m_process) return;
    m_process = new QProcess(this);
    m_process->setProcessChannelMode(QProcess::MergedChannels);
    connect(m_process, &QProcess::readyReadStandardOutput, this, &YtDlpProcess::onReadyRead);
    connect(m_process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, &YtDlpProcess::onFinished);
    connect(m_process, &QProcess::errorOccurred, this, &YtDlpProcess::onError);
    m_process->start(m_program, m_args);
}

void YtDlpProcess::terminate()
{
    if (!m_process || m_process->state() == QProcess::NotRunning) return;
    m_process->terminate();
    QPointer<QProcess> proc = m_process;
    QTimer::singleShot(kKillGraceMs, this, [proc]() {
        if (proc && proc->state() != QProcess::NotRunning) proc->kill();
    });
}

bool YtDlpProcess::parseProgressLine(const QString& line, ProgressEvent* event)
{
    static const QRegularExpression re(QStringLiteral(
        "^\\[download\\]\\s+([\\d.]+)%"
        "(?:\\s+of\\s+(~?\\s*[\\d.,]+\\s*[KMGTP]?i?B))?"
        "(?:\\s+at\\s+(\\S+))?"
        "(?:\\s+ETA\\s+(\\S+))?"));
    const auto match = re.match(line.trimmed());
    if (!match.hasMatch()) return false;

    bool ok = false;
    const double percent = match.captured(1).toDouble(&ok);
    if (!ok) return false;
    if (event) {
        event->percent = percent;
        event->total = match.captured(2).trimmed();
        event->currentSpeed = match.captured(3);
        event->eta = match.captured(4);
        event->downloaded.clear();
    }
    return true;
}

bool YtDlpProcess::parseEventLine(const QString& line, QString* type, QString* text)
{
    static const QRegularExpression re(QStringLiteral("^\\[([\\w:-]+)\\]\\s*(.*)$"));
    const auto match = re.match(line.trimmed());
    if (!match.hasMatch()) return false;
    if (type) *type = match.captured(1).toLower();
    if (text) *text = match.captured(2);
    return true;
}

void YtDlpProcess::onReadyRead()
{
    if (!m_process) return;
    const QString text = QString::fromUtf8(m_process->readAllStandardOutput());
    if (text.isEmpty()) return;
    consume(text, false);
}

void YtDlpProcess::onFinished(int exitCode, QProcess::ExitStatus status)
{
    if (m_finished) return;
    if (m_process) {
        const QString rest = QString::fromUtf8(m_process->readAllStandardOutput());
        consume(rest, true);
    }
    m_finished = true;
    const int code = status == QProcess::CrashExit ? -1 : exitCode;
    emit exited(code);
}

void YtDlpProcess::onError(QProcess::ProcessError error)
{
    // Crashes are reported through finished().
    if (error != QProcess::FailedToStart || m_finished) return;
    m_finished = true;
    const QString message = m_process ? m_process->errorString() : QStringLiteral("Process failed to start");
    qWarning() << "Failed to start" << m_program << ":" << message;
    emit failed(message);
}

void YtDlpProcess::consume(const QString& text, bool flushTail)
{
    if (!text.isEmpty()) emit outputReceived(text);

    m_pending += text;
    m_pending.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    m_pending.replace('\r', '\n');

    const qsizetype lastBreak = m_pending.lastIndexOf('\n');
    QString complete;
    if (lastBreak >= 0) {
        complete = m_pending.left(lastBreak);
        m_pending = m_pending.mid(lastBreak + 1);
    }
    if (flushTail) {
        complete += QLatin1Char('\n');
        complete += m_pending;
        m_pending.clear();
    }

    const QStringList lines = complete.split('\n', Qt::SkipEmptyParts);
    for (const QString& line : lines) handleLine(line);
}

void YtDlpProcess::handleLine(const QString& line)
{
    ProgressEvent progress;
    if (parseProgressLine(line, &progress)) {
        emit progressReported(progress);
        return;
    }
    QString type;
    QString text;
    if (parseEventLine(line, &type, &text)) {
        emit eventReported(type, text);
        return;
    }
    emit eventReported(QString(), line.trimmed());
}

DownloadProcess* YtDlpProcessRunner::spawn(const QString& program, const QStringList& args, QObject* parent)
{
    return new YtDlpProcess(program, args, parent);
}

QString YtDlpProcessRunner::program(const AppSettings& settings) const
{
    return settings.ytDlpPath.isEmpty() ? QStringLiteral("yt-dlp") : settings.ytDlpPath;
}
