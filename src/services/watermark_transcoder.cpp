module;
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <QProcess>
#include <QRandomGenerator>
#include <QRegularExpression>
#include <QSaveFile>
#include <QStandardPaths>
#include <QString>
#include <QStringList>

#include <functional>
#include <memory>

module kite.services.watermark_transcoder;

import kite.services.interfaces;

namespace {

constexpr int kTitleMax = 28;
constexpr int kAuthorMax = 60;

bool containsCjk(const QString& text)
{
    static const QRegularExpression re(QStringLiteral(
        "[\\x{3040}-\\x{30ff}\\x{3400}-\\x{4dbf}\\x{4e00}-\\x{9fff}\\x{ac00}-\\x{d7af}]"));
    return text.contains(re);
}

bool containsCyrillic(const QString& text)
{
    static const QRegularExpression re(QStringLiteral("[\\x{0400}-\\x{04ff}]"));
    return text.contains(re);
}

QString escapeFilterValue(const QString& value)
{
    QString out = value;
    out.replace('\\', QStringLiteral("\\\\"));
    out.replace(':', QStringLiteral("\\:"));
    out.replace('\'', QStringLiteral("\\'"));
    return out;
}

QString uniqueStamp()
{
    return QStringLiteral("%1-%2")
        .arg(QDateTime::currentMSecsSinceEpoch())
        .arg(QRandomGenerator::global()->generate(), 0, 16);
}

} // namespace

WatermarkTranscoder::WatermarkTranscoder(QObject* parent)
    : QObject(parent)
{
}

QString WatermarkTranscoder::locateExecutable(const AppSettings& settings, QString* error) const
{
    const QString configured = settings.ffmpegPath.trimmed();
    if (!configured.isEmpty() && QFileInfo(configured).isAbsolute()) {
        if (QFileInfo(configured).isExecutable()) return configured;
        if (error) *error = QStringLiteral("ffmpeg not found at %1").arg(configured);
        return QString();
    }
    const QString found = QStandardPaths::findExecutable(configured.isEmpty() ? QStringLiteral("ffmpeg") : configured);
    if (found.isEmpty() && error) {
        *error = QStringLiteral("ffmpeg executable could not be located");
    }
    return found;
}

QString WatermarkTranscoder::normalizeWatermarkLine(const QString& value, const QString& fallback, int maxLength)
{
    static const QRegularExpression invisible(QStringLiteral(
        "[\\p{Cc}\\p{Cf}\\x{200B}-\\x{200F}\\x{2028}-\\x{202F}\\x{2060}-\\x{206F}\\x{FEFF}\\x{FFFD}\\x{FE00}-\\x{FE0F}]"));
    QString cleaned = value;
    cleaned.remove(invisible);
    cleaned = cleaned.simplified();
    const QString resolved = cleaned.isEmpty() ? fallback : cleaned;
    if (resolved.size() <= maxLength) return resolved;
    return resolved.left(qMax(0, maxLength - 3)) + QStringLiteral("...");
}

QString WatermarkTranscoder::buildWatermarkText(const QString& title, const QString& author)
{
    const QString titleLine = normalizeWatermarkLine(title, QStringLiteral("Untitled video"), kTitleMax);
    const QString authorLine = author.trimmed().isEmpty()
        ? QStringLiteral("Unknown author")
        : normalizeWatermarkLine(QStringLiteral("by ") + author, QStringLiteral("Unknown author"), kAuthorMax);
    return QStringList{titleLine, authorLine, QStringLiteral("Downloaded with Kite")}.join(' ');
}

QString WatermarkTranscoder::outputPathFor(const QString& inputPath)
{
    const QFileInfo info(inputPath);
    const QString ext = info.suffix().toLower();
    static const QStringList keep = {QStringLiteral("mp4"), QStringLiteral("m4v"), QStringLiteral("mov"), QStringLiteral("mkv")};
    const QString outputExt = keep.contains(ext) ? ext : QStringLiteral("mp4");
    return info.dir().filePath(QStringLiteral("%1.%2").arg(info.completeBaseName(), outputExt));
}

QStringList WatermarkTranscoder::buildArgs(const QString& inputPath, const QString& filter, const QString& tempOutputPath)
{
    QStringList args = {
        QStringLiteral("-y"), QStringLiteral("-hide_banner"),
        QStringLiteral("-i"), inputPath,
        QStringLiteral("-vf"), filter,
        QStringLiteral("-c:v"), QStringLiteral("libx264"),
        QStringLiteral("-preset"), QStringLiteral("veryfast"),
        QStringLiteral("-crf"), QStringLiteral("23"),
        QStringLiteral("-c:a"), QStringLiteral("aac"),
        QStringLiteral("-b:a"), QStringLiteral("192k")
    };
    const QString ext = QFileInfo(tempOutputPath).suffix().toLower();
    if (ext == "mp4" || ext == "m4v" || ext == "mov") {
        args << QStringLiteral("-movflags") << QStringLiteral("+faststart");
    }
    args << tempOutputPath;
    return args;
}

QString WatermarkTranscoder::resolveFontFile(const QString& text)
{
    QStringList base;
    QStringList cjk;
    QStringList cyrillic;
#if defined(Q_OS_MACOS)
    base << "/System/Library/Fonts/Supplemental/Arial Unicode.ttf"
         << "/Library/Fonts/Arial Unicode.ttf"
         << "/System/Library/Fonts/Supplemental/Arial.ttf"
         << "/System/Library/Fonts/Helvetica.ttc";
    cjk << "/System/Library/Fonts/PingFang.ttc"
        << "/System/Library/Fonts/Hiragino Sans GB.ttc"
        << "/System/Library/Fonts/STHeiti Medium.ttc"
        << "/System/Library/Fonts/AppleSDGothicNeo.ttc";
    cyrillic << "/System/Library/Fonts/Supplemental/Arial.ttf";
#elif defined(Q_OS_WIN)
    base << "C:\\Windows\\Fonts\\segoeui.ttf" << "C:\\Windows\\Fonts\\arial.ttf" << "C:\\Windows\\Fonts\\tahoma.ttf";
    cjk << "C:\\Windows\\Fonts\\msyh.ttc" << "C:\\Windows\\Fonts\\simhei.ttf"
        << "C:\\Windows\\Fonts\\meiryo.ttc" << "C:\\Windows\\Fonts\\malgun.ttf";
    cyrillic << "C:\\Windows\\Fonts\\arial.ttf";
#else
    base << "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"
         << "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf"
         << "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf";
    cjk << "/usr/share/fonts/opentype/noto/NotoSansCJK-Regular.ttc"
        << "/usr/share/fonts/truetype/noto/NotoSansCJK-Regular.ttc"
        << "/usr/share/fonts/truetype/wqy/wqy-microhei.ttc"
        << "/usr/share/fonts/truetype/wqy/wqy-zenhei.ttc";
    cyrillic << "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
#endif
    QStringList ordered = containsCjk(text) ? cjk : containsCyrillic(text) ? cyrillic : QStringList();
    ordered << base;
    ordered.removeDuplicates();
    for (const QString& candidate : ordered) {
        if (QFileInfo::exists(candidate)) return candidate;
    }
    qWarning() << "No watermark font found among" << ordered.size() << "candidates";
    return QString();
}

QString WatermarkTranscoder::buildDrawTextFilter(const QString& textFilePath, const QString& fontFile)
{
    QStringList options;
    options << QStringLiteral("textfile=%1").arg(escapeFilterValue(textFilePath));
    if (!fontFile.isEmpty()) options << QStringLiteral("fontfile=%1").arg(escapeFilterValue(fontFile));
    options << QStringLiteral("fontcolor=white")
            << QStringLiteral("text_align=right")
            << QStringLiteral("shadowcolor=black@0.7")
            << QStringLiteral("shadowx=1")
            << QStringLiteral("shadowy=1")
            << QStringLiteral("fontsize=max(14\\, min(44\\, h*0.024))")
            << QStringLiteral("x=w-tw-max(8\\, h*0.018)")
            << QStringLiteral("y=h-th-max(8\\, h*0.018)");
    return QStringLiteral("drawtext=") + options.join(':');
}

bool WatermarkTranscoder::replaceOutputFile(const QString& outputPath, const QString& tempPath, QString* error)
{
    QString backupPath;
    if (QFile::exists(outputPath)) {
        backupPath = QStringLiteral("%1.kite-backup-%2").arg(outputPath).arg(QDateTime::currentMSecsSinceEpoch());
        if (!QFile::rename(outputPath, backupPath)) {
            if (error) *error = QStringLiteral("Failed to back up %1").arg(outputPath);
            return false;
        }
    }
    if (!QFile::rename(tempPath, outputPath)) {
        if (!backupPath.isEmpty() && !QFile::rename(backupPath, outputPath)) {
            qWarning() << "Failed to restore backup" << backupPath;
        }
        if (error) *error = QStringLiteral("Failed to move %1 into place").arg(tempPath);
        return false;
    }
    if (!backupPath.isEmpty() && !QFile::remove(backupPath)) {
        qWarning() << "Failed to remove backup" << backupPath;
    }
    return true;
}

void WatermarkTranscoder::transform(const TranscodeRequest& request,
                                    std::function<void(const TranscodeResult&)> callback)
{
    auto finish = [callback](const TranscodeResult& result) {
        if (callback) callback(result);
    };

    if (request.inputPath.isEmpty()) {
        finish(TranscodeResult{false, QString(), -1, QStringLiteral("No input file")});
        return;
    }

    const QString outputPath = outputPathFor(request.inputPath);
    const QFileInfo outInfo(outputPath);
    const QString stamp = uniqueStamp();
    const QString tempOutputPath = outInfo.dir().filePath(
        QStringLiteral("%1.kite-watermark.%2.%3").arg(outInfo.completeBaseName(), stamp, outInfo.suffix()));
    const QString textFilePath = QDir(QDir::tempPath()).filePath(QStringLiteral("kite-watermark-%1.txt").arg(stamp));

    const QString text = buildWatermarkText(request.title, request.author);
    QSaveFile textFile(textFilePath);
    if (!textFile.open(QIODevice::WriteOnly) || textFile.write(text.toUtf8()) < 0 || !textFile.commit()) {
        finish(TranscodeResult{false, QString(), -1, QStringLiteral("Failed to write watermark text file")});
        return;
    }

    const QString filter = buildDrawTextFilter(textFilePath, resolveFontFile(text));
    auto* proc = new QProcess(this);
    proc->setProcessChannelMode(QProcess::SeparateChannels);
    auto cleanup = [textFilePath, tempOutputPath](bool keepTemp) {
        QFile::remove(textFilePath);
        if (!keepTemp) QFile::remove(tempOutputPath);
    };

    connect(proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this,
            [proc, request, outputPath, tempOutputPath, cleanup, finish](int exitCode, QProcess::ExitStatus status) {
        const QString stderrText = QString::fromUtf8(proc->readAllStandardError()).trimmed();
        proc->deleteLater();
        if (status != QProcess::NormalExit || exitCode != 0) {
            cleanup(false);
            finish(TranscodeResult{false, QString(), -1,
                   QStringLiteral("ffmpeg exited with code %1: %2").arg(exitCode).arg(stderrText)});
            return;
        }
        QString error;
        if (!replaceOutputFile(outputPath, tempOutputPath, &error)) {
            cleanup(false);
            finish(TranscodeResult{false, QString(), -1, error});
            return;
        }
        cleanup(true);
        if (outputPath != request.inputPath && QFile::exists(request.inputPath) && !QFile::remove(request.inputPath)) {
            qWarning() << "Failed to remove original file" << request.inputPath;
        }
        finish(TranscodeResult{true, outputPath, QFileInfo(outputPath).size(), QString()});
    });

    connect(proc, &QProcess::errorOccurred, this, [proc, cleanup, finish](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) return;
        const QString message = proc->errorString();
        proc->deleteLater();
        cleanup(false);
        finish(TranscodeResult{false, QString(), -1, message});
    });

    proc->start(request.executable, buildArgs(request.inputPath, filter, tempOutputPath));
}
