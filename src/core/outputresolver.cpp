module;
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

module kite.core.outputresolver;

import kite.core.downloadtypes;
import kite.utils.download_utils;

namespace utils = kite::utils;

namespace {

QString stripQuotes(const QString& value)
{
    QString out = value.trimmed();
    if (out.size() >= 2
        && ((out.startsWith('"') && out.endsWith('"')) || (out.startsWith('\'') && out.endsWith('\'')))) {
        out = out.mid(1, out.size() - 2);
    }
    return out;
}

QString pickMostRecent(const QStringList& paths)
{
    QString best;
    QDateTime bestTime;
    for (const QString& path : paths) {
        const QFileInfo info(path);
        if (!info.isFile()) continue;
        const QDateTime modified = info.lastModified();
        if (best.isEmpty() || modified > bestTime) {
            best = info.absoluteFilePath();
            bestTime = modified;
        }
    }
    return best;
}

} // namespace

OutputResolver::OutputResolver(const QString& directory)
    : m_directory(directory)
{
}

void OutputResolver::setDirectory(const QString& directory)
{
    m_directory = directory;
}

bool OutputResolver::captureFromLogLine(const QString& line)
{
    static const QRegularExpression destination(QStringLiteral("Destination:\\s*(.+)$"));
    static const QRegularExpression merging(QStringLiteral("Merging formats into\\s+\"(.+?)\""));
    static const QRegularExpression moving(QStringLiteral("Moving file to\\s+\"(.+?)\""));

    for (const QRegularExpression* re : {&destination, &merging, &moving}) {
        const auto match = re->match(line);
        if (!match.hasMatch()) continue;
        const QString raw = stripQuotes(match.captured(1));
        if (raw.isEmpty()) return false;
        const QString absolute = QDir::isAbsolutePath(raw) || m_directory.isEmpty()
            ? raw
            : QDir(m_directory).filePath(raw);
        addCandidate(QDir::cleanPath(absolute));
        return true;
    }
    return false;
}

void OutputResolver::addCandidate(const QString& path)
{
    if (path.isEmpty()) return;
    m_lastKnownPath = path;
    if (!m_candidates.contains(path)) m_candidates.append(path);
}

void OutputResolver::noteProgressSizes(const QString& total, const QString& downloaded)
{
    bool ok = false;
    const qint64 totalBytes = utils::parseSizeToBytes(total, &ok);
    if (ok) m_latestKnownSize = totalBytes;

    const qint64 downloadedBytes = utils::parseSizeToBytes(downloaded, &ok);
    if (ok) m_latestKnownSize = qMax(m_latestKnownSize, downloadedBytes);
}

QStringList OutputResolver::candidatePaths(const QString& fallbackPath) const
{
    QStringList out;
    for (auto it = m_candidates.crbegin(); it != m_candidates.crend(); ++it) {
        if (!out.contains(*it)) out.append(*it);
    }
    if (!m_lastKnownPath.isEmpty() && !out.contains(m_lastKnownPath)) out.append(m_lastKnownPath);
    if (!fallbackPath.isEmpty() && !out.contains(fallbackPath)) out.append(fallbackPath);
    return out;
}

ResolvedOutput OutputResolver::resolve(const QString& title, const QString& extension) const
{
    const QString fallbackPath = QDir(m_directory).filePath(fallbackFileName(title, extension));

    ResolvedOutput result;
    result.path = m_lastKnownPath.isEmpty() ? fallbackPath : m_lastKnownPath;

    for (const QString& candidate : candidatePaths(fallbackPath)) {
        const QFileInfo info(candidate);
        if (info.exists() && info.isFile()) {
            result.path = candidate;
            result.size = info.size();
            result.located = true;
            return result;
        }
    }

    const QString scanned = findInDirectory(m_directory, title, extension);
    if (!scanned.isEmpty()) {
        result.path = scanned;
        result.size = QFileInfo(scanned).size();
        result.located = true;
        qDebug() << "Found actual file:" << scanned << "Size:" << result.size;
        return result;
    }

    if (m_latestKnownSize >= 0) {
        result.size = m_latestKnownSize;
        result.estimated = true;
        qWarning() << "File not found, using estimated size:" << result.size;
    } else {
        qWarning() << "Failed to find output file in" << m_directory;
    }
    return result;
}

QString OutputResolver::findInDirectory(const QString& directory, const QString& title, const QString& extension)
{
    if (directory.isEmpty()) return QString();
    const QDir dir(directory);
    if (!dir.exists()) return QString();

    const QString titleKey = utils::buildFilenameKey(title);
    const QString normalizedExt = extension.toLower();
    const QString marker = QString::fromLatin1(utils::kBrandingMarker).section(' ', -1).toLower();

    QStringList all;
    QStringList withExtension;
    QStringList titleMatches;
    QStringList brandedMatches;

    const QStringList files = dir.entryList(QDir::Files | QDir::NoDotAndDotDot);
    for (const QString& file : files) {
        const QString ext = QFileInfo(file).suffix().toLower();
        if (ext.isEmpty()) continue;
        const QString path = dir.filePath(file);
        all.append(path);
        if (ext != normalizedExt) continue;
        withExtension.append(path);

        const QString fileKey = utils::buildFilenameKey(file);
        if (!titleKey.isEmpty() && !fileKey.isEmpty()
            && (fileKey.contains(titleKey) || titleKey.contains(fileKey))) {
            titleMatches.append(path);
        }
        if (file.toLower().contains(marker)) brandedMatches.append(path);
    }

    const QStringList& pickFrom = !titleMatches.isEmpty() ? titleMatches
        : !brandedMatches.isEmpty() ? brandedMatches
        : !withExtension.isEmpty() ? withExtension
        : all;
    return pickMostRecent(pickFrom);
}

QString OutputResolver::fallbackFileName(const QString& title, const QString& extension)
{
    static const QRegularExpression reserved(QStringLiteral("[<>:\"/\\\\|?*]"));
    QString sanitized = title.isEmpty() ? QStringLiteral("Unknown") : title;
    sanitized.replace(reserved, QStringLiteral("_"));
    sanitized = sanitized.left(50);
    return QStringLiteral("%1.%2").arg(sanitized, extension);
}

QString OutputResolver::resolveExtension(MediaKind kind, const QString& actualExt, bool willMerge)
{
    if (!actualExt.isEmpty()) return actualExt;
    if (kind == MediaKind::Audio) return QStringLiteral("m4a");
    return willMerge ? QStringLiteral("mkv") : QStringLiteral("mp4");
}
