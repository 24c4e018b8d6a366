module;
#include <QDebug>
#include <QDir>
#include <QRegularExpression>
#include <QString>
#include <QStringList>

module kite.utils.path_utils;

import kite.core.downloadtypes;
import kite.utils.download_utils;

namespace kite::utils {

namespace {

const QRegularExpression& reservedChars()
{
    static const QRegularExpression re(QStringLiteral("[\\\\/:*?\"<>|]+"));
    return re;
}

const QRegularExpression& trailingDotsOrSpaces()
{
    static const QRegularExpression re(QStringLiteral("[. ]+$"));
    return re;
}

const QRegularExpression& templateToken()
{
    static const QRegularExpression re(QStringLiteral("%\\(([^)]+)\\)s"));
    return re;
}

QString tokenValue(const QString& token, const MediaInfo* info)
{
    if (!info) return QString();
    if (token == "uploader" || token == "channel") return info->uploader;
    if (token == "title") return info->title;
    if (token == "id") return info->id;
    if (token == "extractor") return info->extractorKey;
    return QString();
}

} // namespace

QString defaultFilenameTemplate()
{
    return QStringLiteral("%(title)s ") + QLatin1String(kBrandingMarker) + QStringLiteral(".%(ext)s");
}

bool ensureDirectoryExists(const QString& dir)
{
    if (dir.isEmpty()) return true;
    if (!QDir().mkpath(dir)) {
        qWarning() << "Failed to ensure download directory:" << dir;
        return false;
    }
    return true;
}

QString sanitizeFolderName(const QString& value, const QString& fallback)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) return fallback;
    QString sanitized = trimmed;
    sanitized.replace(reservedChars(), QStringLiteral("-"));
    sanitized = sanitized.simplified();
    sanitized.remove(trailingDotsOrSpaces());
    return sanitized.isEmpty() ? fallback : sanitized;
}

QString sanitizeTemplateValue(const QString& value)
{
    QString sanitized = value;
    sanitized.replace(reservedChars(), QStringLiteral("-"));
    sanitized = sanitized.simplified();
    sanitized.remove(trailingDotsOrSpaces());
    return sanitized;
}

QString sanitizeFilenameTemplate(const QString& value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) return defaultFilenameTemplate();

    static const QRegularExpression templateReserved(QStringLiteral("[<>:\"|?*]"));
    QString normalized = trimmed;
    normalized.replace('\\', '/');

    QStringList safeParts;
    for (const QString& rawPart : normalized.split('/')) {
        const QString part = rawPart.trimmed();
        if (part.isEmpty() || part == "." || part == "..") continue;
        QString cleaned = part;
        cleaned.replace(templateReserved, QStringLiteral("-"));
        cleaned.remove(trailingDotsOrSpaces());
        if (!cleaned.isEmpty()) safeParts.append(cleaned);
    }
    return safeParts.isEmpty() ? defaultFilenameTemplate() : safeParts.join('/');
}

QString resolvePathWithHome(const QString& path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty()) return QString();
    if (trimmed == "~") return QDir::homePath();
    if (trimmed.startsWith("~/") || trimmed.startsWith("~\\")) {
        return QDir(QDir::homePath()).filePath(trimmed.mid(2));
    }
    return trimmed;
}

bool isLikelyChannelUrl(const QString& url)
{
    const QString normalized = url.toLower();
    if (normalized.contains("list=")) return false;
    static const QRegularExpression re(QStringLiteral("youtube\\.com/(channel/|c/|user/|@)"));
    return normalized.contains(re);
}

QString resolveAutoPlaylistDownloadPath(const QString& basePath, const QString& playlistTitle, const QString& url)
{
    const bool channel = isLikelyChannelUrl(url);
    const QString kindFolder = channel ? QStringLiteral("Channels") : QStringLiteral("Playlists");
    const QString fallback = channel ? QStringLiteral("Channel") : QStringLiteral("Playlist");
    const QString title = sanitizeFolderName(playlistTitle.isEmpty() ? fallback : playlistTitle, fallback);
    return QDir(QDir(basePath).filePath(kindFolder)).filePath(title);
}

QString resolveAutoVideoDownloadPath(const QString& basePath, const MediaInfo* info)
{
    const QString root = QDir(basePath).filePath(QStringLiteral("Videos"));
    if (!info) return root;
    QString label = info->uploader.trimmed();
    if (label.isEmpty()) label = info->title.trimmed();
    if (label.isEmpty()) return root;
    return QDir(root).filePath(sanitizeFolderName(label, QStringLiteral("Video")));
}

QString resolveHistoryDownloadPath(const QString& basePath, const QString& filenameTemplate, const MediaInfo* info)
{
    if (filenameTemplate.trimmed().isEmpty()) return basePath;

    const QString safeTemplate = sanitizeFilenameTemplate(filenameTemplate);
    QString resolved;
    qsizetype last = 0;
    auto it = templateToken().globalMatch(safeTemplate);
    while (it.hasNext()) {
        const auto match = it.next();
        resolved += safeTemplate.mid(last, match.capturedStart() - last);
        const QString value = tokenValue(match.captured(1), info);
        resolved += value.isEmpty() ? match.captured(0) : sanitizeTemplateValue(value);
        last = match.capturedEnd();
    }
    resolved += safeTemplate.mid(last);

    const qsizetype slash = resolved.lastIndexOf('/');
    if (slash < 0) return basePath;
    const QString templateDir = resolved.left(slash);
    if (templateDir.isEmpty() || templateDir == ".") return basePath;
    if (templateDir.contains(templateToken())) return basePath;
    return QDir(basePath).filePath(templateDir);
}

} // namespace kite::utils
