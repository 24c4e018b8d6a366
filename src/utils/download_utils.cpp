module;
#include <QFileInfo>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QtGlobal>

#include <cmath>

module kite.utils.download_utils;

import kite.core.downloadtypes;

namespace kite::utils {

QString buildDownloadSignature(const DownloadRequest& request)
{
    QStringList audioIds;
    for (const QString& id : request.audioFormatIds) {
        const QString trimmed = id.trimmed();
        if (!trimmed.isEmpty()) audioIds.append(trimmed);
    }
    audioIds.sort();
    audioIds.removeDuplicates();

    const QString origin = request.origin.trimmed().isEmpty()
        ? QStringLiteral("manual")
        : request.origin.trimmed();

    const QStringList parts = {
        request.url.trimmed(),
        mediaKindToString(request.kind),
        request.format.trimmed(),
        request.audioFormat.trimmed(),
        audioIds.join(','),
        request.startTime.trimmed(),
        request.endTime.trimmed(),
        request.customDownloadPath.trimmed(),
        request.customFilenameTemplate.trimmed(),
        origin,
        request.subscriptionId.trimmed()
    };
    return parts.join('|');
}

qint64 parseSizeToBytes(const QString& value, bool* ok)
{
    if (ok) *ok = false;
    QString cleaned = value.trimmed();
    static const QRegularExpression tilde(QStringLiteral("^~\\s*"));
    cleaned.remove(tilde);
    if (cleaned.isEmpty()) return 0;

    static const QRegularExpression re(QStringLiteral("^([\\d.,]+)\\s*([KMGTP]?i?B)$"),
                                       QRegularExpression::CaseInsensitiveOption);
    const auto match = re.match(cleaned);
    if (!match.hasMatch()) return 0;

    QString number = match.captured(1);
    number.remove(',');
    bool numberOk = false;
    const double amount = number.toDouble(&numberOk);
    if (!numberOk) return 0;

    const QString unit = match.captured(2).toUpper();
    double multiplier = 0.0;
    if (unit == "B") multiplier = 1.0;
    else if (unit == "KB") multiplier = 1e3;
    else if (unit == "KIB") multiplier = 1024.0;
    else if (unit == "MB") multiplier = 1e6;
    else if (unit == "MIB") multiplier = 1048576.0;
    else if (unit == "GB") multiplier = 1e9;
    else if (unit == "GIB") multiplier = 1073741824.0;
    else if (unit == "TB") multiplier = 1e12;
    else if (unit == "TIB") multiplier = 1099511627776.0;
    if (multiplier <= 0.0) return 0;

    if (ok) *ok = true;
    return static_cast<qint64>(std::llround(amount * multiplier));
}

QString formatCommandLine(const QString& program, const QStringList& args)
{
    static const QRegularExpression needsQuote(QStringLiteral("[\\s\"'\\\\]"));
    QStringList quoted;
    quoted.reserve(args.size() + 1);
    quoted.append(program);
    for (const QString& arg : args) {
        if (arg.isEmpty()) {
            quoted.append(QStringLiteral("\"\""));
            continue;
        }
        if (arg.contains(needsQuote)) {
            QString escaped = arg;
            escaped.replace('\\', QStringLiteral("\\\\"));
            escaped.replace('"', QStringLiteral("\\\""));
            quoted.append(QStringLiteral("\"%1\"").arg(escaped));
            continue;
        }
        quoted.append(arg);
    }
    return quoted.join(' ');
}

QString buildFilenameKey(const QString& value)
{
    static const QRegularExpression branding(QStringLiteral("via\\s*kite"));
    static const QRegularExpression disallowed(
        QStringLiteral("[^a-z0-9\\x{3040}-\\x{30ff}\\x{3400}-\\x{4dbf}\\x{4e00}-\\x{9fff}\\x{ac00}-\\x{d7af}]+"));
    QString key = value.toLower();
    key.remove(branding);
    key.remove(disallowed);
    return key;
}

QString normalizeFilePath(const QString& path)
{
    if (path.startsWith("file://")) {
        QUrl url(path);
        if (url.isValid() && url.isLocalFile()) {
            return url.toLocalFile();
        }
    }
    return path;
}

QString normalizeHost(const QString& host)
{
    QString h = host.trimmed().toLower();
    if (h.isEmpty()) return QString();
    if (h.contains("://")) {
        QUrl u(h);
        if (u.isValid()) h = u.host().toLower();
    }
    const int slash = h.indexOf('/');
    if (slash >= 0) h = h.left(slash);
    return h;
}

bool isYouTubeUrl(const QString& url)
{
    const QString host = normalizeHost(url);
    if (host.isEmpty()) return false;
    static const QStringList suffixes = {
        QStringLiteral("youtube.com"), QStringLiteral("youtu.be"), QStringLiteral("youtube-nocookie.com")
    };
    for (const QString& suffix : suffixes) {
        if (host == suffix || host.endsWith(QStringLiteral(".") + suffix)) return true;
    }
    return false;
}

bool isBilibiliUrl(const QString& url)
{
    const QString host = normalizeHost(url);
    return host.contains("bilibili.com") || host.contains("b23.tv") || host.contains("bili.tv");
}

bool fileExistsPath(const QString& path)
{
    const QString normalized = normalizeFilePath(path);
    if (normalized.isEmpty()) return false;
    QFileInfo info(normalized);
    return info.exists() && info.isFile();
}

} // namespace kite::utils
