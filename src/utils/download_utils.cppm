/*!
 * @file        download_utils.cppm
 * @brief       Common helpers for request fingerprints, sizes and file names.
 * @details     Provides small, side-effect free helpers shared by the queue,
 *              the execution engine and the output resolver: the request
 *              deduplication signature, human-readable size parsing, the
 *              printable command line of the fetcher and the normalized
 *              filename key used to match artifacts against titles.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module kite.utils.download_utils;
import kite.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT namespace kite::utils {

/**
 * @brief Branding marker written into default file names.
 */
inline constexpr char kBrandingMarker[] = "via Kite";

/**
 * @brief Builds the deduplication fingerprint of a request.
 *
 * Two requests with equal signatures describe the same logical job. All text
 * fields are trimmed, secondary audio ids are sorted and de-duplicated, and a
 * missing origin counts as "manual".
 *
 * @param request Job request.
 * @return Pipe-joined signature string.
 */
QString buildDownloadSignature(const DownloadRequest& request);

/**
 * @brief Parses a human-readable size such as "~10.5MiB" into bytes.
 *
 * Decimal (KB, MB, GB, TB) and binary (KiB, MiB, GiB, TiB) units are
 * supported; a leading '~' and thousands separators are ignored.
 *
 * @param value Size text.
 * @param ok Optional success flag.
 * @return Byte count, or 0 when @p value could not be parsed.
 */
qint64 parseSizeToBytes(const QString& value, bool* ok = nullptr);

/**
 * @brief Renders a printable command line.
 *
 * Arguments containing whitespace, quotes or backslashes are double-quoted
 * with inner quotes and backslashes escaped; empty arguments become "".
 *
 * @param program Program name placed first.
 * @param args Argument vector.
 */
QString formatCommandLine(const QString& program, const QStringList& args);

/**
 * @brief Reduces a file name or title to a comparable key.
 *
 * Lowercases, removes the branding marker and keeps only ASCII letters,
 * digits and CJK, kana and hangul characters.
 */
QString buildFilenameKey(const QString& value);

/**
 * @brief Normalizes a local filesystem path or file URL.
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Lowercases a host and strips scheme and path fragments.
 */
QString normalizeHost(const QString& host);

/**
 * @brief True when the host of @p url is a YouTube host.
 */
bool isYouTubeUrl(const QString& url);

/**
 * @brief True when the host of @p url belongs to bilibili.
 */
bool isBilibiliUrl(const QString& url);

/**
 * @brief Checks whether a path exists and is a regular file.
 */
bool fileExistsPath(const QString& path);

} // namespace kite::utils
