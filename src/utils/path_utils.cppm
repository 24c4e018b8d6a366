/*!
 * @file        path_utils.cppm
 * @brief       Destination directory and filename template helpers.
 * @details     Resolves where a job writes its artifact: automatic per-uploader
 *              and per-playlist folders, the directory implied by a filename
 *              template, and sanitization of folder names and templates.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module kite.utils.path_utils;
import kite.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT namespace kite::utils {

/**
 * @brief Filename template used when a request carries none.
 */
QString defaultFilenameTemplate();

/**
 * @brief Creates @p dir and its parents.
 * @return False when the directory could not be created (logged).
 */
bool ensureDirectoryExists(const QString& dir);

/**
 * @brief Replaces path-hostile characters with '-' and trims trailing dots.
 * @param value Raw folder label.
 * @param fallback Returned when nothing usable is left.
 */
QString sanitizeFolderName(const QString& value, const QString& fallback);

/**
 * @brief Sanitizes a value substituted into a filename template token.
 */
QString sanitizeTemplateValue(const QString& value);

/**
 * @brief Sanitizes a filename template.
 *
 * Backslashes become '/', empty, "." and ".." segments are dropped, reserved
 * characters become '-' and trailing dots or spaces are trimmed per segment.
 * An unusable template yields defaultFilenameTemplate().
 */
QString sanitizeFilenameTemplate(const QString& value);

/**
 * @brief Expands a leading "~" to the home directory.
 */
QString resolvePathWithHome(const QString& path);

/**
 * @brief Heuristic for channel URLs (as opposed to playlist URLs).
 */
bool isLikelyChannelUrl(const QString& url);

/**
 * @brief Automatic destination of a playlist: base/Playlists/<title> or base/Channels/<title>.
 */
QString resolveAutoPlaylistDownloadPath(const QString& basePath, const QString& playlistTitle, const QString& url);

/**
 * @brief Automatic destination of a single video: base/Videos/<uploader or title>.
 * @param info Metadata, or nullptr when unknown.
 */
QString resolveAutoVideoDownloadPath(const QString& basePath, const MediaInfo* info);

/**
 * @brief Directory implied by a filename template.
 *
 * Known tokens (uploader, title, id, channel, extractor) are substituted from
 * @p info. When the template has no directory part, or a directory token could
 * not be substituted, @p basePath is returned.
 *
 * @param basePath Job base directory.
 * @param filenameTemplate Template override (may be empty).
 * @param info Metadata, or nullptr when unknown.
 */
QString resolveHistoryDownloadPath(const QString& basePath, const QString& filenameTemplate, const MediaInfo* info = nullptr);

} // namespace kite::utils
