/*!
 * @file        format_utils.cppm
 * @brief       Format selection helpers over provider metadata.
 * @details     Maps a request's format selector, or the one-click quality
 *              preset when the selector does not name an advertised format,
 *              to a concrete MediaFormat.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QVector>

#include <optional>

#ifndef Q_MOC_RUN
export module kite.utils.format_utils;
import kite.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT namespace kite::utils {

/**
 * @brief True when the format carries both a video and an audio codec.
 */
bool isMuxedFormat(const MediaFormat& format);

/**
 * @brief Finds the first advertised format named by a selector.
 *
 * For every '/' alternative the first '+' component is tried as a format id.
 */
std::optional<MediaFormat> findFormatBySelector(const QVector<MediaFormat>& formats, const QString& selector);

/**
 * @brief Finds the first advertised format among '+'-joined ids (e.g. "137+140").
 */
std::optional<MediaFormat> findFormatByIdCandidates(const QVector<MediaFormat>& formats, const QString& rawFormatId);

/**
 * @brief Picks the best video format within the preset's height limit.
 * @param preset best, good (1080), normal (720), bad (480) or worst.
 */
std::optional<MediaFormat> selectVideoFormatForPreset(const QVector<MediaFormat>& formats, const QString& preset);

/**
 * @brief Picks the best audio format within the preset's bitrate limit.
 * @param preset best (320), good (256), normal (192), bad (128) or worst (96).
 */
std::optional<MediaFormat> selectAudioFormatForPreset(const QVector<MediaFormat>& formats, const QString& preset);

/**
 * @brief Resolves the format a request will most likely download.
 * @param formats Advertised formats.
 * @param request Job request.
 * @param preset One-click quality preset.
 */
std::optional<MediaFormat> resolveSelectedFormat(const QVector<MediaFormat>& formats,
                                                 const DownloadRequest& request,
                                                 const QString& preset);

} // namespace kite::utils
