/*!
 * @file        ytdlp_args_builder.cppm
 * @brief       yt-dlp command line construction.
 * @details     Translates a DownloadRequest and the user settings into the
 *              yt-dlp argument vector: format selector, trim sections,
 *              embedding flags, output template, cookies, proxy and config.
 *              The URL is always appended last so that callers can insert
 *              extra options in front of it.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module kite.services.ytdlp_args_builder;
import kite.services.interfaces;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT class YtDlpArgsBuilder : public ArgumentBuilder {
public:
    QStringList buildArgs(const DownloadRequest& request, const QString& downloadPath,
                          const AppSettings& settings) const override;

    /**
     * @brief Format selector for video jobs.
     *
     * Complex selectors are passed through; secondary audio ids are joined
     * with '+'; otherwise the video choice is combined with the audio choice,
     * falling back to a muxed "best" when no separate audio is available.
     */
    static QString resolveVideoFormatSelector(const DownloadRequest& request);

    /**
     * @brief Format selector for audio jobs ("bestaudio" when unspecified).
     */
    static QString resolveAudioFormatSelector(const DownloadRequest& request);

    /**
     * @brief Arguments of a single-item metadata query (URL last).
     */
    static QStringList buildVideoInfoArgs(const QString& url, const AppSettings& settings);

    /**
     * @brief Arguments of a flat playlist query (URL last).
     */
    static QStringList buildPlaylistInfoArgs(const QString& url, const AppSettings& settings);

private:
    static void appendAccessArgs(QStringList& args, const QString& url, const AppSettings& settings);
};
