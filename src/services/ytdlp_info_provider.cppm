/*!
 * @file        ytdlp_info_provider.cppm
 * @brief       Metadata provider backed by "yt-dlp -J".
 * @details     Runs yt-dlp in JSON dump mode for single items and in flat
 *              playlist mode for playlists, then maps the JSON document onto
 *              MediaInfo and PlaylistInfo.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>

#ifndef Q_MOC_RUN
export module kite.services.ytdlp_info_provider;
import kite.services.interfaces;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT class YtDlpInfoProvider : public QObject, public InfoProvider {
public:
    explicit YtDlpInfoProvider(QObject* parent = nullptr);

    void fetchMetadata(const QString& url, const AppSettings& settings,
                       std::function<void(const MetadataResult&)> callback) override;
    void fetchPlaylist(const QString& url, const AppSettings& settings,
                       std::function<void(const PlaylistResult&)> callback) override;

    /**
     * @brief Maps a yt-dlp JSON dump onto MediaInfo.
     *
     * Formats without a size get an estimate from tbr and duration.
     */
    static MediaInfo parseMediaInfo(const QJsonObject& obj);

    /**
     * @brief Maps a flat playlist dump onto PlaylistInfo (1-based indices).
     */
    static PlaylistInfo parsePlaylistInfo(const QJsonObject& obj);

private:
    /**
     * @brief Runs yt-dlp and hands the parsed root object (or an error) to @p done.
     */
    void runJsonQuery(const QString& program, const QStringList& args,
                      std::function<void(bool ok, const QJsonObject& root, const QString& error)> done);
};
