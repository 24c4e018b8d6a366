/*!
 * @file        watermark_transcoder.cppm
 * @brief       ffmpeg share-watermark post-processor.
 * @details     Renders a short "title, author, branding" line in the lower
 *              right corner of a finished video with ffmpeg's drawtext filter.
 *              The result is written to a temporary file next to the input and
 *              swapped into place with a backup, so a failed run never leaves
 *              a truncated artifact behind.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>

#ifndef Q_MOC_RUN
export module kite.services.watermark_transcoder;
import kite.services.interfaces;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT class WatermarkTranscoder : public QObject, public Transcoder {
public:
    explicit WatermarkTranscoder(QObject* parent = nullptr);

    QString locateExecutable(const AppSettings& settings, QString* error) const override;
    void transform(const TranscodeRequest& request,
                   std::function<void(const TranscodeResult&)> callback) override;

    /**
     * @brief Collapses whitespace, drops control characters and truncates with "...".
     */
    static QString normalizeWatermarkLine(const QString& value, const QString& fallback, int maxLength);

    /**
     * @brief Overlay text: title (28), "by author" (60) and the branding line.
     */
    static QString buildWatermarkText(const QString& title, const QString& author);

    /**
     * @brief Output path: same base name, extension kept for mp4/m4v/mov/mkv, otherwise mp4.
     */
    static QString outputPathFor(const QString& inputPath);

    /**
     * @brief Full ffmpeg argument vector.
     */
    static QStringList buildArgs(const QString& inputPath, const QString& filter, const QString& tempOutputPath);

private:
    static QString resolveFontFile(const QString& text);
    static QString buildDrawTextFilter(const QString& textFilePath, const QString& fontFile);
    static bool replaceOutputFile(const QString& outputPath, const QString& tempPath, QString* error);
};
