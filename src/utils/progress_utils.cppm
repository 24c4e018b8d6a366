/*!
 * @file        progress_utils.cppm
 * @brief       Progress part estimation and blending helpers.
 * @details     A single job may download several independent streams (for
 *              example a video stream and one or more audio streams) that the
 *              fetcher reports one after another, each from 0 to 100 percent.
 *
 *              estimateProgressParts() predicts how many such parts a request
 *              produces and ProgressBlender folds the per-part percentages into
 *              one monotonic-looking job percentage.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module kite.utils.progress_utils;
import kite.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT namespace kite::utils {

/**
 * @brief Clamps a percentage to [0,100]; NaN and infinities map to 0.
 */
double clampPercent(double value);

/**
 * @brief Predicts how many progress streams a request will report.
 *
 * Audio jobs and jobs whose selector resolves to a single stream report one
 * part; explicit secondary audio ids add one part each on top of the video;
 * an unspecified selector assumes the default video+audio pair.
 *
 * @param request Job request.
 * @return Expected part count, at least 1.
 */
int estimateProgressParts(const DownloadRequest& request);

/**
 * @brief Blends per-part percentages into one job percentage.
 *
 * A new part is assumed to have started when the previous report was at or
 * above 90 percent and the new one is at or below 10 percent. The result is
 * ((completedParts + p/100) / totalParts) * 100, capped at 100.
 */
class ProgressBlender {
public:
    explicit ProgressBlender(int totalParts = 1);

    /**
     * @brief Feeds one reported percentage and returns the blended value.
     * @param percent Raw per-part percentage.
     */
    double update(double percent);

    /**
     * @brief Changes the expected part count (minimum 1).
     *
     * Used once metadata shows the selected format is already muxed.
     */
    void setTotalParts(int totalParts);

    int totalParts() const { return m_totalParts; }
    int completedParts() const { return m_completedParts; }
    double lastPercent() const { return m_lastPercent; }

private:
    int m_totalParts = 1;           //!< Expected part count.
    int m_completedParts = 0;       //!< Parts assumed finished.
    double m_lastPercent = 0.0;     //!< Previous clamped report.
};

} // namespace kite::utils
