/*!
 * @file        outputresolver.cppm
 * @brief       Recovers the final artifact location of a finished job.
 * @details     The fetcher never reports its final file name in a structured
 *              way. OutputResolver collects candidate paths from its log lines
 *              while the job runs and, once the process exits successfully,
 *              resolves the artifact through a layered fallback chain:
 *
 *              - logged candidates, most recent first, then the last known
 *                path, then a fallback name derived from the title;
 *              - a scan of the job directory ranked by title match, branding
 *                marker and extension, picking the most recently modified file;
 *              - the largest transferred byte count seen in progress reports.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module kite.core.outputresolver;
import kite.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

/**
 * @brief Result of OutputResolver::resolve().
 */
KITE_MODULE_EXPORT struct ResolvedOutput {
    QString path;               //!< Best known artifact path (may not exist).
    qint64 size = -1;           //!< Size in bytes (-1 = unknown).
    bool located = false;       //!< True if @c path exists on disk.
    bool estimated = false;     //!< True if @c size comes from progress reports.
};

KITE_MODULE_EXPORT class OutputResolver {
public:
    /**
     * @brief Construct a resolver for one job.
     * @param directory Directory the job writes into.
     */
    explicit OutputResolver(const QString& directory = QString());

    void setDirectory(const QString& directory);
    QString directory() const { return m_directory; }

    /**
     * @brief Extracts an output path from a fetcher log line.
     *
     * Recognises "Destination: <path>", "Merging formats into \"<path>\"" and
     * "Moving file to \"<path>\"". Relative paths are resolved against the job
     * directory.
     *
     * @param line One log line.
     * @return True if a path was captured.
     */
    bool captureFromLogLine(const QString& line);

    /**
     * @brief Records a candidate path (absolute, unquoted).
     */
    void addCandidate(const QString& path);

    QStringList candidates() const { return m_candidates; }   //!< Captured paths in capture order.
    QString lastKnownPath() const { return m_lastKnownPath; }  //!< Most recently captured path.

    /**
     * @brief Updates the transferred size estimate from progress text.
     *
     * A parsable total replaces the estimate; a parsable downloaded size only
     * raises it.
     */
    void noteProgressSizes(const QString& total, const QString& downloaded);

    qint64 latestKnownSizeBytes() const { return m_latestKnownSize; }

    /**
     * @brief Probe order: reversed candidates, last known path, then @p fallbackPath.
     */
    QStringList candidatePaths(const QString& fallbackPath) const;

    /**
     * @brief Resolves the artifact.
     * @param title Media title, used for the fallback name and title matching.
     * @param extension Expected extension without the dot.
     */
    ResolvedOutput resolve(const QString& title, const QString& extension) const;

    /**
     * @brief Scans @p directory for the most likely artifact.
     * @param directory Directory to scan.
     * @param title Media title.
     * @param extension Expected extension.
     * @return Absolute path, or an empty string if the directory holds no candidate.
     */
    static QString findInDirectory(const QString& directory, const QString& title, const QString& extension);

    /**
     * @brief Fallback name: title with reserved characters replaced, cut to 50 characters.
     */
    static QString fallbackFileName(const QString& title, const QString& extension);

    /**
     * @brief Expected extension of the artifact.
     * @param kind Job kind.
     * @param actualExt Extension of the selected format, if known.
     * @param willMerge True if the video selector merges several streams.
     */
    static QString resolveExtension(MediaKind kind, const QString& actualExt, bool willMerge);

private:
    QString m_directory;            //!< Job directory.
    QStringList m_candidates;       //!< Captured paths.
    QString m_lastKnownPath;        //!< Last captured path.
    qint64 m_latestKnownSize = -1;  //!< Largest transferred size (-1 = none).
};
