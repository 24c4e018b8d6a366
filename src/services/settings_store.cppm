/*!
 * @file        settings_store.cppm
 * @brief       User settings loaded from a JSON file.
 * @details     Reads settings.json from the application data directory.
 *              Missing keys keep their defaults and a broken file yields the
 *              defaults with a warning. Command line overrides are applied on
 *              top through setSettings().
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module kite.services.settings_store;
import kite.services.interfaces;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT class JsonSettingsStore : public SettingsProvider {
public:
    /**
     * @brief Loads settings from @p filePath (defaults when empty or missing).
     */
    explicit JsonSettingsStore(const QString& filePath = QString());

    AppSettings settings() const override { return m_settings; }

    void setSettings(const AppSettings& settings) { m_settings = settings; }

    /**
     * @brief Writes the current settings back to the file.
     * @return False on I/O failure (logged).
     */
    bool save() const;

    QString filePath() const { return m_filePath; }

    /**
     * @brief Built-in defaults (download path from QStandardPaths).
     */
    static AppSettings defaults();

    /**
     * @brief Default location: settings.json in the application data directory.
     */
    static QString defaultFilePath();

private:
    void load();

    QString m_filePath;         //!< Backing file.
    AppSettings m_settings;     //!< Current settings.
};
