#ifndef SETTINGS_H
#define SETTINGS_H

#include <QString>
#include <QStringList>
#include <QSettings>

/**
 * @brief Global application settings manager using QSettings
 *
 * Persists user preferences that are NOT profile-specific.
 * Profile-specific settings (device label, remote store, bundled dataset)
 * are stored in the Profile class within the data folder itself.
 *
 * Uses QSettings for platform-appropriate storage:
 *   - Linux: ~/.config/QFboSync/QFboSync.conf
 *   - Windows: Registry
 *   - macOS: plist
 */
class Settings
{
public:
    static Settings& instance();

    // ========== Profile Settings ==========

    // Default profile path - used when no --profile is given
    QString defaultProfilePath() const;
    void setDefaultProfilePath(const QString &path);

    // Recent profiles list (most recent first)
    QStringList recentProfiles() const;
    void addRecentProfile(const QString &path);

    // Maximum number of recent profiles to remember
    static const int MAX_RECENT_PROFILES = 10;

    // ========== Sync Settings ==========

    // Worker threads used by the upload outbox
    int uploadThreads() const;

    // ========== Advanced Settings ==========
    bool debugLogging() const;

    // Sync to disk
    void sync();

private:
    Settings();
    ~Settings() = default;
    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;

    QSettings m_settings;
};

#endif // SETTINGS_H
