#ifndef PROFILE_H
#define PROFILE_H

#include <QString>
#include <QStringList>

/**
 * @brief Profile represents one data folder with its settings
 *
 * Profile settings are stored in the data folder itself as .qfbosync.conf,
 * making profiles portable - you can move the entire folder and the
 * settings travel with it.
 *
 * Each profile holds:
 *   - facilities/  the Local Store (one JSON document per location)
 *   - .state/      sync metadata (dataset version, remote snapshots, outbox)
 *   - the device label stamped on local edits
 *   - where the shared remote store and the bundled dataset live
 */
class Profile
{
public:
    /**
     * @brief Create a profile for the given data folder
     * @param dataFolderPath Path to the data folder (e.g., ~/FboData)
     */
    explicit Profile(const QString &dataFolderPath = QString());

    // Profile location
    QString dataFolderPath() const { return m_dataFolderPath; }
    void setDataFolderPath(const QString &path);

    // Profile identity
    QString name() const;
    void setName(const QString &name);

    // Check if profile is valid (folder exists and is writable)
    bool isValid() const;

    // Check if profile config file exists
    bool exists() const;

    // ========== Identity ==========

    // Label recorded as updatedBy on local edits. Never the import label.
    QString deviceLabel() const;
    bool setDeviceLabel(const QString &label);

    // ========== Sync Settings ==========

    // Shared remote store folder; relative paths resolve against the data folder
    QString remotePath() const;
    void setRemotePath(const QString &path);
    bool hasRemote() const { return !m_remotePath.isEmpty(); }

    // Bundled dataset file and its version
    QString datasetPath() const;
    void setDatasetPath(const QString &path);

    int datasetVersion() const { return m_datasetVersion; }
    void setDatasetVersion(int version);

    // Sync a location before listing it
    bool syncOnStart() const { return m_syncOnStart; }
    void setSyncOnStart(bool enabled) { m_syncOnStart = enabled; }

    // ========== Persistence ==========

    // Load settings from .qfbosync.conf in the data folder
    bool load();

    // Save settings to .qfbosync.conf in the data folder
    bool save();

    // Initialize a new profile (create directories and default config)
    bool initialize();

    // Get the path to the profile config file
    QString configFilePath() const;

    // Get the path to the Local Store directory
    QString storeDirectoryPath() const;

    // Get the path to the state directory
    QString stateDirectoryPath() const;

private:
    QString resolvePath(const QString &path) const;
    static QString defaultDeviceLabel();

    QString m_dataFolderPath;
    QString m_name;
    QString m_deviceLabel;

    QString m_remotePath;
    QString m_datasetPath;
    int m_datasetVersion = 0;
    bool m_syncOnStart = false;

    static const QString CONFIG_FILE_NAME;
    static const QString STORE_DIRECTORY;
    static const QString STATE_DIRECTORY;
};

#endif // PROFILE_H
