#include "profile.h"
#include "model/facilityrecord.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QSysInfo>

const QString Profile::CONFIG_FILE_NAME = ".qfbosync.conf";
const QString Profile::STORE_DIRECTORY = "facilities";
const QString Profile::STATE_DIRECTORY = ".state";

Profile::Profile(const QString &dataFolderPath)
    : m_dataFolderPath(dataFolderPath)
    , m_deviceLabel(defaultDeviceLabel())
{
    // Try to load existing settings if path is set
    if (!m_dataFolderPath.isEmpty()) {
        load();
    }
}

void Profile::setDataFolderPath(const QString &path)
{
    m_dataFolderPath = path;
}

QString Profile::name() const
{
    if (!m_name.isEmpty()) {
        return m_name;
    }
    // Default to folder name
    if (!m_dataFolderPath.isEmpty()) {
        return QFileInfo(m_dataFolderPath).fileName();
    }
    return QString();
}

void Profile::setName(const QString &name)
{
    m_name = name;
}

bool Profile::isValid() const
{
    if (m_dataFolderPath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_dataFolderPath);
    return info.exists() && info.isDir() && info.isWritable();
}

bool Profile::exists() const
{
    return QFile::exists(configFilePath());
}

// ========== Identity ==========

QString Profile::deviceLabel() const
{
    return m_deviceLabel;
}

bool Profile::setDeviceLabel(const QString &label)
{
    const QString trimmed = label.trimmed();
    if (trimmed.isEmpty() || trimmed == Fbo::FacilityRecord::ImportLabel) {
        return false;
    }
    m_deviceLabel = trimmed;
    return true;
}

QString Profile::defaultDeviceLabel()
{
    QString host = QSysInfo::machineHostName();
    if (host.isEmpty()) {
        host = "local";
    }
    return host + "-device";
}

// ========== Sync Settings ==========

QString Profile::remotePath() const
{
    return resolvePath(m_remotePath);
}

void Profile::setRemotePath(const QString &path)
{
    m_remotePath = path;
}

QString Profile::datasetPath() const
{
    return resolvePath(m_datasetPath);
}

void Profile::setDatasetPath(const QString &path)
{
    m_datasetPath = path;
}

void Profile::setDatasetVersion(int version)
{
    m_datasetVersion = qMax(0, version);
}

QString Profile::resolvePath(const QString &path) const
{
    if (path.isEmpty() || QDir::isAbsolutePath(path) || m_dataFolderPath.isEmpty()) {
        return path;
    }
    return QDir::cleanPath(QDir(m_dataFolderPath).filePath(path));
}

// ========== Persistence ==========

bool Profile::load()
{
    QString configPath = configFilePath();
    if (!QFile::exists(configPath)) {
        return false;
    }

    QSettings settings(configPath, QSettings::IniFormat);

    // Profile identity
    m_name = settings.value("profile/name", QString()).toString();
    if (!setDeviceLabel(settings.value("profile/deviceLabel", QString()).toString())) {
        m_deviceLabel = defaultDeviceLabel();
    }

    // Sync settings
    m_remotePath = settings.value("remote/path", QString()).toString();
    m_datasetPath = settings.value("dataset/path", QString()).toString();
    m_datasetVersion = qMax(0, settings.value("dataset/version", 0).toInt());
    m_syncOnStart = settings.value("sync/syncOnStart", false).toBool();

    return true;
}

bool Profile::save()
{
    if (m_dataFolderPath.isEmpty()) {
        return false;
    }

    // Ensure directory exists
    QDir dir(m_dataFolderPath);
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    QSettings settings(configFilePath(), QSettings::IniFormat);

    // Profile identity
    if (!m_name.isEmpty()) {
        settings.setValue("profile/name", m_name);
    }
    settings.setValue("profile/deviceLabel", m_deviceLabel);

    // Sync settings
    settings.setValue("remote/path", m_remotePath);
    settings.setValue("dataset/path", m_datasetPath);
    settings.setValue("dataset/version", m_datasetVersion);
    settings.setValue("sync/syncOnStart", m_syncOnStart);

    settings.sync();
    return settings.status() == QSettings::NoError;
}

bool Profile::initialize()
{
    if (m_dataFolderPath.isEmpty()) {
        return false;
    }

    QDir dir(m_dataFolderPath);

    // Create main directory
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    // Create subdirectories
    if (!dir.mkpath(STORE_DIRECTORY) || !dir.mkpath(STATE_DIRECTORY)) {
        return false;
    }

    // Save default settings
    return save();
}

QString Profile::configFilePath() const
{
    if (m_dataFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_dataFolderPath).filePath(CONFIG_FILE_NAME);
}

QString Profile::storeDirectoryPath() const
{
    if (m_dataFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_dataFolderPath).filePath(STORE_DIRECTORY);
}

QString Profile::stateDirectoryPath() const
{
    if (m_dataFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_dataFolderPath).filePath(STATE_DIRECTORY);
}
