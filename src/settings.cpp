#include "settings.h"
#include <QDir>

Settings& Settings::instance()
{
    static Settings instance;
    return instance;
}

Settings::Settings()
    : m_settings("QFboSync", "QFboSync")
{
}

// ========== Profile Settings ==========

QString Settings::defaultProfilePath() const
{
    return m_settings.value("profiles/defaultPath", QString()).toString();
}

void Settings::setDefaultProfilePath(const QString &path)
{
    m_settings.setValue("profiles/defaultPath", QDir::cleanPath(path));
}

QStringList Settings::recentProfiles() const
{
    return m_settings.value("profiles/recent", QStringList()).toStringList();
}

void Settings::addRecentProfile(const QString &path)
{
    if (path.isEmpty()) return;

    const QString normalizedPath = QDir::cleanPath(path);

    QStringList recent = recentProfiles();
    recent.removeAll(normalizedPath);
    recent.prepend(normalizedPath);

    while (recent.size() > MAX_RECENT_PROFILES) {
        recent.removeLast();
    }

    m_settings.setValue("profiles/recent", recent);
}

// ========== Sync Settings ==========

int Settings::uploadThreads() const
{
    return qBound(1, m_settings.value("sync/uploadThreads", 2).toInt(), 8);
}

// ========== Advanced Settings ==========

bool Settings::debugLogging() const
{
    return m_settings.value("advanced/debugLogging", false).toBool();
}

void Settings::sync()
{
    m_settings.sync();
}
