#include "consolelog.h"

#include <QLoggingCategory>
#include <QTextStream>
#include <cstdio>

ConsoleLog::ConsoleLog(QObject *parent)
    : QObject(parent)
{
}

void ConsoleLog::configureLogging(bool debug)
{
    QLoggingCategory::setFilterRules(debug ? QStringLiteral("*.debug=true")
                                           : QStringLiteral("*.debug=false"));
}

void ConsoleLog::logInfo(const QString &message)
{
    if (!m_quiet) {
        write("INFO", message);
    }
}

void ConsoleLog::logWarning(const QString &message)
{
    write("WARNING", message);
}

void ConsoleLog::logError(const QString &message)
{
    write("ERROR", message);
}

void ConsoleLog::write(const char *level, const QString &message)
{
    QMutexLocker locker(&m_mutex);
    QTextStream err(stderr);
    err << '[' << level << "] " << message << Qt::endl;
}
