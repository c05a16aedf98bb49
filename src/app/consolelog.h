#ifndef CONSOLELOG_H
#define CONSOLELOG_H

#include <QObject>
#include <QString>
#include <QMutex>

/**
 * @brief Log sink for the command line front end
 *
 * Provides formatted log output with INFO, WARNING, and ERROR levels on
 * stderr. Slots may be invoked from worker threads.
 */
class ConsoleLog : public QObject
{
    Q_OBJECT

public:
    explicit ConsoleLog(QObject *parent = nullptr);

    /**
     * @brief Enable or silence qDebug() output of the engine
     */
    static void configureLogging(bool debug);

    void setQuiet(bool quiet) { m_quiet = quiet; }

public slots:
    void logInfo(const QString &message);
    void logWarning(const QString &message);
    void logError(const QString &message);

private:
    void write(const char *level, const QString &message);

    QMutex m_mutex;
    bool m_quiet = false;
};

#endif // CONSOLELOG_H
