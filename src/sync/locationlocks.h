#ifndef LOCATIONLOCKS_H
#define LOCATIONLOCKS_H

#include <QString>
#include <QHash>
#include <QMutex>
#include <memory>

namespace Fbo {

/**
 * @brief Keyed mutex: one lock per location code
 *
 * Different locations never block each other. Mutexes are created on
 * first use and live as long as the LocationLocks instance.
 */
class LocationLocks
{
public:
    LocationLocks() = default;
    LocationLocks(const LocationLocks &) = delete;
    LocationLocks &operator=(const LocationLocks &) = delete;

    /**
     * @brief Mutex guarding one location
     */
    QMutex *mutexFor(const QString &locationCode);

    /**
     * @brief Non-blocking probe: true while another holder owns the lock
     */
    bool isLocked(const QString &locationCode);

    int size() const;

private:
    mutable QMutex m_guard;
    QHash<QString, std::shared_ptr<QMutex>> m_locks;
};

/**
 * @brief RAII holder of one location lock
 */
class LocationLocker
{
public:
    LocationLocker(LocationLocks &locks, const QString &locationCode)
        : m_locker(locks.mutexFor(locationCode)) {}

    void unlock() { m_locker.unlock(); }
    void relock() { m_locker.relock(); }

private:
    QMutexLocker<QMutex> m_locker;
};

} // namespace Fbo

#endif // LOCATIONLOCKS_H
