#include "locationlocks.h"

namespace Fbo {

QMutex *LocationLocks::mutexFor(const QString &locationCode)
{
    QMutexLocker locker(&m_guard);
    std::shared_ptr<QMutex> &mutex = m_locks[locationCode];
    if (!mutex) {
        mutex = std::make_shared<QMutex>();
    }
    return mutex.get();
}

bool LocationLocks::isLocked(const QString &locationCode)
{
    QMutex *mutex = mutexFor(locationCode);
    if (mutex->tryLock()) {
        mutex->unlock();
        return false;
    }
    return true;
}

int LocationLocks::size() const
{
    QMutexLocker locker(&m_guard);
    return static_cast<int>(m_locks.size());
}

} // namespace Fbo
