#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include <QAtomicInteger>
#include <QSharedPointer>

/**
 * @brief Shared stop flag handed to a worker when its task starts.
 *
 * Copies share the same flag, so the control thread can cancel while a worker
 * thread polls isCancelled().
 */
class CancellationToken
{
public:
    CancellationToken() : m_flag(QSharedPointer<QAtomicInteger<int>>::create(0))
    {
    }

    void cancel()
    {
        m_flag->storeRelease(1);
    }

    bool isCancelled() const
    {
        return m_flag->loadAcquire() != 0;
    }

private:
    QSharedPointer<QAtomicInteger<int>> m_flag;
};

#endif // CANCELLATIONTOKEN_H
