#include "filequeue.h"

void FileIntakeQueue::enqueue(const QString& path)
{
    m_queue.enqueue(path);
}

void FileIntakeQueue::enqueue(const QStringList& paths)
{
    for (const QString& path : paths)
        m_queue.enqueue(path);
}

bool FileIntakeQueue::dequeueNext(QString& path)
{
    if (m_queue.isEmpty())
        return false;
    path = m_queue.dequeue();
    return true;
}

bool FileIntakeQueue::isEmpty() const
{
    return m_queue.isEmpty();
}

int FileIntakeQueue::size() const
{
    return m_queue.size();
}

QStringList FileIntakeQueue::pending() const
{
    return QStringList(m_queue.cbegin(), m_queue.cend());
}

void FileIntakeQueue::clear()
{
    m_queue.clear();
}
