#ifndef FILEQUEUE_H
#define FILEQUEUE_H

#include <QQueue>
#include <QStringList>

/**
 * @brief FIFO of files waiting to be processed.
 *
 * Never advances on its own: the consumer pulls the next path once the
 * previous file is done. Dequeuing from an empty queue does nothing.
 */
class FileIntakeQueue
{
public:
    void enqueue(const QString& path);
    void enqueue(const QStringList& paths);
    bool dequeueNext(QString& path);

    bool isEmpty() const;
    int size() const;
    QStringList pending() const;
    void clear();

private:
    QQueue<QString> m_queue;
};

#endif // FILEQUEUE_H
