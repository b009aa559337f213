#include "RenderTaskQueue.h"

#include <QMutexLocker>

RenderTaskQueue::RenderTaskQueue(QObject* parent)
    : QObject(parent)
{
}

void RenderTaskQueue::post(RenderTask task)
{
    {
        QMutexLocker locker(&m_mutex);
        m_tasks.enqueue(std::move(task));
    }
    emit tasksAvailable();
}

QVector<RenderTask> RenderTaskQueue::takeAll()
{
    QMutexLocker locker(&m_mutex);
    QVector<RenderTask> tasks;
    tasks.reserve(m_tasks.size());
    while (!m_tasks.isEmpty()) {
        tasks.append(m_tasks.dequeue());
    }
    return tasks;
}

int RenderTaskQueue::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_tasks.size();
}
