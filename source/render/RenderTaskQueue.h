#pragma once

// ============================================================================
// RenderTaskQueue - Completions posted by render workers
// ============================================================================
// Workers post from pool threads, the owner thread drains the queue with
// RenderScheduler::processRenderTasks(). tasksAvailable() is emitted from the
// posting thread; receivers living on the owner thread get it queued, which
// is how a UI event loop learns it should pump.
// ============================================================================

#include "RenderImage.h"
#include "../store/StrokeKey.h"

#include <QObject>
#include <QMutex>
#include <QQueue>
#include <QVector>

/**
 * @brief Result of one render job.
 */
struct RenderTask {
    enum class Type {
        UpdateImages,   ///< Replace the cached images
        Failed          ///< Rasterization failed
    };

    Type type = Type::UpdateImages;
    StrokeKey key;
    quint64 ticket = 0;         ///< Ticket of the render component at dispatch
    qreal imageScale = 1.0;     ///< Scale the images were rendered at
    GeneratedImages images;
};

class RenderTaskQueue : public QObject {
    Q_OBJECT

public:
    explicit RenderTaskQueue(QObject* parent = nullptr);

    /// Thread-safe. Emits tasksAvailable().
    void post(RenderTask task);

    /// Take every queued task, oldest first.
    QVector<RenderTask> takeAll();

    int size() const;
    bool isEmpty() const { return size() == 0; }

signals:
    void tasksAvailable();

private:
    mutable QMutex m_mutex;
    QQueue<RenderTask> m_tasks;
};
