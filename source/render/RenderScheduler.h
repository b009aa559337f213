#pragma once

// ============================================================================
// RenderScheduler - Keeps the cached stroke images in sync with the viewport
// ============================================================================
// Decides which strokes need rasterizing, runs the work on a QThreadPool and
// applies completions on the owner thread.
//
// Thread Safety:
// Workers receive a shared_ptr to an immutable stroke. The store clones a
// stroke before mutating it while a worker still holds it, so workers never
// see a stroke change under them and never touch the store.
//
// Staleness:
// Dispatching flips the render component to Busy and gives it a new ticket.
// A completion is applied only if the stroke still exists, is still Busy and
// carries the same ticket. A stroke changed while its task was in flight is
// flagged pendingDirty: the completion is applied (it is better than
// nothing) and the stroke is dispatched again right away.
// ============================================================================

#include "RenderTaskQueue.h"
#include "../core/EngineConfig.h"
#include "../store/StrokeKey.h"

#include <QFuture>
#include <QList>
#include <QRectF>
#include <QVector>

class QPainter;
class QThreadPool;
class StrokeStore;
struct RenderComponent;

class RenderScheduler {
public:
    /**
     * @param store Store owned by the calling thread.
     * @param queue Queue workers post their results to.
     * @param pool Worker pool, the global instance by default.
     */
    RenderScheduler(StrokeStore& store, RenderTaskQueue& queue,
                    const RenderConfig& config = RenderConfig(),
                    QThreadPool* pool = nullptr);

    /// Waits for tasks still in flight, they post to the queue.
    ~RenderScheduler();

    RenderScheduler(const RenderScheduler&) = delete;
    RenderScheduler& operator=(const RenderScheduler&) = delete;

    const RenderConfig& config() const { return m_config; }
    void setConfig(const RenderConfig& config) { m_config = config; }

    /**
     * @brief Rasterize one stroke now, on the calling thread.
     *
     * For immediate feedback, e.g. the stroke just finished under the pen.
     * No-op while a task for the stroke is in flight.
     */
    void regenerateRenderingForStroke(const StrokeKey& key, const QRectF& viewport, qreal imageScale);
    void regenerateRenderingForStrokes(const QVector<StrokeKey>& keys, const QRectF& viewport,
                                       qreal imageScale);

    /**
     * @brief Rasterize one stroke on the worker pool.
     *
     * The stroke is Busy before this returns. No-op while it is Busy already.
     */
    void regenerateRenderingForStrokeThreaded(const StrokeKey& key, const QRectF& viewport,
                                              qreal imageScale);

    /**
     * @brief Bring every stroke up to date for a viewport.
     *
     * Trashed strokes and strokes outside the extended viewport lose their
     * images. Strokes inside
     * are dispatched unless their images are still good enough, or
     * unconditionally with @p force (e.g. after a zoom change).
     */
    void regenerateRenderingInViewportThreaded(bool force, const QRectF& viewport, qreal imageScale);

    /**
     * @brief Append images of the newest segments while a stroke is drawn.
     *
     * Only brush strokes support this, others are regenerated in full.
     * A failed rasterization leaves the stroke Dirty.
     */
    void appendRenderingLastSegments(const StrokeKey& key, int nLastSegments,
                                     const QRectF& viewport, qreal imageScale);

    /**
     * @brief Apply every queued completion. Call on the owner thread.
     * @return true if any cached images changed and the view needs a redraw.
     */
    bool processRenderTasks();

    /**
     * @brief Draw cached images of the visible strokes in rendering order.
     *
     * Strokes without images get a placeholder fill.
     */
    void drawStrokesToPainter(QPainter& painter, const QRectF& viewport) const;

    /// Tasks dispatched and not yet processed.
    int inFlightCount() const { return m_inFlight; }

    /// Block until every dispatched task has posted its result.
    void waitForWorkers();

    qreal imageScale() const { return m_imageScale; }

private:
    /// Returns false if the stroke is unknown or a task is in flight and @p force is false.
    bool dispatch(const StrokeKey& key, const QRectF& viewport, qreal imageScale, bool force);

    void rememberViewport(const QRectF& viewport, qreal imageScale);

    static void applyImages(RenderComponent& comp, GeneratedImages&& images);

    StrokeStore& m_store;
    RenderTaskQueue& m_queue;
    RenderConfig m_config;
    QThreadPool* m_pool = nullptr;

    QRectF m_viewport;              ///< Last requested viewport, for re-dispatch
    qreal m_imageScale = 1.0;
    bool m_hasViewport = false;

    quint64 m_nextTicket = 0;
    int m_inFlight = 0;
    QList<QFuture<void>> m_futures;
};
