// ============================================================================
// RenderScheduler - Implementation
// ============================================================================

#include "RenderScheduler.h"
#include "../core/Bounds.h"
#include "../store/StrokeStore.h"
#include "../strokes/BrushStroke.h"

#include <QPainter>
#include <QThreadPool>
#include <QtConcurrent>
#include <QDebug>

RenderScheduler::RenderScheduler(StrokeStore& store, RenderTaskQueue& queue,
                                 const RenderConfig& config, QThreadPool* pool)
    : m_store(store)
    , m_queue(queue)
    , m_config(config)
    , m_pool(pool ? pool : QThreadPool::globalInstance())
{
}

RenderScheduler::~RenderScheduler()
{
    waitForWorkers();
}

void RenderScheduler::waitForWorkers()
{
    for (QFuture<void>& future : m_futures) {
        future.waitForFinished();
    }
    m_futures.clear();
}

void RenderScheduler::rememberViewport(const QRectF& viewport, qreal imageScale)
{
    m_viewport = viewport;
    m_imageScale = imageScale;
    m_hasViewport = true;
}

void RenderScheduler::applyImages(RenderComponent& comp, GeneratedImages&& images)
{
    if (images.coverage == GeneratedImages::Coverage::Full) {
        comp.state = RenderComponent::State::Complete;
        comp.viewport = QRectF();
    } else {
        comp.state = RenderComponent::State::ForViewport;
        comp.viewport = images.viewport;
    }
    comp.images = std::move(images.images);
}

// ============================================================================
// Synchronous
// ============================================================================

void RenderScheduler::regenerateRenderingForStroke(const StrokeKey& key, const QRectF& viewport,
                                                   qreal imageScale)
{
    rememberViewport(viewport, imageScale);

    RenderComponent* comp = m_store.renderComponentMut(key);
    const std::shared_ptr<const Stroke> stroke = m_store.getStrokeRef(key);
    if (!comp || !stroke) {
        return;
    }
    if (comp->state == RenderComponent::State::Busy) {
        return;
    }

    const QRectF extended = Bounds::extendedByFactor(viewport, m_config.viewportMarginFactor);
    GeneratedImages images;
    if (!stroke->genImages(extended, imageScale, images)) {
        qWarning() << "RenderScheduler: rendering" << stroke->type() << key << "failed";
        comp->state = RenderComponent::State::Dirty;
        return;
    }
    applyImages(*comp, std::move(images));
    comp->pendingDirty = false;
}

void RenderScheduler::regenerateRenderingForStrokes(const QVector<StrokeKey>& keys,
                                                    const QRectF& viewport, qreal imageScale)
{
    for (const StrokeKey& key : keys) {
        regenerateRenderingForStroke(key, viewport, imageScale);
    }
}

// ============================================================================
// Threaded
// ============================================================================

bool RenderScheduler::dispatch(const StrokeKey& key, const QRectF& viewport, qreal imageScale,
                               bool force)
{
    RenderComponent* comp = m_store.renderComponentMut(key);
    std::shared_ptr<const Stroke> stroke = m_store.getStrokeRef(key);
    if (!comp || !stroke) {
        return false;
    }
    if (comp->state == RenderComponent::State::Busy && !force) {
        return false;
    }

    // Busy before the task exists, so a second request is a no-op
    comp->state = RenderComponent::State::Busy;
    comp->pendingDirty = false;
    comp->ticket = ++m_nextTicket;
    m_inFlight++;

    // Drop futures of finished tasks
    for (int i = m_futures.size() - 1; i >= 0; --i) {
        if (m_futures.at(i).isFinished()) {
            m_futures.removeAt(i);
        }
    }

    const quint64 ticket = comp->ticket;
    const QRectF extended = Bounds::extendedByFactor(viewport, m_config.viewportMarginFactor);
    RenderTaskQueue* queue = &m_queue;

    m_futures.append(QtConcurrent::run(m_pool,
        [queue, stroke = std::move(stroke), key, ticket, extended, imageScale]() {
            RenderTask task;
            task.key = key;
            task.ticket = ticket;
            task.imageScale = imageScale;
            task.type = stroke->genImages(extended, imageScale, task.images)
                ? RenderTask::Type::UpdateImages
                : RenderTask::Type::Failed;
            queue->post(std::move(task));
        }));
    return true;
}

void RenderScheduler::regenerateRenderingForStrokeThreaded(const StrokeKey& key, const QRectF& viewport,
                                                           qreal imageScale)
{
    rememberViewport(viewport, imageScale);
    dispatch(key, viewport, imageScale, false);
}

void RenderScheduler::regenerateRenderingInViewportThreaded(bool force, const QRectF& viewport,
                                                            qreal imageScale)
{
    rememberViewport(viewport, imageScale);

    const QRectF extended = Bounds::extendedByFactor(viewport, m_config.viewportMarginFactor);
    const QRectF rerenderRegion = Bounds::extendedByFactor(
        viewport, m_config.viewportMarginFactor * m_config.rerenderThreshold);

#ifdef QT_DEBUG
    int dispatched = 0;
#endif

    for (const StrokeKey& key : m_store.keysUnordered()) {
        RenderComponent* comp = m_store.renderComponentMut(key);
        const std::shared_ptr<const Stroke> stroke = m_store.getStrokeRef(key);
        if (!comp || !stroke) {
            continue;
        }

        // Trashed and off-screen strokes give their memory back
        if (m_store.isTrashed(key) || !Bounds::intersects(extended, stroke->bounds())) {
            comp->images.clear();
            comp->state = RenderComponent::State::Dirty;
            comp->pendingDirty = false;
            continue;
        }

        switch (comp->state) {
            case RenderComponent::State::Busy:
            case RenderComponent::State::Complete:
                if (!force) {
                    continue;
                }
                break;
            case RenderComponent::State::ForViewport:
                if (!force && Bounds::contains(comp->viewport, rerenderRegion)) {
                    continue;
                }
                break;
            case RenderComponent::State::Dirty:
                break;
        }

#ifdef QT_DEBUG
        dispatched += dispatch(key, viewport, imageScale, force) ? 1 : 0;
#else
        dispatch(key, viewport, imageScale, force);
#endif
    }

#ifdef QT_DEBUG
    if (dispatched > 0) {
        qDebug() << "RenderScheduler: dispatched" << dispatched << "render tasks";
    }
#endif
}

void RenderScheduler::appendRenderingLastSegments(const StrokeKey& key, int nLastSegments,
                                                  const QRectF& viewport, qreal imageScale)
{
    RenderComponent* comp = m_store.renderComponentMut(key);
    const std::shared_ptr<const Stroke> stroke = m_store.getStrokeRef(key);
    if (!comp || !stroke) {
        return;
    }

    if (stroke->kind() != Stroke::Kind::Brush) {
        regenerateRenderingForStrokeThreaded(key, viewport, imageScale);
        return;
    }

    const auto* brush = static_cast<const BrushStroke*>(stroke.get());
    if (nLastSegments <= 0 || brush->path().segments.isEmpty()) {
        return;
    }
    RenderImage image;
    if (!brush->genImageForLastSegments(nLastSegments, imageScale, image)) {
        qWarning() << "RenderScheduler: appending last segments failed for" << key;
        m_store.setRenderingDirty(key);
        return;
    }
    comp->images.append(image);
}

// ============================================================================
// Completions
// ============================================================================

bool RenderScheduler::processRenderTasks()
{
    bool redraw = false;
    QVector<RenderTask> tasks = m_queue.takeAll();

    for (RenderTask& task : tasks) {
        m_inFlight = qMax(0, m_inFlight - 1);

        RenderComponent* comp = m_store.renderComponentMut(task.key);
        if (!comp || !m_store.containsStroke(task.key)) {
            // Removed while rendering
            continue;
        }
        if (comp->state != RenderComponent::State::Busy || comp->ticket != task.ticket) {
            // Superseded or cleared while rendering
            continue;
        }

        if (task.type == RenderTask::Type::Failed) {
            qWarning() << "RenderScheduler: render task for" << task.key << "failed";
            comp->state = RenderComponent::State::Dirty;
            comp->pendingDirty = false;
            continue;
        }

        if (qAbs(task.imageScale - m_imageScale) > m_config.imageScaleTolerance) {
            // Zoom changed while rendering, the images are the wrong resolution
            comp->state = RenderComponent::State::Dirty;
            comp->pendingDirty = false;
            continue;
        }

        const bool pendingDirty = comp->pendingDirty;
        applyImages(*comp, std::move(task.images));
        comp->pendingDirty = false;
        redraw = true;

        if (pendingDirty) {
            comp->state = RenderComponent::State::Dirty;
            if (m_hasViewport) {
                dispatch(task.key, m_viewport, m_imageScale, false);
            }
        }
    }
    return redraw;
}

// ============================================================================
// Drawing
// ============================================================================

void RenderScheduler::drawStrokesToPainter(QPainter& painter, const QRectF& viewport) const
{
    const QColor placeholder(128, 128, 128, 48);

    for (const StrokeKey& key : m_store.strokeKeysAsRenderedIntersectingBounds(viewport)) {
        const RenderComponent* comp = m_store.renderComponent(key);
        if (!comp) {
            continue;
        }

        if (comp->images.isEmpty()) {
            const std::shared_ptr<const Stroke> stroke = m_store.getStrokeRef(key);
            if (stroke) {
                painter.fillRect(stroke->bounds(), placeholder);
            }
            continue;
        }

        for (const RenderImage& image : comp->images) {
            image.draw(painter);
        }
    }
}
