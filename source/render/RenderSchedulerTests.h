#pragma once

// ============================================================================
// RenderSchedulerTests - Unit tests for threaded rendering
// ============================================================================
// Every test runs its own QThreadPool and waits for the workers explicitly,
// so the outcome does not depend on timing.
// ============================================================================

#include "RenderScheduler.h"
#include "RenderTaskQueue.h"
#include "../store/StrokeStore.h"
#include "../strokes/StrokeTests.h"

#include <QDebug>
#include <QImage>
#include <QPainter>
#include <QThreadPool>
#include <QtMath>

namespace RenderSchedulerTests {

inline QRectF testViewport()
{
    return QRectF(0, 0, 200, 200);
}

inline RenderComponent::State stateOf(const StrokeStore& store, const StrokeKey& key)
{
    const RenderComponent* comp = store.renderComponent(key);
    return comp ? comp->state : RenderComponent::State::Dirty;
}

/**
 * @brief A second request while a task is in flight is a no-op.
 */
inline bool testDispatchAndComplete()
{
    qDebug() << "=== Test: Dispatch And Complete ===";
    bool success = true;

    StrokeStore store;
    RenderTaskQueue queue;
    QThreadPool pool;
    RenderScheduler scheduler(store, queue, RenderConfig(), &pool);

    const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 50), 5));
    scheduler.regenerateRenderingForStrokeThreaded(key, testViewport(), 1.0);
    scheduler.regenerateRenderingForStrokeThreaded(key, testViewport(), 1.0);

    if (scheduler.inFlightCount() != 1) {
        qDebug() << "FAIL: double dispatch should leave one task in flight, got" << scheduler.inFlightCount();
        success = false;
    }
    if (stateOf(store, key) != RenderComponent::State::Busy) {
        qDebug() << "FAIL: stroke should be Busy right after dispatch";
        success = false;
    }

    scheduler.waitForWorkers();
    if (!scheduler.processRenderTasks()) {
        qDebug() << "FAIL: processing a completion should request a redraw";
        success = false;
    }
    if (stateOf(store, key) != RenderComponent::State::Complete) {
        qDebug() << "FAIL: stroke inside the viewport should be Complete";
        success = false;
    }
    const RenderComponent* comp = store.renderComponent(key);
    if (!comp || comp->images.isEmpty()) {
        qDebug() << "FAIL: completed stroke should have images";
        success = false;
    }
    if (scheduler.inFlightCount() != 0) {
        qDebug() << "FAIL: nothing should be in flight after processing";
        success = false;
    }

    qDebug() << "  - Dispatch and complete:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Completions for removed strokes are dropped.
 */
inline bool testRemovedWhileRendering()
{
    qDebug() << "=== Test: Removed While Rendering ===";
    bool success = true;

    StrokeStore store;
    RenderTaskQueue queue;
    QThreadPool pool;
    RenderScheduler scheduler(store, queue, RenderConfig(), &pool);

    const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 50), 5));
    const StrokeKey other = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 80), 5));
    scheduler.regenerateRenderingInViewportThreaded(false, testViewport(), 1.0);
    store.removeStroke(key);

    scheduler.waitForWorkers();
    scheduler.processRenderTasks();

    if (scheduler.inFlightCount() != 0) {
        qDebug() << "FAIL: in-flight count should drop to 0, got" << scheduler.inFlightCount();
        success = false;
    }
    if (store.renderComponent(key)) {
        qDebug() << "FAIL: the removed stroke should not get a render component back";
        success = false;
    }
    if (stateOf(store, other) != RenderComponent::State::Complete) {
        qDebug() << "FAIL: the remaining stroke should be Complete";
        success = false;
    }

    qDebug() << "  - Removed while rendering:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief A stroke changed while rendering is dispatched again.
 */
inline bool testPendingDirty()
{
    qDebug() << "=== Test: Pending Dirty ===";
    bool success = true;

    StrokeStore store;
    RenderTaskQueue queue;
    QThreadPool pool;
    RenderScheduler scheduler(store, queue, RenderConfig(), &pool);

    const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 50), 5));
    scheduler.regenerateRenderingForStrokeThreaded(key, testViewport(), 1.0);
    store.translateStrokes({key}, QPointF(0, 40));

    const RenderComponent* comp = store.renderComponent(key);
    if (!comp || !comp->pendingDirty || comp->state != RenderComponent::State::Busy) {
        qDebug() << "FAIL: changing a Busy stroke should flag it pendingDirty";
        success = false;
    }

    scheduler.waitForWorkers();
    scheduler.processRenderTasks();
    if (stateOf(store, key) != RenderComponent::State::Busy || scheduler.inFlightCount() != 1) {
        qDebug() << "FAIL: a pendingDirty stroke should be dispatched again";
        success = false;
    }

    scheduler.waitForWorkers();
    scheduler.processRenderTasks();
    comp = store.renderComponent(key);
    if (!comp || comp->state != RenderComponent::State::Complete || comp->pendingDirty) {
        qDebug() << "FAIL: the second completion should leave the stroke Complete";
        success = false;
    }
    if (comp && !comp->images.isEmpty()) {
        const QRectF strokeBounds = store.getStrokeRef(key)->bounds();
        bool coversMoved = false;
        for (const RenderImage& image : comp->images) {
            coversMoved |= image.bounds().intersects(strokeBounds);
        }
        if (!coversMoved) {
            qDebug() << "FAIL: images should show the stroke at its new position";
            success = false;
        }
    }

    qDebug() << "  - Pending dirty:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Completions rendered at an outdated scale or ticket are discarded.
 */
inline bool testStaleCompletions()
{
    qDebug() << "=== Test: Stale Completions ===";
    bool success = true;

    // Zoom changed while rendering
    {
        StrokeStore store;
        RenderTaskQueue queue;
        QThreadPool pool;
        RenderScheduler scheduler(store, queue, RenderConfig(), &pool);

        const StrokeKey a = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 50), 5));
        const StrokeKey b = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 90), 5));
        scheduler.regenerateRenderingForStrokeThreaded(a, testViewport(), 1.0);
        scheduler.regenerateRenderingForStrokeThreaded(b, testViewport(), 2.0);

        scheduler.waitForWorkers();
        scheduler.processRenderTasks();
        if (stateOf(store, a) != RenderComponent::State::Dirty) {
            qDebug() << "FAIL: images at the old scale should leave the stroke Dirty";
            success = false;
        }
        if (stateOf(store, b) != RenderComponent::State::Complete) {
            qDebug() << "FAIL: images at the current scale should be applied";
            success = false;
        }
    }

    // A forced rescan supersedes the task in flight
    {
        StrokeStore store;
        RenderTaskQueue queue;
        QThreadPool pool;
        RenderScheduler scheduler(store, queue, RenderConfig(), &pool);

        const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 50), 5));
        scheduler.regenerateRenderingForStrokeThreaded(key, testViewport(), 1.0);
        const quint64 firstTicket = store.renderComponent(key)->ticket;

        scheduler.regenerateRenderingInViewportThreaded(true, testViewport(), 1.5);
        if (store.renderComponent(key)->ticket == firstTicket || scheduler.inFlightCount() != 2) {
            qDebug() << "FAIL: a forced rescan should dispatch with a new ticket";
            success = false;
        }

        scheduler.waitForWorkers();
        scheduler.processRenderTasks();
        const RenderComponent* comp = store.renderComponent(key);
        if (!comp || comp->state != RenderComponent::State::Complete || scheduler.inFlightCount() != 0) {
            qDebug() << "FAIL: only the newest task should be applied";
            success = false;
        }
        if (comp && !comp->images.isEmpty()) {
            const RenderImage& image = comp->images.first();
            const qreal pixelsPerUnit = image.image.width() / image.rect.width();
            if (pixelsPerUnit < 1.3 || pixelsPerUnit > 1.7) {
                qDebug() << "FAIL: applied images should be at the new scale, got" << pixelsPerUnit;
                success = false;
            }
        }
    }

    qDebug() << "  - Stale completions:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Strokes leaving the viewport lose their images.
 */
inline bool testViewportEviction()
{
    qDebug() << "=== Test: Viewport Eviction ===";
    bool success = true;

    StrokeStore store;
    RenderTaskQueue queue;
    QThreadPool pool;
    RenderScheduler scheduler(store, queue, RenderConfig(), &pool);

    const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 50), 5));
    scheduler.regenerateRenderingForStroke(key, testViewport(), 1.0);
    if (stateOf(store, key) != RenderComponent::State::Complete) {
        qDebug() << "FAIL: synchronous rendering should complete the stroke";
        success = false;
    }

    QImage canvas(200, 200, QImage::Format_ARGB32_Premultiplied);
    canvas.fill(Qt::transparent);
    {
        QPainter painter(&canvas);
        scheduler.drawStrokesToPainter(painter, testViewport());
    }
    int maxAlpha = 0;
    for (int y = 48; y <= 52; ++y) {
        maxAlpha = qMax(maxAlpha, qAlpha(canvas.pixel(75, y)));
    }
    if (maxAlpha == 0) {
        qDebug() << "FAIL: drawing the cached images should paint the stroke";
        success = false;
    }

    scheduler.regenerateRenderingInViewportThreaded(false, QRectF(5000, 5000, 200, 200), 1.0);
    const RenderComponent* comp = store.renderComponent(key);
    if (!comp || !comp->images.isEmpty() || comp->state != RenderComponent::State::Dirty) {
        qDebug() << "FAIL: an off-screen stroke should drop its images";
        success = false;
    }
    if (scheduler.inFlightCount() != 0) {
        qDebug() << "FAIL: off-screen strokes should not be dispatched";
        success = false;
    }

    qDebug() << "  - Viewport eviction:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Appending, moving and invalidating cached images.
 */
inline bool testCachedImageUpkeep()
{
    qDebug() << "=== Test: Cached Image Upkeep ===";
    bool success = true;

    StrokeStore store;
    RenderTaskQueue queue;
    QThreadPool pool;
    RenderScheduler scheduler(store, queue, RenderConfig(), &pool);

    const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 50), 5));
    const StrokeKey other = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 120), 5));
    scheduler.regenerateRenderingForStrokes({key, other}, testViewport(), 1.0);
    if (stateOf(store, key) != RenderComponent::State::Complete
        || stateOf(store, other) != RenderComponent::State::Complete) {
        qDebug() << "FAIL: both strokes should be rendered synchronously";
        return false;
    }

    // The pen adds two segments while drawing
    const int imageCount = store.renderComponent(key)->images.size();
    auto* brush = static_cast<BrushStroke*>(store.getStrokeMut(key));
    brush->extendWithSegments({PenSegment::lineTo(StrokePoint(QPointF(110, 50), 0.5)),
                               PenSegment::lineTo(StrokePoint(QPointF(120, 50), 0.5))});
    store.updateGeometryForStroke(key);
    scheduler.appendRenderingLastSegments(key, 2, testViewport(), 1.0);
    const RenderComponent* drawn = store.renderComponent(key);
    if (drawn->images.size() != imageCount + 1 || drawn->state != RenderComponent::State::Dirty) {
        qDebug() << "FAIL: appending should add one image to the Dirty stroke";
        success = false;
    }
    if (!Bounds::contains(Bounds::loosened(drawn->images.last().bounds(), 0.5),
                          QRectF(QPointF(100, 49), QPointF(120, 51)))) {
        qDebug() << "FAIL: the appended image should cover the new segments";
        success = false;
    }
    if (!StrokeTests::fuzzyRectEqual(store.spatialIndex().boxFor(key), store.getStrokeRef(key)->bounds())) {
        qDebug() << "FAIL: the index should follow the extended stroke";
        success = false;
    }

    scheduler.regenerateRenderingForStroke(key, testViewport(), 1.0);
    if (stateOf(store, key) != RenderComponent::State::Complete) {
        qDebug() << "FAIL: the finished stroke should render completely";
        success = false;
    }

    const QRectF firstBefore = store.renderComponent(key)->images.first().bounds();
    store.translateStrokesImages({key}, QPointF(10, 0));
    if (!StrokeTests::fuzzyRectEqual(store.renderComponent(key)->images.first().bounds(),
                                     firstBefore.translated(10, 0))
        || stateOf(store, key) != RenderComponent::State::Complete) {
        qDebug() << "FAIL: translating images should move them and keep them valid";
        success = false;
    }

    store.rotateStrokesImages({key}, qDegreesToRadians(45.0), QPointF(75, 50));
    if (store.renderComponent(key)->images.isEmpty() || stateOf(store, key) != RenderComponent::State::Dirty) {
        qDebug() << "FAIL: rotated images stay as a preview but are Dirty";
        success = false;
    }

    store.setRenderingDirtyForStrokes({other});
    if (store.renderComponent(other)->images.isEmpty() || stateOf(store, other) != RenderComponent::State::Dirty) {
        qDebug() << "FAIL: marking dirty should keep the images";
        success = false;
    }

    store.clearRenderingForStrokes({key});
    if (!store.renderComponent(key)->images.isEmpty() || stateOf(store, key) != RenderComponent::State::Dirty) {
        qDebug() << "FAIL: clearing should drop the images";
        success = false;
    }

    // Shapes cannot append, they are regenerated in full on the pool
    ShapeStyle style;
    style.strokeWidth = 2.0;
    const StrokeKey shape = store.insertStroke(ShapeStroke::rectangle(QRectF(20, 20, 30, 30), style));
    scheduler.appendRenderingLastSegments(shape, 1, testViewport(), 1.0);
    if (stateOf(store, shape) != RenderComponent::State::Busy || scheduler.inFlightCount() != 1) {
        qDebug() << "FAIL: appending to a shape should dispatch a full render";
        success = false;
    }
    scheduler.waitForWorkers();
    scheduler.processRenderTasks();
    if (stateOf(store, shape) != RenderComponent::State::Complete) {
        qDebug() << "FAIL: the shape should be Complete after processing";
        success = false;
    }

    qDebug() << "  - Cached image upkeep:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Trashed strokes lose their images, on screen or not.
 */
inline bool testTrashedStrokesReleaseImages()
{
    qDebug() << "=== Test: Trashed Strokes Release Images ===";
    bool success = true;

    StrokeStore store;
    RenderTaskQueue queue;
    QThreadPool pool;
    RenderScheduler scheduler(store, queue, RenderConfig(), &pool);

    const StrokeKey visible = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 50), 5));
    const StrokeKey trashed = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 120), 5));
    const StrokeKey trashedAway = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 160), 5));
    scheduler.regenerateRenderingForStrokes({visible, trashed, trashedAway}, testViewport(), 1.0);
    store.setTrashed(trashed, true);
    store.setTrashed(trashedAway, true);

    scheduler.regenerateRenderingInViewportThreaded(false, testViewport(), 1.0);
    const RenderComponent* comp = store.renderComponent(trashed);
    if (!comp || !comp->images.isEmpty() || comp->state != RenderComponent::State::Dirty) {
        qDebug() << "FAIL: a trashed stroke inside the viewport should drop its images";
        success = false;
    }
    if (store.renderComponent(visible)->images.isEmpty()
        || stateOf(store, visible) != RenderComponent::State::Complete) {
        qDebug() << "FAIL: a visible stroke should keep its images";
        success = false;
    }
    if (scheduler.inFlightCount() != 0) {
        qDebug() << "FAIL: trashed strokes should not be dispatched";
        success = false;
    }

    scheduler.regenerateRenderingInViewportThreaded(false, QRectF(5000, 5000, 200, 200), 1.0);
    if (!store.renderComponent(trashedAway)->images.isEmpty()
        || !store.renderComponent(visible)->images.isEmpty()) {
        qDebug() << "FAIL: off-screen strokes should drop their images, trashed or not";
        success = false;
    }

    // Restored strokes render again on the next scan
    store.setTrashed(trashed, false);
    scheduler.regenerateRenderingInViewportThreaded(false, testViewport(), 1.0);
    scheduler.waitForWorkers();
    scheduler.processRenderTasks();
    if (store.renderComponent(trashed)->images.isEmpty()
        || stateOf(store, trashed) != RenderComponent::State::Complete) {
        qDebug() << "FAIL: a restored stroke should be rendered again";
        success = false;
    }

    qDebug() << "  - Trashed strokes release images:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief A failed append leaves the stroke Dirty, an empty append changes nothing.
 */
inline bool testAppendFailure()
{
    qDebug() << "=== Test: Append Failure ===";
    bool success = true;

    StrokeStore store;
    RenderTaskQueue queue;
    QThreadPool pool;
    RenderScheduler scheduler(store, queue, RenderConfig(), &pool);

    const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 50), 5));
    scheduler.regenerateRenderingForStroke(key, testViewport(), 1.0);
    const int imageCount = store.renderComponent(key)->images.size();

    scheduler.appendRenderingLastSegments(key, 0, testViewport(), 1.0);
    if (store.renderComponent(key)->images.size() != imageCount
        || stateOf(store, key) != RenderComponent::State::Complete) {
        qDebug() << "FAIL: appending no segments should leave the stroke alone";
        success = false;
    }

    // Two segments at this scale exceed the image size limit
    scheduler.appendRenderingLastSegments(key, 2, testViewport(), 5000.0);
    if (store.renderComponent(key)->images.size() != imageCount
        || stateOf(store, key) != RenderComponent::State::Dirty) {
        qDebug() << "FAIL: a failed append should mark the stroke Dirty";
        success = false;
    }

    scheduler.regenerateRenderingInViewportThreaded(false, testViewport(), 1.0);
    scheduler.waitForWorkers();
    scheduler.processRenderTasks();
    if (stateOf(store, key) != RenderComponent::State::Complete) {
        qDebug() << "FAIL: the next viewport scan should repair the stroke";
        success = false;
    }

    // Oversized segment images fail the whole rendering
    scheduler.regenerateRenderingForStroke(key, testViewport(), 5000.0);
    if (stateOf(store, key) != RenderComponent::State::Dirty) {
        qDebug() << "FAIL: a failed rendering should leave the stroke Dirty";
        success = false;
    }

    qDebug() << "  - Append failure:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Scaling around a pivot and resizing move images along with their strokes.
 */
inline bool testScaleAndResizeImages()
{
    qDebug() << "=== Test: Scale And Resize Images ===";
    bool success = true;

    StrokeStore store;
    RenderTaskQueue queue;
    QThreadPool pool;
    RenderScheduler scheduler(store, queue, RenderConfig(), &pool);

    const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(50, 50), 5));
    scheduler.regenerateRenderingForStroke(key, testViewport(), 1.0);
    if (store.renderComponent(key)->images.size() != 1) {
        qDebug() << "FAIL: a small stroke should render to one image";
        return false;
    }

    const QPointF pivot(50, 50);
    const QPointF factors(2.0, 2.0);
    const QRectF imageBefore = store.renderComponent(key)->images.first().bounds();
    const QRectF expected(pivot + (imageBefore.topLeft() - pivot) * 2.0, imageBefore.size() * 2.0);

    store.scaleStrokesImagesWithPivot({key}, factors, pivot);
    store.scaleStrokesWithPivot({key}, factors, pivot);

    const QRectF imageAfter = store.renderComponent(key)->images.first().bounds();
    if (!StrokeTests::fuzzyRectEqual(imageAfter, expected)) {
        qDebug() << "FAIL: scaled image bounds" << imageAfter << "expected" << expected;
        success = false;
    }
    if (!StrokeTests::fuzzyRectEqual(imageAfter, store.getStrokeRef(key)->bounds(), 2.5)) {
        qDebug() << "FAIL: scaled image should cover the scaled stroke";
        success = false;
    }
    if (stateOf(store, key) != RenderComponent::State::Dirty) {
        qDebug() << "FAIL: scaled images are a preview and should be Dirty";
        success = false;
    }

    // Resize maps the current bounds onto the new ones, images first
    scheduler.regenerateRenderingForStroke(key, testViewport(), 1.0);
    const QRectF strokeBefore = store.getStrokeRef(key)->bounds();
    const QRectF target(10, 10, strokeBefore.width() / 2.0, strokeBefore.height() / 2.0);
    store.resizeStrokesImages({key}, target);
    store.resizeStrokes({key}, target);

    if (!StrokeTests::fuzzyRectEqual(store.getStrokeRef(key)->bounds(), target)) {
        qDebug() << "FAIL: resized stroke bounds" << store.getStrokeRef(key)->bounds() << "expected" << target;
        success = false;
    }
    if (!StrokeTests::fuzzyRectEqual(store.spatialIndex().boxFor(key), target)) {
        qDebug() << "FAIL: the index should follow the resized stroke";
        success = false;
    }
    if (!StrokeTests::fuzzyRectEqual(store.renderComponent(key)->images.first().bounds(), target, 1.0)
        || stateOf(store, key) != RenderComponent::State::Dirty) {
        qDebug() << "FAIL: resized images should cover the target and be Dirty";
        success = false;
    }

    qDebug() << "  - Scale and resize images:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Run all render scheduler tests.
 * @return True if all tests pass.
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Render Scheduler Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testDispatchAndComplete();
    qDebug() << "";

    allPass &= testRemovedWhileRendering();
    qDebug() << "";

    allPass &= testPendingDirty();
    qDebug() << "";

    allPass &= testStaleCompletions();
    qDebug() << "";

    allPass &= testViewportEviction();
    qDebug() << "";

    allPass &= testCachedImageUpkeep();
    qDebug() << "";

    allPass &= testTrashedStrokesReleaseImages();
    qDebug() << "";

    allPass &= testAppendFailure();
    qDebug() << "";

    allPass &= testScaleAndResizeImages();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL RENDER SCHEDULER TESTS PASSED!";
    } else {
        qDebug() << "SOME RENDER SCHEDULER TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace RenderSchedulerTests
