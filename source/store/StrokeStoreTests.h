#pragma once

// ============================================================================
// StrokeStoreTests - Unit tests for the stroke store
// ============================================================================
// Tests for:
// - Rendering order under random insert/trash/select sequences
// - Hit tests, selection re-stamping
// - Clipboard content, duplicate, eraser splitting
// - Stale keys and copy-on-write snapshots
// - Transforms, layers, recoloring and snapshot import
// ============================================================================

#include "StrokeStore.h"
#include "../strokes/StrokeTests.h"

#include <QDebug>
#include <QJsonDocument>
#include <QLineF>
#include <QPolygonF>
#include <QRandomGenerator>
#include <QtMath>

namespace StrokeStoreTests {

/// A big viewport containing everything the tests insert.
inline QRectF everywhere()
{
    return QRectF(-10000, -10000, 20000, 20000);
}

inline bool chronoAscending(const StrokeStore& store, const QVector<StrokeKey>& keys)
{
    for (int i = 1; i < keys.size(); ++i) {
        const ChronoComponent* prev = store.chrono(keys.at(i - 1));
        const ChronoComponent* next = store.chrono(keys.at(i));
        if (!prev || !next || !(*prev < *next)) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Rendered keys are non-trashed and strictly ascending in chrono order.
 */
inline bool testAsRenderedOrder()
{
    qDebug() << "=== Test: As Rendered Order ===";
    bool success = true;

    QRandomGenerator rng(42);
    StrokeStore store;
    QVector<StrokeKey> keys;

    for (int step = 0; step < 300 && success; ++step) {
        const int op = keys.isEmpty() ? 0 : rng.bounded(4);
        if (op == 0) {
            const QPointF origin(rng.bounded(500.0), rng.bounded(500.0));
            keys.append(store.insertStroke(StrokeTests::makeLineBrush(origin, 1 + rng.bounded(5))));
        } else {
            const StrokeKey key = keys.at(rng.bounded(keys.size()));
            if (op == 1) {
                store.setTrashed(key, !store.isTrashed(key));
            } else if (op == 2) {
                store.setSelected(key, !store.isSelected(key));
            } else {
                store.updateChronoToLast(key);
            }
        }

        const QVector<StrokeKey> rendered = store.strokeKeysAsRendered();
        for (const StrokeKey& key : rendered) {
            if (store.isTrashed(key)) {
                qDebug() << "FAIL: trashed key" << key << "is rendered at step" << step;
                success = false;
            }
        }
        if (!chronoAscending(store, rendered)) {
            qDebug() << "FAIL: rendered keys are not in chrono order at step" << step;
            success = false;
        }

        int nonTrashed = 0;
        for (const StrokeKey& key : keys) {
            if (!store.isTrashed(key)) {
                ++nonTrashed;
            }
        }
        if (rendered.size() != nonTrashed) {
            qDebug() << "FAIL: rendered" << rendered.size() << "keys, expected" << nonTrashed;
            success = false;
        }
    }

    qDebug() << "  - As rendered order:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Aabb hit test returns the contained strokes in chrono order.
 */
inline bool testHitboxesContainedInAabb()
{
    qDebug() << "=== Test: Hitboxes Contained In Aabb ===";
    bool success = true;

    StrokeStore store;
    ShapeStyle style;
    style.strokeWidth = 2.0;
    // Bounds [0,0]-[10,10] and [5,5]-[15,15]
    const StrokeKey a = store.insertStroke(ShapeStroke::rectangle(QRectF(1, 1, 8, 8), style));
    const StrokeKey b = store.insertStroke(ShapeStroke::rectangle(QRectF(6, 6, 8, 8), style));

    const QVector<StrokeKey> both = store.strokeHitboxesContainedInAabb(QRectF(0, 0, 20, 20), everywhere());
    if (both != QVector<StrokeKey>({a, b})) {
        qDebug() << "FAIL: expected [A, B], got" << both;
        success = false;
    }

    const QVector<StrokeKey> onlyA = store.strokeHitboxesContainedInAabb(QRectF(0, 0, 12, 12), everywhere());
    if (onlyA != QVector<StrokeKey>({a})) {
        qDebug() << "FAIL: expected [A], got" << onlyA;
        success = false;
    }

    store.setTrashed(a, true);
    const QVector<StrokeKey> afterTrash = store.strokeHitboxesContainedInAabb(QRectF(0, 0, 20, 20), everywhere());
    if (afterTrash != QVector<StrokeKey>({b})) {
        qDebug() << "FAIL: trashed strokes must not be hit, got" << afterTrash;
        success = false;
    }

    qDebug() << "  - Hitboxes contained in aabb:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Selecting a stroke moves it to the top of the rendering order.
 */
inline bool testSelectionRestamp()
{
    qDebug() << "=== Test: Selection Restamp ===";
    bool success = true;

    StrokeStore store;
    const StrokeKey a = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 2));
    const StrokeKey b = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 20), 2));

    store.setSelected(a, true);
    store.setSelected(b, true);
    if (store.selectionKeysAsRendered() != QVector<StrokeKey>({a, b})) {
        qDebug() << "FAIL: selection should be [A, B]";
        success = false;
    }

    store.setSelected(a, false);
    store.setSelected(a, true);
    if (store.selectionKeysAsRendered() != QVector<StrokeKey>({b, a})) {
        qDebug() << "FAIL: reselected A should render last, got" << store.selectionKeysAsRendered();
        success = false;
    }
    if (store.strokeKeysAsRendered() != QVector<StrokeKey>({b, a})) {
        qDebug() << "FAIL: rendering order should be [B, A]";
        success = false;
    }

    qDebug() << "  - Selection restamp:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Cut then insert at the old position restores the bounds and selects the new strokes.
 */
inline bool testCutInsertContent()
{
    qDebug() << "=== Test: Cut And Insert Content ===";
    bool success = true;

    StrokeStore store;
    QVector<StrokeKey> keys;
    keys.append(store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 3)));
    keys.append(store.insertStroke(StrokeTests::makeLineBrush(QPointF(15, 40), 4, 10.0, 6.0)));
    ShapeStyle style;
    keys.append(store.insertStroke(ShapeStroke::ellipse(QRectF(-20, 60, 30, 20), style)));

    const QRectF before = store.boundsForStrokes(keys);
    const StrokeContent content = store.cutStrokeContent(keys);

    for (const StrokeKey& key : keys) {
        if (!store.isTrashed(key) || store.isSelected(key)) {
            qDebug() << "FAIL: cut stroke" << key << "should be trashed and deselected";
            success = false;
        }
    }
    if (content.strokes.size() != 3) {
        qDebug() << "FAIL: content should hold 3 strokes, got" << content.strokes.size();
        success = false;
    }

    const QVector<StrokeKey> inserted = store.insertStrokeContent(content, 1.0, before.topLeft());
    if (inserted.size() != 3) {
        qDebug() << "FAIL: 3 strokes should be inserted, got" << inserted.size();
        success = false;
    }
    if (!StrokeTests::fuzzyRectEqual(store.boundsForStrokes(inserted), before, 1e-3)) {
        qDebug() << "FAIL: inserted bounds" << store.boundsForStrokes(inserted) << "expected" << before;
        success = false;
    }
    for (const StrokeKey& key : inserted) {
        if (!store.isSelected(key) || keys.contains(key)) {
            qDebug() << "FAIL: inserted stroke" << key << "should be new and selected";
            success = false;
        }
    }
    if (store.strokeCount() != 6 || store.strokeKeysAsRendered().size() != 3) {
        qDebug() << "FAIL: 6 strokes stored, 3 rendered expected";
        success = false;
    }

    // Pasting at half size around the target position
    const QVector<StrokeKey> scaled = store.insertStrokeContent(content, 0.5, QPointF(100, 100));
    const QRectF scaledBounds = store.boundsForStrokes(scaled);
    if (scaledBounds.width() >= before.width() || scaledBounds.height() >= before.height()
        || QLineF(scaledBounds.topLeft(), QPointF(100, 100)).length() > 5.0) {
        qDebug() << "FAIL: scaled content should be smaller and start near (100, 100), got" << scaledBounds;
        success = false;
    }
    for (const StrokeKey& key : inserted) {
        if (store.isSelected(key)) {
            qDebug() << "FAIL: pasting should deselect the previous selection";
            success = false;
            break;
        }
    }

    qDebug() << "  - Cut and insert content:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Clipboard payload carries native, SVG and PNG data and pastes back intact.
 */
inline bool testClipboardContent()
{
    qDebug() << "=== Test: Clipboard Content ===";
    bool success = true;

    StrokeStore store;
    QVector<StrokeKey> keys;
    keys.append(store.insertStroke(StrokeTests::makeLineBrush(QPointF(10, 10), 4)));
    ShapeStyle style;
    style.strokeWidth = 2.0;
    keys.append(store.insertStroke(ShapeStroke::ellipse(QRectF(20, 30, 40, 20), style)));
    store.setSelectedKeys(keys, true);

    Background background;
    background.color = QColor(30, 30, 40);
    background.pattern = Background::Pattern::Dots;
    background.patternSpacing = 20.0;

    StrokeContent content = store.copyStrokeContent(keys);
    content.withBackground(background);
    const QVector<ClipboardContent> clipboard = content.toClipboardContent();

    if (clipboard.size() != 3) {
        qDebug() << "FAIL: expected 3 clipboard entries, got" << clipboard.size();
        return false;
    }
    if (clipboard[0].mimeType != QLatin1String(StrokeContent::MIME_TYPE)
        || clipboard[1].mimeType != QLatin1String("image/svg+xml")
        || clipboard[2].mimeType != QLatin1String("image/png")) {
        qDebug() << "FAIL: unexpected clipboard mime types" << clipboard[0].mimeType
                 << clipboard[1].mimeType << clipboard[2].mimeType;
        success = false;
    }
    if (!clipboard[1].data.contains("<svg")) {
        qDebug() << "FAIL: the svg entry should hold svg markup";
        success = false;
    }
    if (QImage::fromData(clipboard[2].data, "PNG").isNull()) {
        qDebug() << "FAIL: the png entry should decode";
        success = false;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(clipboard[0].data, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qDebug() << "FAIL: native entry is not a JSON object:" << error.errorString();
        return false;
    }
    const StrokeContent parsed = StrokeContent::fromJson(doc.object());
    if (parsed.strokes.size() != 2) {
        qDebug() << "FAIL: parsed content should hold 2 strokes, got" << parsed.strokes.size();
        success = false;
    }
    if (!StrokeTests::fuzzyRectEqual(parsed.bounds(), content.bounds(), 1e-3)) {
        qDebug() << "FAIL: parsed bounds" << parsed.bounds() << "expected" << content.bounds();
        success = false;
    }
    if (!parsed.hasBackground() || parsed.background().color != background.color
        || parsed.background().pattern != background.pattern
        || !qFuzzyCompare(parsed.background().patternSpacing, background.patternSpacing)) {
        qDebug() << "FAIL: the background should survive the clipboard";
        success = false;
    }

    const QPointF pos(300, 300);
    const QVector<StrokeKey> pasted = store.insertStrokeContent(parsed, 1.0, pos);
    const QRectF pastedBounds = store.boundsForStrokes(pasted);
    if (pasted.size() != 2
        || !StrokeTests::fuzzyRectEqual(pastedBounds, QRectF(pos, content.bounds().size()), 1e-3)) {
        qDebug() << "FAIL: pasted bounds" << pastedBounds << "expected" << QRectF(pos, content.bounds().size());
        success = false;
    }
    for (const StrokeKey& key : pasted) {
        if (!store.isSelected(key)) {
            qDebug() << "FAIL: pasted stroke" << key << "should be selected";
            success = false;
        }
    }
    for (const StrokeKey& key : keys) {
        if (store.isSelected(key)) {
            qDebug() << "FAIL: pasting should deselect the copied stroke" << key;
            success = false;
        }
    }

    qDebug() << "  - Clipboard content:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Geometry updates keep the spatial index in step with the stroke bounds.
 */
inline bool testUpdateGeometry()
{
    qDebug() << "=== Test: Update Geometry ===";
    bool success = true;

    StrokeStore store;
    const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 4));

    store.updateGeometryForStroke(key);
    const QRectF first = store.spatialIndex().boxFor(key);
    store.updateGeometryForStroke(key);
    const QRectF second = store.spatialIndex().boxFor(key);
    if (first != second || first != store.getStrokeRef(key)->bounds()) {
        qDebug() << "FAIL: repeated geometry updates should be idempotent";
        success = false;
    }

    store.translateStrokes({key}, QPointF(300, -50));
    if (store.spatialIndex().boxFor(key) != store.getStrokeRef(key)->bounds()) {
        qDebug() << "FAIL: index box is stale after translate";
        success = false;
    }
    if (!store.strokeKeysAsRenderedIntersectingBounds(QRectF(0, 0, 5, 5)).isEmpty()) {
        qDebug() << "FAIL: the old position should no longer be hit";
        success = false;
    }
    if (store.strokeKeysAsRenderedIntersectingBounds(QRectF(300, -55, 10, 10)).size() != 1) {
        qDebug() << "FAIL: the new position should be hit";
        success = false;
    }

    qDebug() << "  - Update geometry:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief The eraser shortens, splits and trashes strokes.
 */
inline bool testEraserSplit()
{
    qDebug() << "=== Test: Eraser Split ===";
    bool success = true;

    // Hits at the end: the original keeps its first two segments
    {
        StrokeStore store;
        const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 5));
        const StrokeStore::SplitResult result =
            store.splitCollidingStrokes(QRectF(QPointF(23, -5), QPointF(60, 5)), everywhere());

        if (result.modifiedKeys != QVector<StrokeKey>({key}) || !result.flags.storeModified) {
            qDebug() << "FAIL: only the original should be modified, got" << result.modifiedKeys;
            success = false;
        }
        const auto* brush = dynamic_cast<const BrushStroke*>(store.getStrokeRef(key).get());
        if (!brush || brush->path().segments.size() != 2 || store.isTrashed(key)) {
            qDebug() << "FAIL: original should keep 2 segments";
            success = false;
        }
        if (store.strokeCount() != 1) {
            qDebug() << "FAIL: no remnant should be created, count" << store.strokeCount();
            success = false;
        }
        if (brush && store.spatialIndex().boxFor(key) != brush->bounds()) {
            qDebug() << "FAIL: index box should follow the shortened stroke";
            success = false;
        }
    }

    // Hit in the middle: a remnant with the segments after the hits
    {
        StrokeStore store;
        const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 8));
        const StrokeStore::SplitResult result =
            store.splitCollidingStrokes(QRectF(QPointF(33, -5), QPointF(47, 5)), everywhere());

        if (store.strokeCount() != 2 || result.modifiedKeys.size() != 2) {
            qDebug() << "FAIL: a remnant stroke should be created, count" << store.strokeCount();
            success = false;
        } else {
            const StrokeKey remnantKey = result.modifiedKeys.at(1);
            const auto* original = dynamic_cast<const BrushStroke*>(store.getStrokeRef(key).get());
            const auto* remnant = dynamic_cast<const BrushStroke*>(store.getStrokeRef(remnantKey).get());
            if (!original || original->path().segments.size() != 3) {
                qDebug() << "FAIL: original should keep 3 segments";
                success = false;
            }
            if (!remnant || remnant->path().segments.size() != 3
                || remnant->path().start.pos != QPointF(50, 0)) {
                qDebug() << "FAIL: remnant should start at (50, 0) with 3 segments";
                success = false;
            }
        }
    }

    // Hit at the first segment: the original is trashed
    {
        StrokeStore store;
        const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 2));
        store.splitCollidingStrokes(QRectF(-5, -5, 10, 10), everywhere());
        if (!store.isTrashed(key)) {
            qDebug() << "FAIL: a stroke hit at its first segment should be trashed";
            success = false;
        }
    }

    qDebug() << "  - Eraser split:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Removed keys never resolve again, even when their slot is reused.
 */
inline bool testStaleKeys()
{
    qDebug() << "=== Test: Stale Keys ===";
    bool success = true;

    StrokeStore store;
    const StrokeKey old = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 2));
    if (!store.removeStroke(old)) {
        qDebug() << "FAIL: removeStroke should return the stroke";
        success = false;
    }
    const StrokeKey fresh = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 2));

    if (fresh == old) {
        qDebug() << "FAIL: a new stroke must get a new key";
        success = false;
    }
    if (store.getStrokeRef(old) || store.getStrokeMut(old) || store.containsStroke(old)) {
        qDebug() << "FAIL: stale key should not resolve";
        success = false;
    }
    if (store.isTrashed(old) || store.isSelected(old) || store.renderComponent(old)) {
        qDebug() << "FAIL: stale key components should read as absent";
        success = false;
    }
    store.setSelected(old, true);
    store.setTrashed(old, true);
    if (store.strokeCount() != 1 || !store.selectionKeysUnordered().isEmpty()) {
        qDebug() << "FAIL: writes through a stale key should be ignored";
        success = false;
    }
    if (store.removeStroke(old)) {
        qDebug() << "FAIL: removing a stale key should return nullptr";
        success = false;
    }

    qDebug() << "  - Stale keys:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Mutating a stroke never changes a snapshot taken before.
 */
inline bool testCopyOnWrite()
{
    qDebug() << "=== Test: Copy On Write ===";
    bool success = true;

    StrokeStore store;
    const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 3));
    const QRectF original = store.getStrokeRef(key)->bounds();

    const StoreSnapshot snapshot = store.takeSnapshot();
    store.translateStrokes({key}, QPointF(100, 100));
    store.setSelected(key, true);

    if (snapshot.strokes.get(key)->bounds() != original) {
        qDebug() << "FAIL: snapshot stroke changed with the store";
        success = false;
    }
    if (snapshot.selection.get(key) && snapshot.selection.get(key)->selected) {
        qDebug() << "FAIL: snapshot selection changed with the store";
        success = false;
    }
    if (store.getStrokeRef(key)->bounds() == original) {
        qDebug() << "FAIL: store stroke should have moved";
        success = false;
    }

    qDebug() << "  - Copy on write:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Duplicates are offset, selected, and take over cached images.
 */
inline bool testDuplicateSelection()
{
    qDebug() << "=== Test: Duplicate Selection ===";
    bool success = true;

    StrokeStore store;
    const StrokeKey a = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 3));
    store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 50), 3));

    if (!store.duplicateSelection().isEmpty()) {
        qDebug() << "FAIL: duplicating an empty selection should do nothing";
        success = false;
    }

    store.setSelected(a, true);
    const QVector<StrokeKey> duplicates = store.duplicateSelection();
    if (duplicates.size() != 1 || store.strokeCount() != 3) {
        qDebug() << "FAIL: one duplicate expected";
        return false;
    }

    const StrokeKey dup = duplicates.first();
    const QRectF expected = store.getStrokeRef(a)->bounds().translated(StrokeStore::DUPLICATE_OFFSET,
                                                                         StrokeStore::DUPLICATE_OFFSET);
    if (!StrokeTests::fuzzyRectEqual(store.getStrokeRef(dup)->bounds(), expected)) {
        qDebug() << "FAIL: duplicate bounds" << store.getStrokeRef(dup)->bounds() << "expected" << expected;
        success = false;
    }
    if (store.isSelected(a) || !store.isSelected(dup)) {
        qDebug() << "FAIL: the duplicate should replace the original in the selection";
        success = false;
    }
    if (store.strokeKeysAsRendered().last() != dup) {
        qDebug() << "FAIL: the duplicate should render on top";
        success = false;
    }

    qDebug() << "  - Duplicate selection:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Emptying the trash removes exactly the trashed strokes.
 */
inline bool testRemoveTrashed()
{
    qDebug() << "=== Test: Remove Trashed ===";
    bool success = true;

    StrokeStore store;
    const StrokeKey a = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 2));
    const StrokeKey b = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 20), 2));
    const StrokeKey c = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 40), 2));
    store.setTrashedKeys({a, c}, true);

    const QVector<StrokeKey> removed = store.removeTrashedStrokes();
    if (removed.size() != 2 || store.strokeCount() != 1 || !store.containsStroke(b)) {
        qDebug() << "FAIL: only B should remain";
        success = false;
    }
    if (store.spatialIndex().size() != 1 || store.spatialIndex().contains(a)) {
        qDebug() << "FAIL: removed strokes should leave the index";
        success = false;
    }

    qDebug() << "  - Remove trashed:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Transforms and direct edits keep the index box equal to the stroke bounds.
 */
inline bool testTransformsSyncIndex()
{
    qDebug() << "=== Test: Transforms Sync Index ===";
    bool success = true;

    StrokeStore store;
    // Centerline (10,0)-(30,0), width 2
    const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(10, 0), 2));

    auto indexFollows = [&](const char* stage) {
        if (!StrokeTests::fuzzyRectEqual(store.spatialIndex().boxFor(key), store.getStrokeRef(key)->bounds())) {
            qDebug() << "FAIL: index box differs from the stroke bounds after" << stage;
            success = false;
        }
    };

    store.scaleStrokesWithPivot({key}, QPointF(2, 2), QPointF(10, 0));
    if (!StrokeTests::fuzzyRectEqual(store.getStrokeRef(key)->bounds(), QRectF(QPointF(8, -2), QPointF(52, 2)))) {
        qDebug() << "FAIL: scaling around (10, 0) gave" << store.getStrokeRef(key)->bounds();
        success = false;
    }
    indexFollows("scaleStrokesWithPivot");

    store.rotateStrokes({key}, qDegreesToRadians(90.0), QPointF(10, 0));
    if (!StrokeTests::fuzzyRectEqual(store.getStrokeRef(key)->bounds(), QRectF(QPointF(8, -2), QPointF(12, 42)))) {
        qDebug() << "FAIL: a quarter turn around (10, 0) gave" << store.getStrokeRef(key)->bounds();
        success = false;
    }
    indexFollows("rotateStrokes");

    store.scaleStrokes({key}, QPointF(1.0, 0.5));
    indexFollows("scaleStrokes");

    Stroke* stroke = store.getStrokeMut(key);
    stroke->translate(QPointF(100, 0));
    const QRectF moved = stroke->bounds();
    if (StrokeTests::fuzzyRectEqual(store.spatialIndex().boxFor(key), moved)) {
        qDebug() << "FAIL: the index should keep the old box until the geometry update";
        success = false;
    }
    store.updateGeometryForStrokes({key});
    indexFollows("updateGeometryForStrokes");

    if (store.strokeKeysAsRenderedInBounds(Bounds::loosened(moved, 1.0)) != QVector<StrokeKey>({key})) {
        qDebug() << "FAIL: the moved stroke should be found inside its loosened bounds";
        success = false;
    }
    if (!store.strokeKeysAsRenderedInBounds(moved.adjusted(0, 0, 0, -moved.height() / 2)).isEmpty()) {
        qDebug() << "FAIL: a stroke only half inside a region is not contained";
        success = false;
    }

    qDebug() << "  - Transforms sync index:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Coordinate, path and polygon hit tests.
 */
inline bool testHitTests()
{
    qDebug() << "=== Test: Hit Tests ===";
    bool success = true;

    StrokeStore store;
    ShapeStyle style;
    style.strokeWidth = 2.0;
    const StrokeKey a = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 2));
    const StrokeKey b = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 100), 2));
    const StrokeKey c = store.insertStroke(ShapeStroke::rectangle(QRectF(200, 0, 40, 40), style));

    if (store.strokeHitboxesContainCoord(QPointF(5, 0), everywhere()) != QVector<StrokeKey>({a})) {
        qDebug() << "FAIL: (5, 0) should hit A only";
        success = false;
    }
    if (!store.strokeHitboxesContainCoord(QPointF(5, 50), everywhere()).isEmpty()) {
        qDebug() << "FAIL: (5, 50) lies between the strokes";
        success = false;
    }

    const QVector<QPointF> crossing = {QPointF(5, -10), QPointF(5, 110)};
    if (store.strokeHitboxesIntersectPath(crossing, everywhere()) != QVector<StrokeKey>({a, b})) {
        qDebug() << "FAIL: a vertical path at x=5 should cross A and B";
        success = false;
    }
    const QVector<QPointF> missing = {QPointF(50, -10), QPointF(50, 110)};
    if (!store.strokeHitboxesIntersectPath(missing, everywhere()).isEmpty()) {
        qDebug() << "FAIL: a vertical path at x=50 crosses nothing";
        success = false;
    }

    const QPolygonF aroundA(QVector<QPointF>{QPointF(-5, -5), QPointF(30, -5), QPointF(30, 5), QPointF(-5, 5)});
    if (store.strokeHitboxesContainedInPathPolygon(aroundA, everywhere()) != QVector<StrokeKey>({a})) {
        qDebug() << "FAIL: the small lasso should contain A only";
        success = false;
    }
    const QPolygonF aroundAll(QVector<QPointF>{QPointF(-10, -10), QPointF(260, -10), QPointF(260, 110),
                                                QPointF(-10, 110)});
    if (store.strokeHitboxesContainedInPathPolygon(aroundAll, everywhere()) != QVector<StrokeKey>({a, b, c})) {
        qDebug() << "FAIL: the large lasso should contain every stroke";
        success = false;
    }
    if (!store.strokeHitboxesContainedInPathPolygon(QPolygonF(QVector<QPointF>{QPointF(0, 0), QPointF(10, 10)}),
                                                    everywhere()).isEmpty()) {
        qDebug() << "FAIL: a lasso with fewer than three points contains nothing";
        success = false;
    }

    store.setSelectedKeys({a, c}, true);
    if (store.selectionKeysAsRendered() != QVector<StrokeKey>({a, c})) {
        qDebug() << "FAIL: selection should be [A, C]";
        success = false;
    }
    if (store.selectionKeysAsRenderedIntersectingBounds(QRectF(-10, -10, 40, 20)) != QVector<StrokeKey>({a})) {
        qDebug() << "FAIL: only A is selected near the origin";
        success = false;
    }

    const StrokeContent content = store.copyStrokeContent({c, a});
    if (content.strokes.size() != 2 || content.strokes.first().get() != store.getStrokeRef(a).get()) {
        qDebug() << "FAIL: copied content should share the strokes in rendering order";
        success = false;
    }
    if (store.isTrashed(a) || store.isTrashed(c)) {
        qDebug() << "FAIL: copying must not trash anything";
        success = false;
    }

    store.setTrashed(b, true);
    if (!store.strokeHitboxesContainCoord(QPointF(5, 100), everywhere()).isEmpty()) {
        qDebug() << "FAIL: trashed strokes are not hit";
        success = false;
    }

    qDebug() << "  - Hit tests:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Recoloring dirties rendering only, layers reorder strokes.
 */
inline bool testColorsAndLayers()
{
    qDebug() << "=== Test: Colors And Layers ===";
    bool success = true;

    StrokeStore store;
    ShapeStyle style;
    style.strokeWidth = 2.0;
    const StrokeKey a = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 3));
    const StrokeKey s = store.insertStroke(ShapeStroke::rectangle(QRectF(50, 0, 20, 20), style));
    store.renderComponentMut(a)->state = RenderComponent::State::Complete;
    store.renderComponentMut(s)->state = RenderComponent::State::Complete;
    const QRectF boxBefore = store.spatialIndex().boxFor(a);

    const StoreFlags flags = store.changeStrokeColors({a, s}, Qt::red);
    if (!flags.storeModified || !flags.redraw) {
        qDebug() << "FAIL: recoloring should modify the store";
        success = false;
    }
    const auto* brush = dynamic_cast<const BrushStroke*>(store.getStrokeRef(a).get());
    const auto* shape = dynamic_cast<const ShapeStroke*>(store.getStrokeRef(s).get());
    if (!brush || brush->style().color != QColor(Qt::red) || !shape || shape->style.strokeColor != QColor(Qt::red)) {
        qDebug() << "FAIL: both strokes should be red";
        success = false;
    }
    if (store.renderComponent(a)->state != RenderComponent::State::Dirty
        || store.renderComponent(s)->state != RenderComponent::State::Dirty) {
        qDebug() << "FAIL: recolored strokes should be Dirty";
        success = false;
    }
    if (store.spatialIndex().boxFor(a) != boxBefore) {
        qDebug() << "FAIL: recoloring must not move the index box";
        success = false;
    }

    store.changeFillColors({s}, Qt::yellow);
    shape = dynamic_cast<const ShapeStroke*>(store.getStrokeRef(s).get());
    if (!shape || shape->style.fillColor != QColor(Qt::yellow)) {
        qDebug() << "FAIL: the shape fill should be yellow";
        success = false;
    }
    if (store.changeStrokeColors({StrokeKey()}, Qt::blue).storeModified) {
        qDebug() << "FAIL: recoloring an unknown key should change nothing";
        success = false;
    }

    store.moveLayerUp({a});
    if (store.layer(a) != StrokeLayer::user(1) || store.keysSortedChrono() != QVector<StrokeKey>({s, a})) {
        qDebug() << "FAIL: A on user layer 1 should render above S";
        success = false;
    }
    store.moveLayerDown({a});
    if (store.keysSortedChrono() != QVector<StrokeKey>({a, s})) {
        qDebug() << "FAIL: back on the same layer the chrono order decides";
        success = false;
    }
    store.setLayer({s}, StrokeLayer::highlighter());
    store.moveLayerDown({s});
    if (store.layer(s) != StrokeLayer::highlighter() || store.keysSortedChrono() != QVector<StrokeKey>({s, a})) {
        qDebug() << "FAIL: the highlighter layer renders below user layers and cannot move down";
        success = false;
    }
    store.moveLayerUp({s});
    if (store.layer(s) != StrokeLayer::user(0)) {
        qDebug() << "FAIL: moving up from the highlighter layer should reach user layer 0";
        success = false;
    }

    qDebug() << "  - Colors and layers:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief The whole-stroke eraser trashes brush and shape strokes only.
 */
inline bool testTrashColliding()
{
    qDebug() << "=== Test: Trash Colliding ===";
    bool success = true;

    StrokeStore store;
    ShapeStyle style;
    style.strokeWidth = 2.0;
    TextStyle textStyle;
    textStyle.fontSize = 12.0;
    const StrokeKey brush = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 3));
    const StrokeKey shape = store.insertStroke(ShapeStroke::rectangle(QRectF(100, 0, 20, 20), style));
    const StrokeKey text = store.insertStroke(
        std::make_unique<TextStroke>(QStringLiteral("Note"), QPointF(300, 300), textStyle));
    const StrokeKey far = store.insertStroke(StrokeTests::makeLineBrush(QPointF(1000, 1000), 3));

    if (store.trashCollidingStrokes(QRectF(500, 0, 10, 10), everywhere()).storeModified) {
        qDebug() << "FAIL: an eraser touching nothing should change nothing";
        success = false;
    }

    const StoreFlags flags = store.trashCollidingStrokes(QRectF(-10, -10, 400, 400), everywhere());
    if (!flags.storeModified || !store.isTrashed(brush) || !store.isTrashed(shape)) {
        qDebug() << "FAIL: the brush and the shape should be trashed";
        success = false;
    }
    if (store.isTrashed(text) || store.isTrashed(far)) {
        qDebug() << "FAIL: text and strokes outside the eraser must survive";
        success = false;
    }
    if (store.trashedKeysUnordered().size() != 2 || store.strokeCount() != 4) {
        qDebug() << "FAIL: trashing keeps the strokes in the store";
        success = false;
    }
    if (!StrokeTests::fuzzyRectEqual(store.boundsNonTrashed(), store.boundsForStrokes({text, far}))) {
        qDebug() << "FAIL: non-trashed bounds should cover the text and the far stroke";
        success = false;
    }

    qDebug() << "  - Trash colliding:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Importing a snapshot replaces content, resets history and keeps keys unique.
 */
inline bool testImportSnapshot()
{
    qDebug() << "=== Test: Import Snapshot ===";
    bool success = true;

    StrokeStore source;
    const StrokeKey k1 = source.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 2));
    const StrokeKey k2 = source.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 30), 2));
    source.setTrashed(k2, true);
    const StoreSnapshot snapshot = source.takeSnapshot();

    StrokeStore target;
    target.insertStroke(StrokeTests::makeLineBrush(QPointF(500, 500), 2));
    target.importFromSnapshot(snapshot);

    if (target.strokeCount() != 2 || !target.isTrashed(k2)
        || target.strokeKeysAsRendered() != QVector<StrokeKey>({k1})) {
        qDebug() << "FAIL: the target should hold exactly the snapshot content";
        success = false;
    }
    const RenderComponent* comp = target.renderComponent(k1);
    if (!comp || comp->state != RenderComponent::State::Dirty) {
        qDebug() << "FAIL: imported strokes should start Dirty";
        success = false;
    }
    if (target.spatialIndex().boxFor(k1) != target.getStrokeRef(k1)->bounds()) {
        qDebug() << "FAIL: the index should be rebuilt from the snapshot";
        success = false;
    }
    if (target.canUndo()) {
        qDebug() << "FAIL: importing should reset history";
        success = false;
    }

    const StrokeKey k3 = target.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 60), 2));
    if (k3 == k1 || k3 == k2) {
        qDebug() << "FAIL: new keys must not collide with imported ones";
        success = false;
    }

    source.removeStroke(k1);
    if (!target.containsStroke(k1)) {
        qDebug() << "FAIL: changing the source must not affect the import";
        success = false;
    }

    qDebug() << "  - Import snapshot:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Run all stroke store tests.
 * @return True if all tests pass.
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Stroke Store Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testAsRenderedOrder();
    qDebug() << "";

    allPass &= testHitboxesContainedInAabb();
    qDebug() << "";

    allPass &= testSelectionRestamp();
    qDebug() << "";

    allPass &= testCutInsertContent();
    qDebug() << "";

    allPass &= testClipboardContent();
    qDebug() << "";

    allPass &= testUpdateGeometry();
    qDebug() << "";

    allPass &= testEraserSplit();
    qDebug() << "";

    allPass &= testStaleKeys();
    qDebug() << "";

    allPass &= testCopyOnWrite();
    qDebug() << "";

    allPass &= testDuplicateSelection();
    qDebug() << "";

    allPass &= testRemoveTrashed();
    qDebug() << "";

    allPass &= testTransformsSyncIndex();
    qDebug() << "";

    allPass &= testHitTests();
    qDebug() << "";

    allPass &= testColorsAndLayers();
    qDebug() << "";

    allPass &= testTrashColliding();
    qDebug() << "";

    allPass &= testImportSnapshot();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL STROKE STORE TESTS PASSED!";
    } else {
        qDebug() << "SOME STROKE STORE TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace StrokeStoreTests
