#pragma once

// ============================================================================
// StrokeStore - Strokes, their components, the spatial index and history
// ============================================================================
// The store is an entity-component system. A StrokeKey addresses a stroke in
// the stroke table and its components in parallel tables:
// - trash, selection and chrono tables (part of history)
// - render components (cached images, not part of history)
// - the spatial index (derived from the stroke bounds, rebuilt on undo)
//
// The store is owned by a single thread. Render workers only ever see
// shared, read-only strokes (see RenderScheduler).
//
// Geometry changes go through updateGeometryForStroke(), the one place that
// keeps the spatial index in sync with the stroke bounds. Every operation in
// here that changes geometry calls it before returning.
// ============================================================================

#include "ComponentTable.h"
#include "Components.h"
#include "HistoryEntry.h"
#include "SpatialIndex.h"
#include "StrokeContent.h"
#include "StrokeHistory.h"
#include "StrokeKey.h"
#include "StrokeTable.h"
#include "../core/EngineConfig.h"

#include <QColor>
#include <QHash>
#include <QJsonObject>
#include <QPolygonF>
#include <QRectF>
#include <QVector>

#include <memory>

/**
 * @brief What a caller (usually the UI) should do after an operation.
 */
struct StoreFlags {
    bool storeModified = false;     ///< Document content changed
    bool resize = false;            ///< Document bounds may need to be refitted
    bool redraw = false;            ///< Visible content changed
    bool hideUndo = false;          ///< Nothing left to undo (history operations only)
    bool hideRedo = false;          ///< Nothing left to redo (history operations only)

    StoreFlags& merge(const StoreFlags& other) {
        storeModified |= other.storeModified;
        resize |= other.resize;
        redraw |= other.redraw;
        hideUndo = other.hideUndo;
        hideRedo = other.hideRedo;
        return *this;
    }
};

/// A read-only copy of the store tables, taken in O(1).
using StoreSnapshot = HistoryEntry;

class StrokeStore {
public:
    explicit StrokeStore(const StoreConfig& config = StoreConfig());

    StrokeStore(const StrokeStore&) = delete;
    StrokeStore& operator=(const StrokeStore&) = delete;

    const StoreConfig& config() const { return m_config; }
    void setConfig(const StoreConfig& config);

    // ===== Insert & Remove =====

    /**
     * @brief Insert a stroke into its default layer.
     *
     * Seeds every component with defaults and stamps the chrono. No rendering
     * is generated.
     *
     * @return The new key, or a null key if @p stroke is null.
     */
    StrokeKey insertStroke(std::shared_ptr<Stroke> stroke);
    StrokeKey insertStroke(std::shared_ptr<Stroke> stroke, const StrokeLayer& layer);

    /**
     * @brief Remove a stroke from every table and the spatial index.
     * @return The removed stroke, nullptr if the key was unknown.
     */
    std::shared_ptr<Stroke> removeStroke(const StrokeKey& key);

    /// Physically remove every trashed stroke. @return The removed keys.
    QVector<StrokeKey> removeTrashedStrokes();

    /// Remove all strokes. History is kept, so this can be undone.
    void clear();

    // ===== Access =====

    bool containsStroke(const StrokeKey& key) const { return m_strokes.contains(key); }
    int strokeCount() const { return m_strokes.size(); }

    std::shared_ptr<const Stroke> getStrokeRef(const StrokeKey& key) const;
    QVector<std::shared_ptr<const Stroke>> getStrokesRef(const QVector<StrokeKey>& keys) const;

    /**
     * @brief Mutable access to a stroke.
     *
     * The stroke is cloned first if it is shared with history or a render
     * task. Geometry edits must be followed by updateGeometryForStroke().
     *
     * @return nullptr for unknown keys.
     */
    Stroke* getStrokeMut(const StrokeKey& key);

    QVector<StrokeKey> keysUnordered() const { return m_strokes.keys(); }

    // ===== Geometry =====

    /**
     * @brief Refresh the index entry of a stroke and mark its rendering dirty.
     *
     * Must follow every geometry change made through getStrokeMut().
     */
    void updateGeometryForStroke(const StrokeKey& key);
    void updateGeometryForStrokes(const QVector<StrokeKey>& keys);

    /// Translate stroke geometry. Cached images are left alone.
    void translateStrokes(const QVector<StrokeKey>& keys, const QPointF& offset);
    void rotateStrokes(const QVector<StrokeKey>& keys, qreal angle, const QPointF& center);
    void scaleStrokes(const QVector<StrokeKey>& keys, const QPointF& factors);
    void scaleStrokesWithPivot(const QVector<StrokeKey>& keys, const QPointF& factors,
                               const QPointF& pivot);

    /// Translate and scale strokes so their combined bounds become @p newBounds.
    void resizeStrokes(const QVector<StrokeKey>& keys, const QRectF& newBounds);

    /**
     * @brief Translate cached images only.
     *
     * Used during interactive drags together with translateStrokes() so the
     * pixels move immediately. Translation keeps the render state.
     */
    void translateStrokesImages(const QVector<StrokeKey>& keys, const QPointF& offset);

    /// Rotate cached images and mark them dirty, they are only a preview now.
    void rotateStrokesImages(const QVector<StrokeKey>& keys, qreal angle, const QPointF& center);
    void scaleStrokesImages(const QVector<StrokeKey>& keys, const QPointF& factors);
    void scaleStrokesImagesWithPivot(const QVector<StrokeKey>& keys, const QPointF& factors,
                                     const QPointF& pivot);
    void resizeStrokesImages(const QVector<StrokeKey>& keys, const QRectF& newBounds);

    /// Set the outline/text color. Marks rendering dirty, the index is untouched.
    StoreFlags changeStrokeColors(const QVector<StrokeKey>& keys, const QColor& color);
    StoreFlags changeFillColors(const QVector<StrokeKey>& keys, const QColor& color);

    // ===== Trash, Selection & Chrono =====

    /// false for unknown keys.
    bool isTrashed(const StrokeKey& key) const;
    bool isSelected(const StrokeKey& key) const;

    /// Set the trash flag and bring the stroke to the front.
    void setTrashed(const StrokeKey& key, bool trashed);

    /// Deselect, trash or restore, and bring to the front.
    void setTrashedKeys(const QVector<StrokeKey>& keys, bool trashed);

    /// Set the selection flag and bring the stroke to the front.
    void setSelected(const StrokeKey& key, bool selected);
    void setSelectedKeys(const QVector<StrokeKey>& keys, bool selected);

    /// Stamp the stroke with the next chrono value.
    void updateChronoToLast(const StrokeKey& key);

    /// nullptr for unknown keys.
    const ChronoComponent* chrono(const StrokeKey& key) const { return m_chrono.get(key); }
    quint32 chronoCounter() const { return m_chronoCounter; }

    // ===== Layers =====

    StrokeLayer layer(const StrokeKey& key) const;
    void setLayer(const QVector<StrokeKey>& keys, const StrokeLayer& layer);
    void moveLayerUp(const QVector<StrokeKey>& keys);
    void moveLayerDown(const QVector<StrokeKey>& keys);

    // ===== Queries =====
    // "As rendered" queries return non-trashed keys in chrono order, which is
    // the painter's order used for drawing and export.

    QVector<StrokeKey> keysSortedChrono() const;
    QVector<StrokeKey> keysSortedChronoIntersectingBounds(const QRectF& bounds) const;
    QVector<StrokeKey> keysSortedChronoInBounds(const QRectF& bounds) const;

    QVector<StrokeKey> strokeKeysAsRendered() const;
    QVector<StrokeKey> strokeKeysAsRenderedIntersectingBounds(const QRectF& bounds) const;
    QVector<StrokeKey> strokeKeysAsRenderedInBounds(const QRectF& bounds) const;

    QVector<StrokeKey> selectionKeysAsRendered() const;
    QVector<StrokeKey> selectionKeysAsRenderedIntersectingBounds(const QRectF& bounds) const;

    QVector<StrokeKey> trashedKeysUnordered() const;
    QVector<StrokeKey> selectionKeysUnordered() const;

    /// Union of the stroke bounds, invalid if none of the keys exist.
    QRectF boundsForStrokes(const QVector<StrokeKey>& keys) const;

    /// Union of all non-trashed stroke bounds, invalid if there are none.
    QRectF boundsNonTrashed() const;

    /// Bounds of every non-trashed stroke, in chrono order.
    QVector<QRectF> strokesBoundsAsRendered() const;

    // ===== Hit Tests =====
    // A stroke is contained if its bounds are, or if its bounds intersect and
    // every single hitbox is contained. Candidates come from the spatial index
    // restricted to @p viewport. Results are in chrono order, trashed excluded.

    QVector<StrokeKey> strokeHitboxesContainedInPathPolygon(const QPolygonF& polygon,
                                                            const QRectF& viewport) const;
    QVector<StrokeKey> strokeHitboxesContainedInAabb(const QRectF& aabb,
                                                     const QRectF& viewport) const;

    /// Strokes with a hitbox crossed by the polyline @p path.
    QVector<StrokeKey> strokeHitboxesIntersectPath(const QVector<QPointF>& path,
                                                   const QRectF& viewport) const;

    /// Strokes with a hitbox containing @p coord.
    QVector<StrokeKey> strokeHitboxesContainCoord(const QPointF& coord,
                                                  const QRectF& viewport) const;

    // ===== Content (clipboard, duplicate) =====

    /// Strokes of @p keys in chrono order, shared with the store.
    StrokeContent copyStrokeContent(const QVector<StrokeKey>& keys) const;

    /// Like copyStrokeContent(), then deselect and trash the keys.
    StrokeContent cutStrokeContent(const QVector<StrokeKey>& keys);

    /**
     * @brief Insert clones of the content and select them.
     *
     * The content is translated so its bounds' minimum lands at @p pos and
     * then scaled by @p ratio around @p pos. The previous selection is
     * deselected.
     *
     * @return Keys of the inserted strokes, in content order.
     */
    QVector<StrokeKey> insertStrokeContent(const StrokeContent& content, qreal ratio,
                                           const QPointF& pos);

    /**
     * @brief Duplicate the selection, offset by DUPLICATE_OFFSET.
     *
     * The duplicates take over the cached images of the originals and become
     * the selection.
     *
     * @return Keys of the duplicates.
     */
    QVector<StrokeKey> duplicateSelection();

    // ===== Eraser =====

    /// Trash every brush and shape stroke with a hitbox touching @p eraserBounds.
    StoreFlags trashCollidingStrokes(const QRectF& eraserBounds, const QRectF& viewport);

    struct SplitResult {
        QVector<StrokeKey> modifiedKeys;    ///< Shortened, trashed and newly created strokes
        StoreFlags flags;
    };

    /**
     * @brief Erase the parts of brush strokes touching @p eraserBounds.
     *
     * Every run of segments between two hits becomes a new stroke if it has at
     * least StoreConfig::eraserMinSplitSegments segments. The original keeps
     * the segments before the first hit, or is trashed if there are none.
     * Shape strokes are trashed as a whole.
     */
    SplitResult splitCollidingStrokes(const QRectF& eraserBounds, const QRectF& viewport);

    // ===== Render Components =====

    /// nullptr for unknown keys.
    const RenderComponent* renderComponent(const StrokeKey& key) const;
    RenderComponent* renderComponentMut(const StrokeKey& key);

    /**
     * @brief Invalidate cached images.
     *
     * While a render task is in flight the stroke is flagged instead, and the
     * completion leaves it Dirty.
     */
    void setRenderingDirty(const StrokeKey& key);
    void setRenderingDirtyForStrokes(const QVector<StrokeKey>& keys);
    void setRenderingDirtyAll();

    /// Drop cached images and mark dirty.
    void clearRenderingForStrokes(const QVector<StrokeKey>& keys);

    // ===== History =====

    /// Record the current state as a new undo step.
    StoreFlags record();

    /// Overwrite the live history entry with the current state.
    StoreFlags updateLatestHistoryEntry();

    /**
     * @brief Step back one entry.
     *
     * Changes that were not recorded yet are recorded first, so they can be
     * redone. No-op when there is nothing to undo.
     */
    StoreFlags undo();
    StoreFlags redo();

    bool canUndo() const;
    bool canRedo() const { return m_history.canRedo(); }

    /// Forget all history, the current state becomes the only entry.
    StoreFlags clearHistory();

    const StrokeHistory& history() const { return m_history; }

    // ===== Snapshots & Persistence =====

    /// O(1) read-only copy of the tables.
    StoreSnapshot takeSnapshot() const;

    /**
     * @brief Replace the whole content with a snapshot and reset history.
     *
     * Render components start out Dirty for every stroke.
     */
    void importFromSnapshot(const StoreSnapshot& snapshot);

    /**
     * @brief Serialize strokes and components.
     *
     * Keys are written as indices into the "strokes" array in chrono order;
     * they are reassigned on load.
     */
    QJsonObject toJson() const;

    /**
     * @brief Replace the content with serialized data. History is reset.
     * @param errorMessage Receives a description when loading fails.
     * @return false if the data is malformed. The store is left unchanged then.
     */
    bool loadFromJson(const QJsonObject& obj, QString* errorMessage = nullptr);

    // ===== Spatial Index =====

    const SpatialIndex& spatialIndex() const { return m_index; }

    /// Offset of duplicated strokes.
    static constexpr qreal DUPLICATE_OFFSET = 32.0;

private:
    HistoryEntry currentEntry() const;
    void importHistoryEntry(const HistoryEntry& entry);
    void rebuildIndex();

    /// Apply @p fn to every existing stroke through copy-on-write, then sync the index.
    template <typename Fn>
    void mutateStrokes(const QVector<StrokeKey>& keys, Fn fn);

    /// Apply @p fn to the cached images of every key.
    template <typename Fn>
    void mutateImages(const QVector<StrokeKey>& keys, bool markDirty, Fn fn);

    /// Geometry changed while a task may be in flight: its result will be outdated.
    void flagInFlightRender(const StrokeKey& key);

    QVector<StrokeKey> sortedByChrono(QVector<StrokeKey> keys) const;
    QVector<StrokeKey> filterAsRendered(const QVector<StrokeKey>& keys) const;

    /// The two-tier containment test shared by the aabb and polygon hit tests.
    template <typename Contains>
    QVector<StrokeKey> hitboxesContained(const QRectF& viewport, const QRectF& region,
                                         Contains contains) const;

    StoreConfig m_config;

    StrokeTable m_strokes;
    ComponentTable<TrashComponent> m_trash;
    ComponentTable<SelectionComponent> m_selection;
    ComponentTable<ChronoComponent> m_chrono;
    QHash<StrokeKey, RenderComponent> m_render;
    SpatialIndex m_index;

    quint32 m_chronoCounter = 0;
    quint32 m_generationCounter = 0;    ///< Never reset, not part of history

    StrokeHistory m_history;
};
