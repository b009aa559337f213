// ============================================================================
// StrokeStore - Implementation
// ============================================================================

#include "StrokeStore.h"
#include "../core/Bounds.h"
#include "../strokes/BrushStroke.h"

#include <QJsonArray>
#include <QDebug>

#include <algorithm>

namespace {

/// True if @p rect lies inside @p polygon: all corners inside, no edge crossing the interior.
bool polygonContainsRect(const QPolygonF& polygon, const QRectF& rect)
{
    const QPointF corners[4] = { rect.topLeft(), rect.topRight(),
                                 rect.bottomRight(), rect.bottomLeft() };
    for (const QPointF& corner : corners) {
        if (!polygon.containsPoint(corner, Qt::OddEvenFill)) {
            return false;
        }
    }

    // Corners inside is not enough for concave polygons
    constexpr qreal EPS = 1e-9;
    if (rect.width() <= 2 * EPS || rect.height() <= 2 * EPS) {
        return true;
    }
    const QRectF interior = rect.adjusted(EPS, EPS, -EPS, -EPS);
    const int n = polygon.size();
    for (int i = 0; i < n; ++i) {
        if (Bounds::segmentIntersects(interior, polygon.at(i), polygon.at((i + 1) % n))) {
            return false;
        }
    }
    return true;
}

/// True if the polyline @p path touches @p box. A single point counts as well.
bool pathIntersectsBox(const QVector<QPointF>& path, const QRectF& box)
{
    if (path.size() == 1) {
        return Bounds::containsPoint(box, path.first());
    }
    for (int i = 0; i + 1 < path.size(); ++i) {
        if (Bounds::segmentIntersects(box, path.at(i), path.at(i + 1))) {
            return true;
        }
    }
    return false;
}

/// Translate and scale mapping @p from onto @p to.
void boundsMapping(const QRectF& from, const QRectF& to, QPointF& factors)
{
    factors.setX(from.width() > 0.0 ? to.width() / from.width() : 1.0);
    factors.setY(from.height() > 0.0 ? to.height() / from.height() : 1.0);
}

} // namespace

StrokeStore::StrokeStore(const StoreConfig& config)
    : m_config(config)
    , m_history(config.historyMaxLen)
{
    m_history.clear(currentEntry());
}

void StrokeStore::setConfig(const StoreConfig& config)
{
    m_config = config;
    m_history.setMaxLen(config.historyMaxLen);
}

// ============================================================================
// Insert & Remove
// ============================================================================

StrokeKey StrokeStore::insertStroke(std::shared_ptr<Stroke> stroke)
{
    if (!stroke) {
        qWarning() << "StrokeStore::insertStroke: null stroke";
        return StrokeKey();
    }
    const StrokeLayer layer = stroke->defaultLayer();
    return insertStroke(std::move(stroke), layer);
}

StrokeKey StrokeStore::insertStroke(std::shared_ptr<Stroke> stroke, const StrokeLayer& layer)
{
    if (!stroke) {
        qWarning() << "StrokeStore::insertStroke: null stroke";
        return StrokeKey();
    }

    const QRectF bounds = stroke->bounds();
    const StrokeKey key = m_strokes.insert(std::move(stroke), ++m_generationCounter);
    m_index.insert(key, bounds);
    m_chronoCounter++;

    m_trash.insert(key, TrashComponent());
    m_selection.insert(key, SelectionComponent());
    m_chrono.insert(key, ChronoComponent{m_chronoCounter, layer});
    m_render.insert(key, RenderComponent());
    return key;
}

std::shared_ptr<Stroke> StrokeStore::removeStroke(const StrokeKey& key)
{
    if (!m_strokes.contains(key)) {
        return nullptr;
    }

    m_index.remove(key);
    m_trash.remove(key);
    m_selection.remove(key);
    m_chrono.remove(key);
    m_render.remove(key);
    return m_strokes.remove(key);
}

QVector<StrokeKey> StrokeStore::removeTrashedStrokes()
{
    const QVector<StrokeKey> trashed = trashedKeysUnordered();
    for (const StrokeKey& key : trashed) {
        removeStroke(key);
    }
    return trashed;
}

void StrokeStore::clear()
{
    m_strokes.clear();
    m_trash.clear();
    m_selection.clear();
    m_chrono.clear();
    m_render.clear();
    m_index.clear();
}

// ============================================================================
// Access
// ============================================================================

std::shared_ptr<const Stroke> StrokeStore::getStrokeRef(const StrokeKey& key) const
{
    return m_strokes.get(key);
}

QVector<std::shared_ptr<const Stroke>> StrokeStore::getStrokesRef(const QVector<StrokeKey>& keys) const
{
    QVector<std::shared_ptr<const Stroke>> result;
    result.reserve(keys.size());
    for (const StrokeKey& key : keys) {
        std::shared_ptr<const Stroke> stroke = m_strokes.get(key);
        if (stroke) {
            result.append(std::move(stroke));
        }
    }
    return result;
}

Stroke* StrokeStore::getStrokeMut(const StrokeKey& key)
{
    std::shared_ptr<Stroke>* slot = m_strokes.slotMut(key);
    if (!slot) {
        return nullptr;
    }
    // Shared with history or a render task: clone before writing
    if (slot->use_count() > 1) {
        *slot = std::shared_ptr<Stroke>((*slot)->clone());
    }
    return slot->get();
}

// ============================================================================
// Geometry
// ============================================================================

void StrokeStore::updateGeometryForStroke(const StrokeKey& key)
{
    const std::shared_ptr<const Stroke> stroke = m_strokes.get(key);
    if (!stroke) {
        return;
    }
    m_index.update(key, stroke->bounds());
    setRenderingDirty(key);
}

void StrokeStore::updateGeometryForStrokes(const QVector<StrokeKey>& keys)
{
    for (const StrokeKey& key : keys) {
        updateGeometryForStroke(key);
    }
}

void StrokeStore::flagInFlightRender(const StrokeKey& key)
{
    auto it = m_render.find(key);
    if (it != m_render.end() && it->state == RenderComponent::State::Busy) {
        it->pendingDirty = true;
    }
}

template <typename Fn>
void StrokeStore::mutateStrokes(const QVector<StrokeKey>& keys, Fn fn)
{
    for (const StrokeKey& key : keys) {
        Stroke* stroke = getStrokeMut(key);
        if (!stroke) {
            continue;
        }
        fn(*stroke);
        m_index.update(key, stroke->bounds());
        flagInFlightRender(key);
    }
}

template <typename Fn>
void StrokeStore::mutateImages(const QVector<StrokeKey>& keys, bool markDirty, Fn fn)
{
    for (const StrokeKey& key : keys) {
        auto it = m_render.find(key);
        if (it == m_render.end()) {
            continue;
        }
        for (RenderImage& image : it->images) {
            fn(image);
        }
        if (markDirty) {
            setRenderingDirty(key);
        }
    }
}

void StrokeStore::translateStrokes(const QVector<StrokeKey>& keys, const QPointF& offset)
{
    mutateStrokes(keys, [&offset](Stroke& stroke) { stroke.translate(offset); });
}

void StrokeStore::rotateStrokes(const QVector<StrokeKey>& keys, qreal angle, const QPointF& center)
{
    mutateStrokes(keys, [angle, &center](Stroke& stroke) { stroke.rotate(angle, center); });
}

void StrokeStore::scaleStrokes(const QVector<StrokeKey>& keys, const QPointF& factors)
{
    mutateStrokes(keys, [&factors](Stroke& stroke) { stroke.scale(factors); });
}

void StrokeStore::scaleStrokesWithPivot(const QVector<StrokeKey>& keys, const QPointF& factors,
                                        const QPointF& pivot)
{
    mutateStrokes(keys, [&factors, &pivot](Stroke& stroke) {
        stroke.translate(-pivot);
        stroke.scale(factors);
        stroke.translate(pivot);
    });
}

void StrokeStore::resizeStrokes(const QVector<StrokeKey>& keys, const QRectF& newBounds)
{
    const QRectF oldBounds = boundsForStrokes(keys);
    if (!oldBounds.isValid()) {
        return;
    }
    QPointF factors;
    boundsMapping(oldBounds, newBounds, factors);

    mutateStrokes(keys, [&](Stroke& stroke) {
        stroke.translate(-oldBounds.topLeft());
        stroke.scale(factors);
        stroke.translate(newBounds.topLeft());
    });
}

void StrokeStore::translateStrokesImages(const QVector<StrokeKey>& keys, const QPointF& offset)
{
    mutateImages(keys, false, [&offset](RenderImage& image) { image.translate(offset); });
}

void StrokeStore::rotateStrokesImages(const QVector<StrokeKey>& keys, qreal angle, const QPointF& center)
{
    mutateImages(keys, true, [angle, &center](RenderImage& image) { image.rotate(angle, center); });
}

void StrokeStore::scaleStrokesImages(const QVector<StrokeKey>& keys, const QPointF& factors)
{
    mutateImages(keys, true, [&factors](RenderImage& image) { image.scale(factors); });
}

void StrokeStore::scaleStrokesImagesWithPivot(const QVector<StrokeKey>& keys, const QPointF& factors,
                                              const QPointF& pivot)
{
    mutateImages(keys, true, [&factors, &pivot](RenderImage& image) {
        image.translate(-pivot);
        image.scale(factors);
        image.translate(pivot);
    });
}

void StrokeStore::resizeStrokesImages(const QVector<StrokeKey>& keys, const QRectF& newBounds)
{
    // Uses the current stroke bounds, so call this before resizeStrokes()
    const QRectF oldBounds = boundsForStrokes(keys);
    if (!oldBounds.isValid()) {
        return;
    }
    QPointF factors;
    boundsMapping(oldBounds, newBounds, factors);

    mutateImages(keys, true, [&](RenderImage& image) {
        image.translate(-oldBounds.topLeft());
        image.scale(factors);
        image.translate(newBounds.topLeft());
    });
}

StoreFlags StrokeStore::changeStrokeColors(const QVector<StrokeKey>& keys, const QColor& color)
{
    StoreFlags flags;
    for (const StrokeKey& key : keys) {
        Stroke* stroke = getStrokeMut(key);
        if (!stroke) {
            continue;
        }
        stroke->setStrokeColor(color);
        setRenderingDirty(key);
        flags.redraw = true;
        flags.storeModified = true;
    }
    return flags;
}

StoreFlags StrokeStore::changeFillColors(const QVector<StrokeKey>& keys, const QColor& color)
{
    StoreFlags flags;
    for (const StrokeKey& key : keys) {
        Stroke* stroke = getStrokeMut(key);
        if (!stroke) {
            continue;
        }
        stroke->setFillColor(color);
        setRenderingDirty(key);
        flags.redraw = true;
        flags.storeModified = true;
    }
    return flags;
}

// ============================================================================
// Trash, Selection & Chrono
// ============================================================================

bool StrokeStore::isTrashed(const StrokeKey& key) const
{
    const TrashComponent* trash = m_trash.get(key);
    return trash && trash->trashed;
}

bool StrokeStore::isSelected(const StrokeKey& key) const
{
    const SelectionComponent* selection = m_selection.get(key);
    return selection && selection->selected;
}

void StrokeStore::setTrashed(const StrokeKey& key, bool trashed)
{
    TrashComponent* trash = m_trash.getMut(key);
    if (!trash) {
        return;
    }
    trash->trashed = trashed;
    updateChronoToLast(key);
}

void StrokeStore::setTrashedKeys(const QVector<StrokeKey>& keys, bool trashed)
{
    for (const StrokeKey& key : keys) {
        setSelected(key, false);
        setTrashed(key, trashed);
    }
}

void StrokeStore::setSelected(const StrokeKey& key, bool selected)
{
    SelectionComponent* selection = m_selection.getMut(key);
    if (!selection) {
        return;
    }
    selection->selected = selected;
    updateChronoToLast(key);
}

void StrokeStore::setSelectedKeys(const QVector<StrokeKey>& keys, bool selected)
{
    for (const StrokeKey& key : keys) {
        setSelected(key, selected);
    }
}

void StrokeStore::updateChronoToLast(const StrokeKey& key)
{
    ChronoComponent* chrono = m_chrono.getMut(key);
    if (!chrono) {
        return;
    }
    m_chronoCounter++;
    chrono->t = m_chronoCounter;
}

// ============================================================================
// Layers
// ============================================================================

StrokeLayer StrokeStore::layer(const StrokeKey& key) const
{
    const ChronoComponent* chrono = m_chrono.get(key);
    return chrono ? chrono->layer : StrokeLayer::user(0);
}

void StrokeStore::setLayer(const QVector<StrokeKey>& keys, const StrokeLayer& layer)
{
    for (const StrokeKey& key : keys) {
        ChronoComponent* chrono = m_chrono.getMut(key);
        if (chrono) {
            chrono->layer = layer;
        }
    }
}

void StrokeStore::moveLayerUp(const QVector<StrokeKey>& keys)
{
    for (const StrokeKey& key : keys) {
        ChronoComponent* chrono = m_chrono.getMut(key);
        if (chrono) {
            chrono->layer = chrono->layer.userUp();
        }
    }
}

void StrokeStore::moveLayerDown(const QVector<StrokeKey>& keys)
{
    for (const StrokeKey& key : keys) {
        ChronoComponent* chrono = m_chrono.getMut(key);
        if (chrono) {
            chrono->layer = chrono->layer.userDown();
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

QVector<StrokeKey> StrokeStore::sortedByChrono(QVector<StrokeKey> keys) const
{
    QVector<QPair<ChronoComponent, StrokeKey>> entries;
    entries.reserve(keys.size());
    for (const StrokeKey& key : keys) {
        const ChronoComponent* chrono = m_chrono.get(key);
        if (chrono) {
            entries.append(qMakePair(*chrono, key));
        }
    }

    std::sort(entries.begin(), entries.end(),
              [](const QPair<ChronoComponent, StrokeKey>& a, const QPair<ChronoComponent, StrokeKey>& b) {
                  if (a.first < b.first) return true;
                  if (b.first < a.first) return false;
                  return a.second < b.second;
              });

    keys.clear();
    for (const auto& entry : entries) {
        keys.append(entry.second);
    }
    return keys;
}

QVector<StrokeKey> StrokeStore::filterAsRendered(const QVector<StrokeKey>& keys) const
{
    QVector<StrokeKey> result;
    result.reserve(keys.size());
    for (const StrokeKey& key : keys) {
        if (!isTrashed(key)) {
            result.append(key);
        }
    }
    return result;
}

QVector<StrokeKey> StrokeStore::keysSortedChrono() const
{
    return sortedByChrono(m_chrono.keys());
}

QVector<StrokeKey> StrokeStore::keysSortedChronoIntersectingBounds(const QRectF& bounds) const
{
    return sortedByChrono(m_index.keysIntersecting(bounds));
}

QVector<StrokeKey> StrokeStore::keysSortedChronoInBounds(const QRectF& bounds) const
{
    return sortedByChrono(m_index.keysContainedIn(bounds));
}

QVector<StrokeKey> StrokeStore::strokeKeysAsRendered() const
{
    return filterAsRendered(keysSortedChrono());
}

QVector<StrokeKey> StrokeStore::strokeKeysAsRenderedIntersectingBounds(const QRectF& bounds) const
{
    return filterAsRendered(keysSortedChronoIntersectingBounds(bounds));
}

QVector<StrokeKey> StrokeStore::strokeKeysAsRenderedInBounds(const QRectF& bounds) const
{
    return filterAsRendered(keysSortedChronoInBounds(bounds));
}

QVector<StrokeKey> StrokeStore::selectionKeysAsRendered() const
{
    QVector<StrokeKey> result;
    for (const StrokeKey& key : strokeKeysAsRendered()) {
        if (isSelected(key)) {
            result.append(key);
        }
    }
    return result;
}

QVector<StrokeKey> StrokeStore::selectionKeysAsRenderedIntersectingBounds(const QRectF& bounds) const
{
    QVector<StrokeKey> result;
    for (const StrokeKey& key : strokeKeysAsRenderedIntersectingBounds(bounds)) {
        if (isSelected(key)) {
            result.append(key);
        }
    }
    return result;
}

QVector<StrokeKey> StrokeStore::trashedKeysUnordered() const
{
    QVector<StrokeKey> result;
    const auto& trash = m_trash.constData();
    for (auto it = trash.constBegin(); it != trash.constEnd(); ++it) {
        if (it.value().trashed) {
            result.append(it.key());
        }
    }
    return result;
}

QVector<StrokeKey> StrokeStore::selectionKeysUnordered() const
{
    QVector<StrokeKey> result;
    const auto& selection = m_selection.constData();
    for (auto it = selection.constBegin(); it != selection.constEnd(); ++it) {
        if (it.value().selected && !isTrashed(it.key())) {
            result.append(it.key());
        }
    }
    return result;
}

QRectF StrokeStore::boundsForStrokes(const QVector<StrokeKey>& keys) const
{
    QRectF result;
    bool first = true;
    for (const StrokeKey& key : keys) {
        const std::shared_ptr<const Stroke> stroke = m_strokes.get(key);
        if (!stroke) {
            continue;
        }
        result = first ? stroke->bounds() : Bounds::merged(result, stroke->bounds());
        first = false;
    }
    return result;
}

QRectF StrokeStore::boundsNonTrashed() const
{
    return boundsForStrokes(filterAsRendered(m_strokes.keys()));
}

QVector<QRectF> StrokeStore::strokesBoundsAsRendered() const
{
    QVector<QRectF> result;
    for (const StrokeKey& key : strokeKeysAsRendered()) {
        result.append(m_strokes.get(key)->bounds());
    }
    return result;
}

// ============================================================================
// Hit Tests
// ============================================================================

template <typename Contains>
QVector<StrokeKey> StrokeStore::hitboxesContained(const QRectF& viewport, const QRectF& region,
                                                  Contains contains) const
{
    QVector<StrokeKey> result;
    for (const StrokeKey& key : keysSortedChronoIntersectingBounds(viewport)) {
        if (isTrashed(key)) {
            continue;
        }
        const std::shared_ptr<const Stroke> stroke = m_strokes.get(key);
        if (!stroke) {
            continue;
        }

        const QRectF strokeBounds = stroke->bounds();
        if (contains(strokeBounds)) {
            result.append(key);
            continue;
        }
        if (!Bounds::intersects(region, strokeBounds)) {
            continue;
        }

        const QVector<QRectF> hitboxes = stroke->hitboxes();
        if (hitboxes.isEmpty()) {
            continue;
        }
        bool all = true;
        for (const QRectF& hitbox : hitboxes) {
            if (!contains(hitbox)) {
                all = false;
                break;
            }
        }
        if (all) {
            result.append(key);
        }
    }
    return result;
}

QVector<StrokeKey> StrokeStore::strokeHitboxesContainedInPathPolygon(const QPolygonF& polygon,
                                                                     const QRectF& viewport) const
{
    if (polygon.size() < 3) {
        return {};
    }
    return hitboxesContained(viewport, polygon.boundingRect(), [&polygon](const QRectF& box) {
        return polygonContainsRect(polygon, box);
    });
}

QVector<StrokeKey> StrokeStore::strokeHitboxesContainedInAabb(const QRectF& aabb,
                                                              const QRectF& viewport) const
{
    return hitboxesContained(viewport, aabb, [&aabb](const QRectF& box) {
        return Bounds::contains(aabb, box);
    });
}

QVector<StrokeKey> StrokeStore::strokeHitboxesIntersectPath(const QVector<QPointF>& path,
                                                            const QRectF& viewport) const
{
    QVector<StrokeKey> result;
    if (path.isEmpty()) {
        return result;
    }

    for (const StrokeKey& key : keysSortedChronoIntersectingBounds(viewport)) {
        if (isTrashed(key)) {
            continue;
        }
        const std::shared_ptr<const Stroke> stroke = m_strokes.get(key);
        if (!stroke || !pathIntersectsBox(path, stroke->bounds())) {
            continue;
        }
        for (const QRectF& hitbox : stroke->hitboxes()) {
            if (pathIntersectsBox(path, hitbox)) {
                result.append(key);
                break;
            }
        }
    }
    return result;
}

QVector<StrokeKey> StrokeStore::strokeHitboxesContainCoord(const QPointF& coord,
                                                           const QRectF& viewport) const
{
    QVector<StrokeKey> result;
    for (const StrokeKey& key : strokeKeysAsRenderedIntersectingBounds(viewport)) {
        const std::shared_ptr<const Stroke> stroke = m_strokes.get(key);
        if (!stroke || !Bounds::containsPoint(stroke->bounds(), coord)) {
            continue;
        }
        for (const QRectF& hitbox : stroke->hitboxes()) {
            if (Bounds::containsPoint(hitbox, coord)) {
                result.append(key);
                break;
            }
        }
    }
    return result;
}

// ============================================================================
// Content
// ============================================================================

StrokeContent StrokeStore::copyStrokeContent(const QVector<StrokeKey>& keys) const
{
    return StrokeContent(getStrokesRef(sortedByChrono(keys)));
}

StrokeContent StrokeStore::cutStrokeContent(const QVector<StrokeKey>& keys)
{
    StrokeContent content = copyStrokeContent(keys);
    for (const StrokeKey& key : keys) {
        setSelected(key, false);
        setTrashed(key, true);
    }
    return content;
}

QVector<StrokeKey> StrokeStore::insertStrokeContent(const StrokeContent& content, qreal ratio,
                                                    const QPointF& pos)
{
    QVector<StrokeKey> inserted;
    const QRectF contentBounds = content.bounds();
    if (content.isEmpty() || !contentBounds.isValid()) {
        return inserted;
    }
    if (ratio <= 0.0) {
        qWarning() << "StrokeStore::insertStrokeContent: invalid ratio" << ratio << ", using 1.0";
        ratio = 1.0;
    }

    setSelectedKeys(selectionKeysUnordered(), false);

    const QPointF offset = pos - contentBounds.topLeft();
    const bool rescale = !qFuzzyCompare(ratio, 1.0);

    for (const auto& source : content.strokes) {
        std::shared_ptr<Stroke> stroke(source->clone());
        stroke->translate(offset);
        if (rescale) {
            stroke->translate(-pos);
            stroke->scale(QPointF(ratio, ratio));
            stroke->translate(pos);
        }
        inserted.append(insertStroke(std::move(stroke)));
    }

    setSelectedKeys(inserted, true);
    return inserted;
}

QVector<StrokeKey> StrokeStore::duplicateSelection()
{
    const QVector<StrokeKey> original = selectionKeysAsRendered();
    QVector<StrokeKey> duplicates;
    if (original.isEmpty()) {
        return duplicates;
    }

    setSelectedKeys(original, false);

    for (const StrokeKey& key : original) {
        const std::shared_ptr<const Stroke> stroke = m_strokes.get(key);
        if (!stroke) {
            continue;
        }
        const StrokeKey newKey = insertStroke(std::shared_ptr<Stroke>(stroke->clone()), layer(key));

        // Take over the cached images, they only need the offset
        const RenderComponent source = m_render.value(key);
        if (source.state == RenderComponent::State::Complete
            || source.state == RenderComponent::State::ForViewport) {
            RenderComponent& target = m_render[newKey];
            target.images = source.images;
            target.state = source.state;
            target.viewport = source.viewport;
        }
        duplicates.append(newKey);
    }

    setSelectedKeys(duplicates, true);

    const QPointF offset(DUPLICATE_OFFSET, DUPLICATE_OFFSET);
    translateStrokes(duplicates, offset);
    translateStrokesImages(duplicates, offset);
    return duplicates;
}

// ============================================================================
// Eraser
// ============================================================================

StoreFlags StrokeStore::trashCollidingStrokes(const QRectF& eraserBounds, const QRectF& viewport)
{
    StoreFlags flags;
    for (const StrokeKey& key : strokeKeysAsRenderedIntersectingBounds(viewport)) {
        const std::shared_ptr<const Stroke> stroke = m_strokes.get(key);
        if (!stroke) {
            continue;
        }
        if (stroke->kind() != Stroke::Kind::Brush && stroke->kind() != Stroke::Kind::Shape) {
            continue;
        }
        if (!Bounds::intersects(eraserBounds, stroke->bounds())) {
            continue;
        }

        for (const QRectF& hitbox : stroke->hitboxes()) {
            if (Bounds::intersects(eraserBounds, hitbox)) {
                setTrashed(key, true);
                flags.storeModified = true;
                flags.resize = true;
                flags.redraw = true;
                break;
            }
        }
    }
    return flags;
}

StrokeStore::SplitResult StrokeStore::splitCollidingStrokes(const QRectF& eraserBounds,
                                                            const QRectF& viewport)
{
    SplitResult result;
    QVector<QPair<std::shared_ptr<Stroke>, StrokeLayer>> newStrokes;
    const int minSegments = qMax(1, m_config.eraserMinSplitSegments);

    for (const StrokeKey& key : strokeKeysAsRenderedIntersectingBounds(viewport)) {
        const std::shared_ptr<const Stroke> stroke = m_strokes.get(key);
        if (!stroke || !Bounds::intersects(eraserBounds, stroke->bounds())) {
            continue;
        }
        const StrokeLayer strokeLayer = layer(key);
        bool trashStroke = false;

        if (stroke->kind() == Stroke::Kind::Brush) {
            const auto* brush = static_cast<const BrushStroke*>(stroke.get());
            const PenPath& path = brush->path();
            const QVector<int> hits = path.hittest(eraserBounds, brush->style().width * 0.5);
            if (hits.isEmpty()) {
                continue;
            }

            // Segments [from, to): the first one only provides the start element
            auto addRemnant = [&](int from, int to) {
                if (to - from < minSegments) {
                    return;
                }
                const PenPath remnant(path.segments.at(from).end,
                                      path.segments.mid(from + 1, to - from - 1));
                newStrokes.append(qMakePair(
                    std::shared_ptr<Stroke>(std::make_shared<BrushStroke>(remnant, brush->style())),
                    strokeLayer));
            };

            int prev = hits.first();
            for (int i = 1; i < hits.size(); ++i) {
                addRemnant(prev, hits.at(i));
                prev = hits.at(i);
            }
            addRemnant(prev, path.segments.size());

            const int firstHit = hits.first();
            if (firstHit > 0) {
                const PenPath kept(path.start, path.segments.mid(0, firstHit));
                auto* mutBrush = static_cast<BrushStroke*>(getStrokeMut(key));
                mutBrush->replacePath(kept);
                updateGeometryForStroke(key);
            } else {
                trashStroke = true;
            }
            result.modifiedKeys.append(key);
        } else if (stroke->kind() == Stroke::Kind::Shape) {
            for (const QRectF& hitbox : stroke->hitboxes()) {
                if (Bounds::intersects(eraserBounds, hitbox)) {
                    trashStroke = true;
                    result.modifiedKeys.append(key);
                    break;
                }
            }
        }

        if (trashStroke) {
            setTrashed(key, true);
        }
    }

    for (const auto& entry : newStrokes) {
        result.modifiedKeys.append(insertStroke(entry.first, entry.second));
    }

    if (!result.modifiedKeys.isEmpty()) {
        result.flags.storeModified = true;
        result.flags.resize = true;
        result.flags.redraw = true;
    }
    return result;
}

// ============================================================================
// Render Components
// ============================================================================

const RenderComponent* StrokeStore::renderComponent(const StrokeKey& key) const
{
    auto it = m_render.constFind(key);
    return it == m_render.constEnd() ? nullptr : &it.value();
}

RenderComponent* StrokeStore::renderComponentMut(const StrokeKey& key)
{
    auto it = m_render.find(key);
    return it == m_render.end() ? nullptr : &it.value();
}

void StrokeStore::setRenderingDirty(const StrokeKey& key)
{
    auto it = m_render.find(key);
    if (it == m_render.end()) {
        return;
    }
    if (it->state == RenderComponent::State::Busy) {
        it->pendingDirty = true;
    } else {
        it->state = RenderComponent::State::Dirty;
    }
}

void StrokeStore::setRenderingDirtyForStrokes(const QVector<StrokeKey>& keys)
{
    for (const StrokeKey& key : keys) {
        setRenderingDirty(key);
    }
}

void StrokeStore::setRenderingDirtyAll()
{
    for (auto it = m_render.begin(); it != m_render.end(); ++it) {
        if (it->state == RenderComponent::State::Busy) {
            it->pendingDirty = true;
        } else {
            it->state = RenderComponent::State::Dirty;
        }
    }
}

void StrokeStore::clearRenderingForStrokes(const QVector<StrokeKey>& keys)
{
    for (const StrokeKey& key : keys) {
        auto it = m_render.find(key);
        if (it == m_render.end()) {
            continue;
        }
        // Leaving Busy also drops the result of a task still in flight
        it->images.clear();
        it->state = RenderComponent::State::Dirty;
        it->pendingDirty = false;
    }
}

// ============================================================================
// History
// ============================================================================

HistoryEntry StrokeStore::currentEntry() const
{
    HistoryEntry entry;
    entry.strokes = m_strokes;
    entry.trash = m_trash;
    entry.selection = m_selection;
    entry.chrono = m_chrono;
    entry.chronoCounter = m_chronoCounter;
    return entry;
}

void StrokeStore::rebuildIndex()
{
    QVector<QPair<StrokeKey, QRectF>> entries;
    const QVector<StrokeKey> keys = m_strokes.keys();
    entries.reserve(keys.size());
    for (const StrokeKey& key : keys) {
        entries.append(qMakePair(key, m_strokes.get(key)->bounds()));
    }
    m_index.rebuild(entries);
}

void StrokeStore::importHistoryEntry(const HistoryEntry& entry)
{
    m_strokes = entry.strokes;
    m_trash = entry.trash;
    m_selection = entry.selection;
    m_chrono = entry.chrono;
    m_chronoCounter = entry.chronoCounter;

    rebuildIndex();

    // Keep the cached images of strokes that still exist, they stay visible
    // until re-rendered
    for (auto it = m_render.begin(); it != m_render.end();) {
        if (!m_strokes.contains(it.key())) {
            it = m_render.erase(it);
        } else {
            ++it;
        }
    }
    for (const StrokeKey& key : m_strokes.keys()) {
        if (!m_render.contains(key)) {
            m_render.insert(key, RenderComponent());
        }
    }
    setRenderingDirtyAll();
}

StoreFlags StrokeStore::record()
{
    StoreFlags flags;
    m_history.record(currentEntry());
    flags.hideUndo = !canUndo();
    flags.hideRedo = !canRedo();
    return flags;
}

StoreFlags StrokeStore::updateLatestHistoryEntry()
{
    StoreFlags flags;
    m_history.updateLatest(currentEntry());
    flags.hideUndo = !canUndo();
    flags.hideRedo = !canRedo();
    return flags;
}

StoreFlags StrokeStore::undo()
{
    StoreFlags flags;

    const HistoryEntry current = currentEntry();
    if (!m_history.isLive(current)) {
        m_history.record(current);
    }

    const HistoryEntry* previous = m_history.stepBack();
    if (previous) {
        importHistoryEntry(*previous);
        flags.storeModified = true;
        flags.resize = true;
        flags.redraw = true;
    }

    flags.hideUndo = !canUndo();
    flags.hideRedo = !canRedo();
    return flags;
}

StoreFlags StrokeStore::redo()
{
    StoreFlags flags;

    const HistoryEntry* next = m_history.stepForward();
    if (next) {
        importHistoryEntry(*next);
        flags.storeModified = true;
        flags.resize = true;
        flags.redraw = true;
    }

    flags.hideUndo = !canUndo();
    flags.hideRedo = !canRedo();
    return flags;
}

bool StrokeStore::canUndo() const
{
    // Unrecorded changes are recorded by undo() and can be undone as well
    return m_history.canUndo() || !m_history.isLive(currentEntry());
}

StoreFlags StrokeStore::clearHistory()
{
    StoreFlags flags;
    m_history.clear(currentEntry());
    flags.hideUndo = true;
    flags.hideRedo = true;
    return flags;
}

// ============================================================================
// Snapshots & Persistence
// ============================================================================

StoreSnapshot StrokeStore::takeSnapshot() const
{
    return currentEntry();
}

void StrokeStore::importFromSnapshot(const StoreSnapshot& snapshot)
{
    // Keys handed out later must not collide with keys of the snapshot
    for (const StrokeKey& key : snapshot.strokes.keys()) {
        m_generationCounter = qMax(m_generationCounter, key.generation);
    }

    importHistoryEntry(snapshot);
    m_history.clear(currentEntry());
}

QJsonObject StrokeStore::toJson() const
{
    QJsonArray strokesArray;
    for (const StrokeKey& key : keysSortedChrono()) {
        const std::shared_ptr<const Stroke> stroke = m_strokes.get(key);
        const TrashComponent* trash = m_trash.get(key);
        const SelectionComponent* selection = m_selection.get(key);
        const ChronoComponent* chrono = m_chrono.get(key);
        if (!stroke || !trash || !selection || !chrono) {
            continue;
        }

        QJsonObject entry;
        entry["stroke"] = stroke->toJson();
        entry["trash"] = trash->toJson();
        entry["selection"] = selection->toJson();
        entry["chrono"] = chrono->toJson();
        strokesArray.append(entry);
    }

    QJsonObject obj;
    obj["strokes"] = strokesArray;
    obj["chrono_counter"] = static_cast<qint64>(m_chronoCounter);
    return obj;
}

bool StrokeStore::loadFromJson(const QJsonObject& obj, QString* errorMessage)
{
    if (!obj["strokes"].isArray()) {
        const QString msg = QStringLiteral("Store data has no strokes array");
        qWarning() << "StrokeStore::loadFromJson:" << msg;
        if (errorMessage) {
            *errorMessage = msg;
        }
        return false;
    }

    HistoryEntry loaded;
    quint32 generation = m_generationCounter;
    quint32 maxChrono = 0;

    const QJsonArray strokesArray = obj["strokes"].toArray();
    for (int i = 0; i < strokesArray.size(); ++i) {
        const QJsonObject entry = strokesArray.at(i).toObject();
        std::unique_ptr<Stroke> stroke = Stroke::fromJson(entry["stroke"].toObject());
        if (!stroke) {
            qWarning() << "StrokeStore::loadFromJson: skipping stroke" << i;
            continue;
        }

        ChronoComponent chrono;
        if (entry.contains("chrono")) {
            chrono = ChronoComponent::fromJson(entry["chrono"].toObject());
        } else {
            chrono = ChronoComponent{static_cast<quint32>(i + 1), stroke->defaultLayer()};
        }
        maxChrono = qMax(maxChrono, chrono.t);

        const StrokeKey key = loaded.strokes.insert(std::shared_ptr<Stroke>(std::move(stroke)), ++generation);
        loaded.trash.insert(key, TrashComponent::fromJson(entry["trash"].toObject()));
        loaded.selection.insert(key, SelectionComponent::fromJson(entry["selection"].toObject()));
        loaded.chrono.insert(key, chrono);
    }

    loaded.chronoCounter = qMax(maxChrono, static_cast<quint32>(obj["chrono_counter"].toDouble()));
    m_generationCounter = generation;
    importFromSnapshot(loaded);
    return true;
}
