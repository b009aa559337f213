#pragma once

// ============================================================================
// Bounds - Axis-aligned bounding box helpers on top of QRectF
// ============================================================================
// QRectF treats zero-width or zero-height rectangles as null and refuses to
// intersect or contain them. Strokes routinely produce such boxes (a
// horizontal line segment, a single point), so the store and the spatial
// index use these inclusive helpers instead of QRectF::intersects/contains.
// ============================================================================

#include <QRectF>
#include <QPointF>
#include <QVector>
#include <QtMath>

namespace Bounds {

/**
 * @brief Build a normalized box from two corners.
 */
inline QRectF fromCorners(const QPointF& a, const QPointF& b)
{
    return QRectF(QPointF(qMin(a.x(), b.x()), qMin(a.y(), b.y())),
                  QPointF(qMax(a.x(), b.x()), qMax(a.y(), b.y())));
}

/**
 * @brief Smallest box containing all points. Returns an invalid QRectF for an empty list.
 */
inline QRectF fromPoints(const QVector<QPointF>& points)
{
    if (points.isEmpty()) {
        return QRectF();
    }
    qreal minX = points[0].x(), maxX = minX;
    qreal minY = points[0].y(), maxY = minY;
    for (const QPointF& p : points) {
        minX = qMin(minX, p.x());
        maxX = qMax(maxX, p.x());
        minY = qMin(minY, p.y());
        maxY = qMax(maxY, p.y());
    }
    return QRectF(QPointF(minX, minY), QPointF(maxX, maxY));
}

/// Inclusive intersection test, degenerate boxes allowed.
inline bool intersects(const QRectF& a, const QRectF& b)
{
    return a.left() <= b.right() && b.left() <= a.right()
        && a.top() <= b.bottom() && b.top() <= a.bottom();
}

/// True if @p inner lies completely inside @p outer (edges inclusive).
inline bool contains(const QRectF& outer, const QRectF& inner)
{
    return outer.left() <= inner.left() && inner.right() <= outer.right()
        && outer.top() <= inner.top() && inner.bottom() <= outer.bottom();
}

inline bool containsPoint(const QRectF& box, const QPointF& p)
{
    return box.left() <= p.x() && p.x() <= box.right()
        && box.top() <= p.y() && p.y() <= box.bottom();
}

/// Union of two boxes. Degenerate boxes (points, lines) take part like any other.
inline QRectF merged(const QRectF& a, const QRectF& b)
{
    return QRectF(QPointF(qMin(a.left(), b.left()), qMin(a.top(), b.top())),
                  QPointF(qMax(a.right(), b.right()), qMax(a.bottom(), b.bottom())));
}

/// Intersection of two boxes. Only meaningful when intersects(a, b) holds.
inline QRectF intersection(const QRectF& a, const QRectF& b)
{
    if (!intersects(a, b)) {
        return QRectF();
    }
    return QRectF(QPointF(qMax(a.left(), b.left()), qMax(a.top(), b.top())),
                  QPointF(qMin(a.right(), b.right()), qMin(a.bottom(), b.bottom())));
}

/// Grow the box by @p amount on every side.
inline QRectF loosened(const QRectF& box, qreal amount)
{
    return box.adjusted(-amount, -amount, amount, amount);
}

/**
 * @brief Grow the box on every side by @p factor times its own extents.
 *
 * extended(viewport, 0.4) adds 40% of the width left and right and 40% of the
 * height above and below.
 */
inline QRectF extendedByFactor(const QRectF& box, qreal factor)
{
    const qreal dx = box.width() * factor;
    const qreal dy = box.height() * factor;
    return box.adjusted(-dx, -dy, dx, dy);
}

inline qreal area(const QRectF& box)
{
    return qMax<qreal>(0.0, box.width()) * qMax<qreal>(0.0, box.height());
}

/**
 * @brief True if the line segment a-b touches the box (Liang-Barsky clipping).
 */
inline bool segmentIntersects(const QRectF& box, const QPointF& a, const QPointF& b)
{
    const qreal dx = b.x() - a.x();
    const qreal dy = b.y() - a.y();
    const qreal p[4] = { -dx, dx, -dy, dy };
    const qreal q[4] = { a.x() - box.left(), box.right() - a.x(),
                         a.y() - box.top(), box.bottom() - a.y() };

    qreal t0 = 0.0;
    qreal t1 = 1.0;
    for (int i = 0; i < 4; ++i) {
        if (qFuzzyIsNull(p[i])) {
            if (q[i] < 0.0) {
                return false;   // parallel and outside
            }
            continue;
        }
        const qreal t = q[i] / p[i];
        if (p[i] < 0.0) {
            t0 = qMax(t0, t);
        } else {
            t1 = qMin(t1, t);
        }
        if (t0 > t1) {
            return false;
        }
    }
    return true;
}

} // namespace Bounds
