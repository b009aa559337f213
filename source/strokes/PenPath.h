#pragma once

// ============================================================================
// PenPath - The geometry of a brush stroke
// ============================================================================
// A start element followed by line, quadratic and cubic segments. Every
// segment ends in a StrokePoint, so pressure is known at each segment end.
// ============================================================================

#include "StrokePoint.h"

#include <QVector>
#include <QRectF>
#include <QPainterPath>
#include <QJsonObject>
#include <QJsonArray>

/**
 * @brief One segment of a pen path, starting where the previous one ended.
 */
struct PenSegment {
    enum class Type {
        LineTo,
        QuadBezTo,
        CubBezTo
    };

    Type type = Type::LineTo;
    QPointF cp1;        ///< Control point (QuadBezTo) or first control point (CubBezTo)
    QPointF cp2;        ///< Second control point (CubBezTo only)
    StrokePoint end;    ///< Segment end element

    static PenSegment lineTo(const StrokePoint& end);
    static PenSegment quadBezTo(const QPointF& cp, const StrokePoint& end);
    static PenSegment cubBezTo(const QPointF& cp1, const QPointF& cp2, const StrokePoint& end);

    /// Apply an affine map to every point of the segment.
    void transform(const QTransform& t);

    QJsonObject toJson() const;
    static PenSegment fromJson(const QJsonObject& obj);
};

/**
 * @brief Path of a pen stroke: a start element plus segments.
 */
class PenPath {
public:
    StrokePoint start;
    QVector<PenSegment> segments;

    PenPath() = default;
    explicit PenPath(const StrokePoint& start) : start(start) {}
    PenPath(const StrokePoint& start, const QVector<PenSegment>& segments)
        : start(start), segments(segments) {}

    /// All elements: start followed by every segment end.
    QVector<StrokePoint> elements() const;

    /// Tight bounds of the path centerline.
    QRectF bounds() const;

    /// Hitboxes of the centerline, several per segment for long segments.
    QVector<QRectF> hitboxes() const;

    /**
     * @brief Indices of the segments whose hitboxes, grown by @p loosened, intersect @p hit.
     * @return Ascending segment indices.
     */
    QVector<int> hittest(const QRectF& hit, qreal loosened) const;

    /**
     * @brief Flatten the centerline into elements, interpolating pressure along curves.
     * @param tolerance Maximum chord length of the approximation in document units.
     */
    QVector<StrokePoint> flattened(qreal tolerance = 2.0) const;

    QPainterPath toPainterPath() const;

    /// Sub-path made of the segments [from, to) with the element before @p from as start.
    PenPath subPath(int from, int to) const;

    void translate(const QPointF& offset);
    void rotate(qreal angle, const QPointF& center);
    void scale(const QPointF& factors);
    void transform(const QTransform& t);

    QJsonObject toJson() const;
    static PenPath fromJson(const QJsonObject& obj);

private:
    /// Per-segment hitboxes paired with the segment index.
    QVector<QPair<int, QVector<QRectF>>> hitboxesWithSegmentIndices() const;

    /// Number of sub-lines used for the hitboxes of a segment of the given length.
    static int subsegmentCount(qreal length);

    static constexpr qreal MAX_HITBOX_DIAGONAL = 15.0;
    static constexpr int MAX_SUBSEGMENTS = 5;
};
