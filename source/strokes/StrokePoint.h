#pragma once

// ============================================================================
// StrokePoint - A single pen path element with position and pressure
// ============================================================================

#include <QPointF>
#include <QTransform>
#include <QJsonObject>
#include <QtMath>

/**
 * @brief A single element of a pen path.
 *
 * Used by PenPath as the start element and as the end of every segment.
 * Pressure scales the stroke width at this element.
 */
struct StrokePoint {
    QPointF pos;            ///< Position in document coordinates
    qreal pressure = 0.5;   ///< Pen pressure, 0.0 to 1.0

    StrokePoint() = default;
    StrokePoint(const QPointF& p, qreal pr = 0.5) : pos(p), pressure(pr) {}

    void translate(const QPointF& offset) { pos += offset; }

    /// Rotate around @p center by @p angle radians.
    void rotate(qreal angle, const QPointF& center) {
        QTransform t;
        t.translate(center.x(), center.y());
        t.rotateRadians(angle);
        t.translate(-center.x(), -center.y());
        pos = t.map(pos);
    }

    /// Scale the position relative to the origin.
    void scale(const QPointF& factors) {
        pos = QPointF(pos.x() * factors.x(), pos.y() * factors.y());
    }

    /**
     * @brief Serialize to JSON.
     * @return JSON object with x, y, and p (pressure) fields.
     */
    QJsonObject toJson() const {
        QJsonObject obj;
        obj["x"] = pos.x();
        obj["y"] = pos.y();
        obj["p"] = pressure;
        return obj;
    }

    /**
     * @brief Deserialize from JSON.
     * @param obj JSON object with x, y, and optional p fields.
     */
    static StrokePoint fromJson(const QJsonObject& obj) {
        StrokePoint pt;
        pt.pos = QPointF(obj["x"].toDouble(), obj["y"].toDouble());
        pt.pressure = qBound(0.0, obj["p"].toDouble(0.5), 1.0);
        return pt;
    }
};
