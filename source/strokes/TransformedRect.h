#pragma once

// ============================================================================
// TransformedRect - A rectangle with an affine transform
// ============================================================================
// Placement of images and text. Keeping the transform separate from the
// rectangle makes rotation exact instead of growing an axis-aligned box.
// ============================================================================

#include <QRectF>
#include <QTransform>
#include <QPolygonF>
#include <QJsonObject>
#include <QJsonArray>

struct TransformedRect {
    QRectF rect;            ///< Untransformed rectangle
    QTransform transform;   ///< Maps rect into document coordinates

    TransformedRect() = default;
    explicit TransformedRect(const QRectF& r) : rect(r) {}

    /// Axis-aligned bounds after the transform.
    QRectF bounds() const { return transform.mapRect(rect); }

    /// The four corners after the transform.
    QPolygonF outline() const { return transform.map(QPolygonF(rect)); }

    void translate(const QPointF& offset) {
        transform = transform * QTransform::fromTranslate(offset.x(), offset.y());
    }

    void rotate(qreal angle, const QPointF& center) {
        QTransform rotation;
        rotation.translate(center.x(), center.y());
        rotation.rotateRadians(angle);
        rotation.translate(-center.x(), -center.y());
        transform = transform * rotation;
    }

    void scale(const QPointF& factors) {
        transform = transform * QTransform::fromScale(factors.x(), factors.y());
    }

    QJsonObject toJson() const {
        QJsonObject obj;
        obj["x"] = rect.x();
        obj["y"] = rect.y();
        obj["width"] = rect.width();
        obj["height"] = rect.height();
        obj["transform"] = QJsonArray{transform.m11(), transform.m12(), transform.m13(),
                                      transform.m21(), transform.m22(), transform.m23(),
                                      transform.m31(), transform.m32(), transform.m33()};
        return obj;
    }

    static TransformedRect fromJson(const QJsonObject& obj) {
        TransformedRect result(QRectF(obj["x"].toDouble(), obj["y"].toDouble(),
                                      obj["width"].toDouble(), obj["height"].toDouble()));
        const QJsonArray m = obj["transform"].toArray();
        if (m.size() == 9) {
            result.transform = QTransform(m[0].toDouble(), m[1].toDouble(), m[2].toDouble(),
                                          m[3].toDouble(), m[4].toDouble(), m[5].toDouble(),
                                          m[6].toDouble(), m[7].toDouble(), m[8].toDouble());
        }
        return result;
    }
};
