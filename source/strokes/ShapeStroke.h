#pragma once

// ============================================================================
// ShapeStroke - Geometric shapes with outline and optional fill
// ============================================================================

#include "Stroke.h"
#include "StrokeStyle.h"
#include "TransformedRect.h"

#include <QPainterPath>

class ShapeStroke : public Stroke {
public:
    enum class ShapeType {
        Line,               ///< points: start, end
        Rectangle,          ///< rect + transform
        Ellipse,            ///< rect + transform
        QuadraticBezier,    ///< points: start, cp, end
        CubicBezier,        ///< points: start, cp1, cp2, end
        Polyline,           ///< points: n >= 2
        Polygon             ///< points: n >= 3, closed
    };

    ShapeStroke() = default;

    // ===== Factory Helpers =====
    static std::unique_ptr<ShapeStroke> line(const QPointF& start, const QPointF& end,
                                             const ShapeStyle& style);
    static std::unique_ptr<ShapeStroke> rectangle(const QRectF& rect, const ShapeStyle& style);
    static std::unique_ptr<ShapeStroke> ellipse(const QRectF& rect, const ShapeStyle& style);
    static std::unique_ptr<ShapeStroke> quadraticBezier(const QPointF& start, const QPointF& cp,
                                                        const QPointF& end, const ShapeStyle& style);
    static std::unique_ptr<ShapeStroke> cubicBezier(const QPointF& start, const QPointF& cp1,
                                                    const QPointF& cp2, const QPointF& end,
                                                    const ShapeStyle& style);
    static std::unique_ptr<ShapeStroke> polyline(const QVector<QPointF>& points, const ShapeStyle& style);
    static std::unique_ptr<ShapeStroke> polygon(const QVector<QPointF>& points, const ShapeStyle& style);

    // ===== Stroke Interface =====
    Kind kind() const override { return Kind::Shape; }
    QString type() const override { return QStringLiteral("shapestroke"); }
    std::unique_ptr<Stroke> clone() const override;
    QRectF bounds() const override;
    QVector<QRectF> hitboxes() const override;
    void translate(const QPointF& offset) override;
    void rotate(qreal angle, const QPointF& center) override;
    void scale(const QPointF& factors) override;
    bool draw(QPainter& painter, qreal imageScale) const override;
    bool isValid() const override;
    void setStrokeColor(const QColor& color) override { style.strokeColor = color; }
    void setFillColor(const QColor& color) override { style.fillColor = color; }
    void setToDarkestColor() override;
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;

    // ===== Shape Data =====
    ShapeType shapeType = ShapeType::Line;
    QVector<QPointF> points;    ///< Control points for point based shapes
    TransformedRect rect;       ///< Placement for Rectangle and Ellipse
    ShapeStyle style;

    /// Centerline of the shape in document coordinates.
    QPainterPath outlinePath() const;

private:
    /// Centerline flattened into sub-line boxes, without stroke width.
    QVector<QRectF> centerlineBoxes() const;

    static QString shapeTypeName(ShapeType type);
    static ShapeType shapeTypeFromName(const QString& name);
};
