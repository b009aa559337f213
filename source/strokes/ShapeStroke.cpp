// ============================================================================
// ShapeStroke - Implementation
// ============================================================================

#include "ShapeStroke.h"
#include "../core/Bounds.h"

#include <QPainter>
#include <QJsonArray>
#include <QtMath>

namespace {

constexpr qreal MAX_HITBOX_DIAGONAL = 15.0;
constexpr int MAX_EDGE_SUBDIVISIONS = 20;

QJsonArray pointsToJson(const QVector<QPointF>& points)
{
    QJsonArray arr;
    for (const QPointF& p : points) {
        arr.append(QJsonArray{p.x(), p.y()});
    }
    return arr;
}

QVector<QPointF> pointsFromJson(const QJsonArray& arr)
{
    QVector<QPointF> points;
    points.reserve(arr.size());
    for (const QJsonValue& val : arr) {
        const QJsonArray xy = val.toArray();
        points.append(QPointF(xy.at(0).toDouble(), xy.at(1).toDouble()));
    }
    return points;
}

std::unique_ptr<ShapeStroke> makeShape(ShapeStroke::ShapeType type, const QVector<QPointF>& points,
                                       const ShapeStyle& style)
{
    auto shape = std::make_unique<ShapeStroke>();
    shape->shapeType = type;
    shape->points = points;
    shape->style = style;
    return shape;
}

} // namespace

// ===== Factory Helpers =====

std::unique_ptr<ShapeStroke> ShapeStroke::line(const QPointF& start, const QPointF& end,
                                               const ShapeStyle& style)
{
    return makeShape(ShapeType::Line, {start, end}, style);
}

std::unique_ptr<ShapeStroke> ShapeStroke::rectangle(const QRectF& r, const ShapeStyle& style)
{
    auto shape = makeShape(ShapeType::Rectangle, {}, style);
    shape->rect = TransformedRect(r.normalized());
    return shape;
}

std::unique_ptr<ShapeStroke> ShapeStroke::ellipse(const QRectF& r, const ShapeStyle& style)
{
    auto shape = makeShape(ShapeType::Ellipse, {}, style);
    shape->rect = TransformedRect(r.normalized());
    return shape;
}

std::unique_ptr<ShapeStroke> ShapeStroke::quadraticBezier(const QPointF& start, const QPointF& cp,
                                                          const QPointF& end, const ShapeStyle& style)
{
    return makeShape(ShapeType::QuadraticBezier, {start, cp, end}, style);
}

std::unique_ptr<ShapeStroke> ShapeStroke::cubicBezier(const QPointF& start, const QPointF& cp1,
                                                      const QPointF& cp2, const QPointF& end,
                                                      const ShapeStyle& style)
{
    return makeShape(ShapeType::CubicBezier, {start, cp1, cp2, end}, style);
}

std::unique_ptr<ShapeStroke> ShapeStroke::polyline(const QVector<QPointF>& pts, const ShapeStyle& style)
{
    return makeShape(ShapeType::Polyline, pts, style);
}

std::unique_ptr<ShapeStroke> ShapeStroke::polygon(const QVector<QPointF>& pts, const ShapeStyle& style)
{
    return makeShape(ShapeType::Polygon, pts, style);
}

// ===== Geometry =====

std::unique_ptr<Stroke> ShapeStroke::clone() const
{
    return std::make_unique<ShapeStroke>(*this);
}

bool ShapeStroke::isValid() const
{
    switch (shapeType) {
        case ShapeType::Line:            return points.size() == 2;
        case ShapeType::QuadraticBezier: return points.size() == 3;
        case ShapeType::CubicBezier:     return points.size() == 4;
        case ShapeType::Polyline:        return points.size() >= 2;
        case ShapeType::Polygon:         return points.size() >= 3;
        case ShapeType::Rectangle:
        case ShapeType::Ellipse:         return rect.rect.isValid();
    }
    return false;
}

QPainterPath ShapeStroke::outlinePath() const
{
    QPainterPath path;
    switch (shapeType) {
        case ShapeType::Rectangle:
            path.addRect(rect.rect);
            return rect.transform.map(path);
        case ShapeType::Ellipse:
            path.addEllipse(rect.rect);
            return rect.transform.map(path);
        default:
            break;
    }

    if (points.isEmpty()) {
        return path;
    }
    path.moveTo(points[0]);
    switch (shapeType) {
        case ShapeType::QuadraticBezier:
            if (points.size() == 3) {
                path.quadTo(points[1], points[2]);
            }
            break;
        case ShapeType::CubicBezier:
            if (points.size() == 4) {
                path.cubicTo(points[1], points[2], points[3]);
            }
            break;
        case ShapeType::Polygon:
            for (int i = 1; i < points.size(); ++i) {
                path.lineTo(points[i]);
            }
            path.closeSubpath();
            break;
        case ShapeType::Line:
        case ShapeType::Polyline:
        default:
            for (int i = 1; i < points.size(); ++i) {
                path.lineTo(points[i]);
            }
            break;
    }
    return path;
}

QVector<QRectF> ShapeStroke::centerlineBoxes() const
{
    QVector<QRectF> boxes;
    const QList<QPolygonF> polygons = outlinePath().toSubpathPolygons();
    for (const QPolygonF& poly : polygons) {
        for (int i = 1; i < poly.size(); ++i) {
            const QPointF a = poly[i - 1];
            const QPointF b = poly[i];
            const QPointF d = b - a;
            const qreal len = qSqrt(d.x() * d.x() + d.y() * d.y());
            const int n = qBound(1, qCeil(len / MAX_HITBOX_DIAGONAL), MAX_EDGE_SUBDIVISIONS);
            QPointF prev = a;
            for (int s = 1; s <= n; ++s) {
                const QPointF next = (s == n) ? b : a + d * (qreal(s) / n);
                boxes.append(Bounds::fromCorners(prev, next));
                prev = next;
            }
        }
    }
    return boxes;
}

QRectF ShapeStroke::bounds() const
{
    QRectF result = outlinePath().boundingRect();
    for (const QRectF& box : centerlineBoxes()) {
        result = Bounds::merged(result, box);
    }
    return Bounds::loosened(result, style.strokeWidth * 0.5);
}

QVector<QRectF> ShapeStroke::hitboxes() const
{
    QVector<QRectF> boxes = centerlineBoxes();
    for (QRectF& box : boxes) {
        box = Bounds::loosened(box, style.strokeWidth * 0.5);
    }
    return boxes;
}

void ShapeStroke::translate(const QPointF& offset)
{
    for (QPointF& p : points) {
        p += offset;
    }
    rect.translate(offset);
}

void ShapeStroke::rotate(qreal angle, const QPointF& center)
{
    QTransform t;
    t.translate(center.x(), center.y());
    t.rotateRadians(angle);
    t.translate(-center.x(), -center.y());
    for (QPointF& p : points) {
        p = t.map(p);
    }
    rect.rotate(angle, center);
}

void ShapeStroke::scale(const QPointF& factors)
{
    for (QPointF& p : points) {
        p = QPointF(p.x() * factors.x(), p.y() * factors.y());
    }
    rect.scale(factors);
    style.strokeWidth *= qSqrt(qAbs(factors.x() * factors.y()));
}

void ShapeStroke::setToDarkestColor()
{
    style.strokeColor = ColorUtils::darkest(style.strokeColor);
    if (style.hasFill()) {
        style.fillColor = ColorUtils::darkest(style.fillColor);
    }
}

// ===== Rendering =====

bool ShapeStroke::draw(QPainter& painter, qreal imageScale) const
{
    Q_UNUSED(imageScale)

    const bool closed = shapeType == ShapeType::Rectangle
        || shapeType == ShapeType::Ellipse
        || shapeType == ShapeType::Polygon;

    painter.save();
    QPen pen(style.strokeColor, style.strokeWidth, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
    painter.setPen(style.strokeWidth > 0.0 ? pen : QPen(Qt::NoPen));
    painter.setBrush(closed && style.hasFill() ? QBrush(style.fillColor) : QBrush(Qt::NoBrush));
    painter.drawPath(outlinePath());
    painter.restore();
    return true;
}

// ===== Serialization =====

QString ShapeStroke::shapeTypeName(ShapeType type)
{
    switch (type) {
        case ShapeType::Line:            return QStringLiteral("line");
        case ShapeType::Rectangle:       return QStringLiteral("rectangle");
        case ShapeType::Ellipse:         return QStringLiteral("ellipse");
        case ShapeType::QuadraticBezier: return QStringLiteral("quadbez");
        case ShapeType::CubicBezier:     return QStringLiteral("cubbez");
        case ShapeType::Polyline:        return QStringLiteral("polyline");
        case ShapeType::Polygon:         return QStringLiteral("polygon");
    }
    return QStringLiteral("line");
}

ShapeStroke::ShapeType ShapeStroke::shapeTypeFromName(const QString& name)
{
    if (name == "rectangle") return ShapeType::Rectangle;
    if (name == "ellipse")   return ShapeType::Ellipse;
    if (name == "quadbez")   return ShapeType::QuadraticBezier;
    if (name == "cubbez")    return ShapeType::CubicBezier;
    if (name == "polyline")  return ShapeType::Polyline;
    if (name == "polygon")   return ShapeType::Polygon;
    return ShapeType::Line;
}

QJsonObject ShapeStroke::toJson() const
{
    QJsonObject obj = Stroke::toJson();
    obj["shape"] = shapeTypeName(shapeType);
    if (shapeType == ShapeType::Rectangle || shapeType == ShapeType::Ellipse) {
        obj["rect"] = rect.toJson();
    } else {
        obj["points"] = pointsToJson(points);
    }
    obj["style"] = style.toJson();
    return obj;
}

void ShapeStroke::loadFromJson(const QJsonObject& obj)
{
    shapeType = shapeTypeFromName(obj["shape"].toString());
    if (shapeType == ShapeType::Rectangle || shapeType == ShapeType::Ellipse) {
        rect = TransformedRect::fromJson(obj["rect"].toObject());
        points.clear();
    } else {
        points = pointsFromJson(obj["points"].toArray());
    }
    style = ShapeStyle::fromJson(obj["style"].toObject());
}
