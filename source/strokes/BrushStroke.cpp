// ============================================================================
// BrushStroke - Implementation
// ============================================================================

#include "BrushStroke.h"
#include "../core/Bounds.h"

#include <QPainter>
#include <QPolygonF>
#include <QJsonArray>
#include <QDebug>
#include <QtMath>

BrushStroke::BrushStroke(const PenPath& path, const BrushStyle& style)
    : m_path(path)
    , m_style(style)
{
    updateGeometry();
}

std::unique_ptr<Stroke> BrushStroke::clone() const
{
    return std::make_unique<BrushStroke>(*this);
}

void BrushStroke::translate(const QPointF& offset)
{
    m_path.translate(offset);
    updateGeometry();
}

void BrushStroke::rotate(qreal angle, const QPointF& center)
{
    m_path.rotate(angle, center);
    updateGeometry();
}

void BrushStroke::scale(const QPointF& factors)
{
    m_path.scale(factors);
    // Geometric mean behaves best for non-uniform scaling.
    m_style.width *= qSqrt(qAbs(factors.x() * factors.y()));
    updateGeometry();
}

void BrushStroke::replacePath(const PenPath& path)
{
    m_path = path;
    updateGeometry();
}

void BrushStroke::setStyle(const BrushStyle& style)
{
    m_style = style;
    updateGeometry();
}

void BrushStroke::extendWithSegments(const QVector<PenSegment>& segments)
{
    m_path.segments += segments;
    updateGeometry();
}

void BrushStroke::setToDarkestColor()
{
    m_style.color = ColorUtils::darkest(m_style.color);
}

qreal BrushStroke::outlineMargin() const
{
    return qMax(m_style.width, 1.0) * 0.5;
}

QRectF BrushStroke::pathBounds(const PenPath& path) const
{
    QRectF result = path.bounds();
    for (const QRectF& hb : path.hitboxes()) {
        result = Bounds::merged(result, hb);
    }
    return Bounds::loosened(result, outlineMargin());
}

void BrushStroke::updateGeometry()
{
    const qreal margin = outlineMargin();
    const QVector<QRectF> pathHitboxes = m_path.hitboxes();

    QRectF centerline = m_path.bounds();
    m_hitboxes.clear();
    m_hitboxes.reserve(pathHitboxes.size());
    for (const QRectF& hb : pathHitboxes) {
        centerline = Bounds::merged(centerline, hb);
        m_hitboxes.append(Bounds::loosened(hb, margin));
    }
    m_bounds = Bounds::loosened(centerline, margin);
}

// ============================================================================
// Rendering
// ============================================================================

void BrushStroke::drawElements(QPainter& painter, const QVector<StrokePoint>& elements,
                               const BrushStyle& style)
{
    if (elements.isEmpty()) {
        return;
    }

    painter.setPen(Qt::NoPen);
    painter.setBrush(style.color);

    const int n = elements.size();
    if (n == 1) {
        const qreal radius = qMax(style.widthAt(elements[0].pressure), 1.0) / 2.0;
        painter.drawEllipse(elements[0].pos, radius, radius);
        return;
    }

    QVector<qreal> halfWidths(n);
    for (int i = 0; i < n; ++i) {
        halfWidths[i] = qMax(style.widthAt(elements[i].pressure), 1.0) / 2.0;
    }

    // Outline polygon: left edge forward, right edge backward.
    QVector<QPointF> leftEdge(n);
    QVector<QPointF> rightEdge(n);
    for (int i = 0; i < n; ++i) {
        const QPointF& pos = elements[i].pos;

        QPointF tangent;
        if (i == 0) {
            tangent = elements[1].pos - pos;
        } else if (i == n - 1) {
            tangent = pos - elements[n - 2].pos;
        } else {
            tangent = elements[i + 1].pos - elements[i - 1].pos;
        }

        qreal len = qSqrt(tangent.x() * tangent.x() + tangent.y() * tangent.y());
        if (len < 0.0001) {
            tangent = QPointF(1.0, 0.0);
            len = 1.0;
        }
        tangent /= len;

        const QPointF perp(-tangent.y(), tangent.x());
        leftEdge[i] = pos + perp * halfWidths[i];
        rightEdge[i] = pos - perp * halfWidths[i];
    }

    QPolygonF polygon;
    polygon.reserve(n * 2);
    for (int i = 0; i < n; ++i) {
        polygon << leftEdge[i];
    }
    for (int i = n - 1; i >= 0; --i) {
        polygon << rightEdge[i];
    }

    // WindingFill so self-intersections do not leave holes
    painter.drawPolygon(polygon, Qt::WindingFill);

    painter.drawEllipse(elements[0].pos, halfWidths[0], halfWidths[0]);
    painter.drawEllipse(elements[n - 1].pos, halfWidths[n - 1], halfWidths[n - 1]);
}

bool BrushStroke::draw(QPainter& painter, qreal imageScale) const
{
    // Finer flattening when zoomed in
    const qreal tolerance = qBound(0.25, 2.0 / qMax(imageScale, 0.01), 8.0);
    painter.save();
    drawElements(painter, m_path.flattened(tolerance), m_style);
    painter.restore();
    return true;
}

bool BrushStroke::genImages(const QRectF& viewport, qreal imageScale, GeneratedImages& out) const
{
    out.images.clear();
    out.viewport = viewport;

    const bool partial = !Bounds::contains(viewport, m_bounds);
    out.coverage = partial ? GeneratedImages::Coverage::Partial : GeneratedImages::Coverage::Full;

    if (!Bounds::intersects(viewport, m_bounds)) {
        out.coverage = GeneratedImages::Coverage::Partial;
        return true;
    }
    const QRectF visible = Bounds::intersection(viewport, m_bounds);
    if (visible.width() <= 0.0 || visible.height() <= 0.0) {
        return true;
    }

    const bool imageSizeCondition = visible.width() < IMAGES_SIZE_THRESHOLD / imageScale
        && visible.height() < IMAGES_SIZE_THRESHOLD / imageScale;
    const bool strokeWidthCondition = m_style.width > IMAGES_STROKE_WIDTH_BOUNDS_THRESHOLD * visible.width()
        || m_style.width > IMAGES_STROKE_WIDTH_BOUNDS_THRESHOLD * visible.height();

    if (imageSizeCondition || strokeWidthCondition) {
        RenderImage image;
        if (!RenderImage::genWithPainter(
                [this, imageScale](QPainter& painter) { return draw(painter, imageScale); },
                visible, imageScale, image)) {
            return false;
        }
        out.images.append(image);
        return true;
    }

    // Large stroke: one image per visible segment
    const qreal tolerance = qBound(0.25, 2.0 / qMax(imageScale, 0.01), 8.0);
    out.images.reserve(m_path.segments.size());
    for (int i = 0; i < m_path.segments.size(); ++i) {
        const PenPath segPath = m_path.subPath(i, i + 1);
        const QRectF segBounds = pathBounds(segPath);
        if (!Bounds::intersects(viewport, segBounds)) {
            continue;
        }
        const QRectF segVisible = Bounds::intersection(viewport, segBounds);
        if (segVisible.width() <= 0.0 || segVisible.height() <= 0.0) {
            continue;
        }

        RenderImage image;
        const bool ok = RenderImage::genWithPainter(
            [&segPath, tolerance, this](QPainter& painter) {
                drawElements(painter, segPath.flattened(tolerance), m_style);
                return true;
            },
            segVisible, imageScale, image);
        if (!ok) {
            qWarning() << "BrushStroke: rendering segment" << i << "failed";
            out.images.clear();
            return false;
        }
        out.images.append(image);
    }
    return true;
}

bool BrushStroke::genImageForLastSegments(int nLastSegments, qreal imageScale, RenderImage& out) const
{
    const int pathLen = m_path.segments.size();
    if (pathLen == 0 || nLastSegments <= 0) {
        return false;
    }

    // Start at the end of the segment before the range, or at the path start.
    const int from = qMax(0, pathLen - nLastSegments);
    const PenPath rangePath = m_path.subPath(from, pathLen);
    const QRectF rangeBounds = pathBounds(rangePath);
    const qreal tolerance = qBound(0.25, 2.0 / qMax(imageScale, 0.01), 8.0);

    return RenderImage::genWithPainter(
        [&rangePath, tolerance, this](QPainter& painter) {
            drawElements(painter, rangePath.flattened(tolerance), m_style);
            return true;
        },
        rangeBounds, imageScale, out);
}

// ============================================================================
// Serialization
// ============================================================================

QJsonObject BrushStroke::toJson() const
{
    QJsonObject obj = Stroke::toJson();
    obj["path"] = m_path.toJson();
    obj["style"] = m_style.toJson();
    return obj;
}

void BrushStroke::loadFromJson(const QJsonObject& obj)
{
    m_path = PenPath::fromJson(obj["path"].toObject());
    m_style = BrushStyle::fromJson(obj["style"].toObject());
    updateGeometry();
}
