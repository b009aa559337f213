#include "PenPath.h"
#include "../core/Bounds.h"

#include <QtMath>

namespace {

QPointF quadPoint(const QPointF& p0, const QPointF& cp, const QPointF& p1, qreal t)
{
    const qreal u = 1.0 - t;
    return p0 * (u * u) + cp * (2.0 * u * t) + p1 * (t * t);
}

QPointF cubicPoint(const QPointF& p0, const QPointF& cp1, const QPointF& cp2,
                   const QPointF& p1, qreal t)
{
    const qreal u = 1.0 - t;
    return p0 * (u * u * u) + cp1 * (3.0 * u * u * t) + cp2 * (3.0 * u * t * t) + p1 * (t * t * t);
}

QPointF segmentPoint(const QPointF& prev, const PenSegment& seg, qreal t)
{
    switch (seg.type) {
        case PenSegment::Type::QuadBezTo:
            return quadPoint(prev, seg.cp1, seg.end.pos, t);
        case PenSegment::Type::CubBezTo:
            return cubicPoint(prev, seg.cp1, seg.cp2, seg.end.pos, t);
        case PenSegment::Type::LineTo:
        default:
            return prev + (seg.end.pos - prev) * t;
    }
}

qreal distance(const QPointF& a, const QPointF& b)
{
    const QPointF d = b - a;
    return qSqrt(d.x() * d.x() + d.y() * d.y());
}

// Approximate arc length by sampling.
qreal segmentLength(const QPointF& prev, const PenSegment& seg)
{
    if (seg.type == PenSegment::Type::LineTo) {
        return distance(prev, seg.end.pos);
    }
    constexpr int samples = 8;
    qreal len = 0.0;
    QPointF last = prev;
    for (int i = 1; i <= samples; ++i) {
        QPointF p = segmentPoint(prev, seg, qreal(i) / samples);
        len += distance(last, p);
        last = p;
    }
    return len;
}

QJsonObject pointToJson(const QPointF& p)
{
    QJsonObject obj;
    obj["x"] = p.x();
    obj["y"] = p.y();
    return obj;
}

QPointF pointFromJson(const QJsonObject& obj)
{
    return QPointF(obj["x"].toDouble(), obj["y"].toDouble());
}

} // namespace

// ============================================================================
// PenSegment
// ============================================================================

PenSegment PenSegment::lineTo(const StrokePoint& end)
{
    PenSegment seg;
    seg.type = Type::LineTo;
    seg.end = end;
    return seg;
}

PenSegment PenSegment::quadBezTo(const QPointF& cp, const StrokePoint& end)
{
    PenSegment seg;
    seg.type = Type::QuadBezTo;
    seg.cp1 = cp;
    seg.end = end;
    return seg;
}

PenSegment PenSegment::cubBezTo(const QPointF& cp1, const QPointF& cp2, const StrokePoint& end)
{
    PenSegment seg;
    seg.type = Type::CubBezTo;
    seg.cp1 = cp1;
    seg.cp2 = cp2;
    seg.end = end;
    return seg;
}

void PenSegment::transform(const QTransform& t)
{
    cp1 = t.map(cp1);
    cp2 = t.map(cp2);
    end.pos = t.map(end.pos);
}

QJsonObject PenSegment::toJson() const
{
    QJsonObject obj;
    switch (type) {
        case Type::LineTo:
            obj["type"] = QStringLiteral("line");
            break;
        case Type::QuadBezTo:
            obj["type"] = QStringLiteral("quad");
            obj["cp"] = pointToJson(cp1);
            break;
        case Type::CubBezTo:
            obj["type"] = QStringLiteral("cubic");
            obj["cp1"] = pointToJson(cp1);
            obj["cp2"] = pointToJson(cp2);
            break;
    }
    obj["end"] = end.toJson();
    return obj;
}

PenSegment PenSegment::fromJson(const QJsonObject& obj)
{
    const QString typeStr = obj["type"].toString();
    const StrokePoint end = StrokePoint::fromJson(obj["end"].toObject());
    if (typeStr == "quad") {
        return quadBezTo(pointFromJson(obj["cp"].toObject()), end);
    }
    if (typeStr == "cubic") {
        return cubBezTo(pointFromJson(obj["cp1"].toObject()),
                        pointFromJson(obj["cp2"].toObject()), end);
    }
    return lineTo(end);
}

// ============================================================================
// PenPath
// ============================================================================

QVector<StrokePoint> PenPath::elements() const
{
    QVector<StrokePoint> result;
    result.reserve(segments.size() + 1);
    result.append(start);
    for (const PenSegment& seg : segments) {
        result.append(seg.end);
    }
    return result;
}

QRectF PenPath::bounds() const
{
    QRectF result(start.pos, start.pos);
    QPointF prev = start.pos;
    for (const PenSegment& seg : segments) {
        switch (seg.type) {
            case PenSegment::Type::LineTo:
                result = Bounds::merged(result, Bounds::fromCorners(prev, seg.end.pos));
                break;
            case PenSegment::Type::QuadBezTo: {
                QPainterPath p(prev);
                p.quadTo(seg.cp1, seg.end.pos);
                result = Bounds::merged(result, p.boundingRect());
                break;
            }
            case PenSegment::Type::CubBezTo: {
                QPainterPath p(prev);
                p.cubicTo(seg.cp1, seg.cp2, seg.end.pos);
                result = Bounds::merged(result, p.boundingRect());
                break;
            }
        }
        prev = seg.end.pos;
    }
    return result;
}

int PenPath::subsegmentCount(qreal length)
{
    if (length < MAX_HITBOX_DIAGONAL * MAX_SUBSEGMENTS) {
        return qMax(1, qRound(length / MAX_HITBOX_DIAGONAL));
    }
    return MAX_SUBSEGMENTS;
}

QVector<QPair<int, QVector<QRectF>>> PenPath::hitboxesWithSegmentIndices() const
{
    QVector<QPair<int, QVector<QRectF>>> result;
    result.reserve(segments.size());

    QPointF prev = start.pos;
    for (int i = 0; i < segments.size(); ++i) {
        const PenSegment& seg = segments[i];
        const int n = subsegmentCount(segmentLength(prev, seg));

        QVector<QRectF> boxes;
        boxes.reserve(n);
        QPointF a = prev;
        for (int s = 1; s <= n; ++s) {
            QPointF b = (s == n) ? seg.end.pos : segmentPoint(prev, seg, qreal(s) / n);
            boxes.append(Bounds::fromCorners(a, b));
            a = b;
        }
        result.append(qMakePair(i, boxes));
        prev = seg.end.pos;
    }
    return result;
}

QVector<QRectF> PenPath::hitboxes() const
{
    QVector<QRectF> result;
    for (const auto& entry : hitboxesWithSegmentIndices()) {
        result += entry.second;
    }
    return result;
}

QVector<int> PenPath::hittest(const QRectF& hit, qreal loosened) const
{
    QVector<int> result;
    for (const auto& entry : hitboxesWithSegmentIndices()) {
        for (const QRectF& hb : entry.second) {
            if (Bounds::intersects(Bounds::loosened(hb, loosened), hit)) {
                result.append(entry.first);
                break;
            }
        }
    }
    return result;
}

QVector<StrokePoint> PenPath::flattened(qreal tolerance) const
{
    QVector<StrokePoint> result;
    result.reserve(segments.size() + 1);
    result.append(start);

    StrokePoint prev = start;
    for (const PenSegment& seg : segments) {
        if (seg.type == PenSegment::Type::LineTo) {
            result.append(seg.end);
        } else {
            const qreal len = segmentLength(prev.pos, seg);
            const int n = qBound(1, qCeil(len / qMax(tolerance, 0.1)), 64);
            for (int s = 1; s <= n; ++s) {
                const qreal t = qreal(s) / n;
                const qreal pressure = prev.pressure + (seg.end.pressure - prev.pressure) * t;
                result.append(StrokePoint(segmentPoint(prev.pos, seg, t), pressure));
            }
        }
        prev = seg.end;
    }
    return result;
}

QPainterPath PenPath::toPainterPath() const
{
    QPainterPath path(start.pos);
    for (const PenSegment& seg : segments) {
        switch (seg.type) {
            case PenSegment::Type::LineTo:
                path.lineTo(seg.end.pos);
                break;
            case PenSegment::Type::QuadBezTo:
                path.quadTo(seg.cp1, seg.end.pos);
                break;
            case PenSegment::Type::CubBezTo:
                path.cubicTo(seg.cp1, seg.cp2, seg.end.pos);
                break;
        }
    }
    return path;
}

PenPath PenPath::subPath(int from, int to) const
{
    from = qBound(0, from, segments.size());
    to = qBound(from, to, segments.size());
    const StrokePoint subStart = (from == 0) ? start : segments[from - 1].end;
    return PenPath(subStart, segments.mid(from, to - from));
}

void PenPath::translate(const QPointF& offset)
{
    transform(QTransform::fromTranslate(offset.x(), offset.y()));
}

void PenPath::rotate(qreal angle, const QPointF& center)
{
    QTransform t;
    t.translate(center.x(), center.y());
    t.rotateRadians(angle);
    t.translate(-center.x(), -center.y());
    transform(t);
}

void PenPath::scale(const QPointF& factors)
{
    transform(QTransform::fromScale(factors.x(), factors.y()));
}

void PenPath::transform(const QTransform& t)
{
    start.pos = t.map(start.pos);
    for (PenSegment& seg : segments) {
        seg.transform(t);
    }
}

QJsonObject PenPath::toJson() const
{
    QJsonObject obj;
    obj["start"] = start.toJson();
    QJsonArray segArray;
    for (const PenSegment& seg : segments) {
        segArray.append(seg.toJson());
    }
    obj["segments"] = segArray;
    return obj;
}

PenPath PenPath::fromJson(const QJsonObject& obj)
{
    PenPath path(StrokePoint::fromJson(obj["start"].toObject()));
    const QJsonArray segArray = obj["segments"].toArray();
    path.segments.reserve(segArray.size());
    for (const QJsonValue& val : segArray) {
        path.segments.append(PenSegment::fromJson(val.toObject()));
    }
    return path;
}
