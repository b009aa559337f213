// ============================================================================
// Background - Implementation
// ============================================================================

#include "Background.h"
#include "../strokes/StrokeStyle.h"

#include <QPainter>
#include <QtMath>

namespace {

// Keeps a huge export region from producing millions of pattern lines.
constexpr int MAX_PATTERN_STEPS = 4096;

qreal firstAligned(qreal start, qreal spacing)
{
    return qCeil(start / spacing) * spacing;
}

} // namespace

void Background::draw(QPainter& painter, const QRectF& rect, bool withPattern) const
{
    painter.save();
    painter.fillRect(rect, color);

    if (!withPattern || pattern == Pattern::None || patternSpacing <= 0.0) {
        painter.restore();
        return;
    }

    const qreal spacing = qMax(patternSpacing, rect.width() / MAX_PATTERN_STEPS);
    painter.setClipRect(rect);

    switch (pattern) {
        case Pattern::None:
            break;

        case Pattern::Lines:
            painter.setPen(QPen(patternColor, patternWidth));
            for (qreal y = firstAligned(rect.top(), spacing); y <= rect.bottom(); y += spacing) {
                painter.drawLine(QPointF(rect.left(), y), QPointF(rect.right(), y));
            }
            break;

        case Pattern::Grid:
            painter.setPen(QPen(patternColor, patternWidth));
            for (qreal x = firstAligned(rect.left(), spacing); x <= rect.right(); x += spacing) {
                painter.drawLine(QPointF(x, rect.top()), QPointF(x, rect.bottom()));
            }
            for (qreal y = firstAligned(rect.top(), spacing); y <= rect.bottom(); y += spacing) {
                painter.drawLine(QPointF(rect.left(), y), QPointF(rect.right(), y));
            }
            break;

        case Pattern::Dots:
        {
            painter.setPen(Qt::NoPen);
            painter.setBrush(patternColor);
            const qreal radius = qMax(patternWidth, 0.5);
            for (qreal x = firstAligned(rect.left(), spacing); x <= rect.right(); x += spacing) {
                for (qreal y = firstAligned(rect.top(), spacing); y <= rect.bottom(); y += spacing) {
                    painter.drawEllipse(QPointF(x, y), radius, radius);
                }
            }
            break;
        }
    }

    painter.restore();
}

Background Background::optimizedForPrinting() const
{
    Background result = *this;
    result.color = Qt::white;
    if (ColorUtils::luma(color) < 0.5) {
        result.patternColor = ColorUtils::invertedBrightness(patternColor);
    }
    return result;
}

QString Background::patternToString(Pattern pattern)
{
    switch (pattern) {
        case Pattern::None:  return QStringLiteral("none");
        case Pattern::Lines: return QStringLiteral("lines");
        case Pattern::Grid:  return QStringLiteral("grid");
        case Pattern::Dots:  return QStringLiteral("dots");
    }
    return QStringLiteral("none");
}

Background::Pattern Background::patternFromString(const QString& str)
{
    if (str == "lines") return Pattern::Lines;
    if (str == "grid")  return Pattern::Grid;
    if (str == "dots")  return Pattern::Dots;
    return Pattern::None;
}

QJsonObject Background::toJson() const
{
    QJsonObject obj;
    obj["color"] = ColorUtils::toJson(color);
    obj["pattern"] = patternToString(pattern);
    obj["pattern_spacing"] = patternSpacing;
    obj["pattern_color"] = ColorUtils::toJson(patternColor);
    obj["pattern_width"] = patternWidth;
    return obj;
}

Background Background::fromJson(const QJsonObject& obj)
{
    Background bg;
    bg.color = ColorUtils::fromJson(obj["color"].toString(), bg.color);
    bg.pattern = patternFromString(obj["pattern"].toString(QStringLiteral("grid")));
    bg.patternSpacing = obj["pattern_spacing"].toDouble(bg.patternSpacing);
    bg.patternColor = ColorUtils::fromJson(obj["pattern_color"].toString(), bg.patternColor);
    bg.patternWidth = obj["pattern_width"].toDouble(bg.patternWidth);
    return bg;
}
