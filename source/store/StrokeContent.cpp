// ============================================================================
// StrokeContent - Implementation
// ============================================================================

#include "StrokeContent.h"
#include "../core/Bounds.h"
#include "../render/Svg.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QPainter>
#include <QDebug>

StrokeContent& StrokeContent::withBounds(const QRectF& bounds)
{
    m_bounds = bounds;
    m_hasBounds = bounds.isValid();
    return *this;
}

StrokeContent& StrokeContent::withBackground(const Background& background)
{
    m_background = background;
    m_hasBackground = true;
    return *this;
}

QRectF StrokeContent::bounds() const
{
    if (m_hasBounds) {
        return m_bounds;
    }
    if (strokes.isEmpty()) {
        return QRectF();
    }

    QRectF result = strokes.first()->bounds();
    for (const auto& stroke : strokes) {
        result = Bounds::merged(result, stroke->bounds());
    }
    return result;
}

bool StrokeContent::drawStrokes(QPainter& painter, bool optimizePrinting, qreal imageScale) const
{
    QVector<QRectF> imageBounds;
    if (optimizePrinting) {
        for (const auto& stroke : strokes) {
            if (stroke->kind() == Stroke::Kind::VectorImage
                || stroke->kind() == Stroke::Kind::BitmapImage) {
                imageBounds.append(stroke->bounds());
            }
        }
    }

    bool ok = true;
    for (const auto& stroke : strokes) {
        bool darken = optimizePrinting
            && stroke->kind() != Stroke::Kind::VectorImage
            && stroke->kind() != Stroke::Kind::BitmapImage;
        if (darken) {
            // Strokes drawn on top of an image keep their colors
            const QRectF strokeBounds = stroke->bounds();
            for (const QRectF& image : imageBounds) {
                if (Bounds::contains(image, strokeBounds)) {
                    darken = false;
                    break;
                }
            }
        }

        if (darken) {
            std::unique_ptr<Stroke> printed = stroke->clone();
            printed->setToDarkestColor();
            ok = printed->draw(painter, imageScale) && ok;
        } else {
            ok = stroke->draw(painter, imageScale) && ok;
        }
    }
    return ok;
}

bool StrokeContent::draw(QPainter& painter, bool withBackground, bool withPattern,
                         bool optimizePrinting, qreal margin, qreal imageScale) const
{
    const QRectF contentBounds = bounds();
    if (!contentBounds.isValid()) {
        return true;
    }
    const QRectF loosened = Bounds::loosened(contentBounds, margin);

    painter.save();
    painter.setClipRect(loosened, Qt::IntersectClip);

    if (withBackground && m_hasBackground) {
        const Background bg = optimizePrinting ? m_background.optimizedForPrinting() : m_background;
        bg.draw(painter, loosened, withPattern);
    }

    painter.setClipRect(contentBounds, Qt::IntersectClip);
    const bool ok = drawStrokes(painter, optimizePrinting, imageScale);
    painter.restore();

    if (!ok) {
        qWarning() << "StrokeContent: drawing one or more strokes failed";
    }
    return ok;
}

bool StrokeContent::genSvg(bool withBackground, bool withPattern, bool optimizePrinting,
                           qreal margin, Svg& out) const
{
    out = Svg();
    const QRectF contentBounds = bounds();
    if (!contentBounds.isValid()) {
        return true;
    }
    const QRectF loosened = Bounds::loosened(contentBounds, margin);
    if (loosened.width() <= 0.0 || loosened.height() <= 0.0) {
        qWarning() << "StrokeContent: content bounds are empty" << contentBounds;
        return false;
    }

    return Svg::genWithPainter(
        [&](QPainter& painter) {
            return draw(painter, withBackground, withPattern, optimizePrinting, margin,
                        Stroke::EXPORT_IMAGE_SCALE);
        },
        loosened, out);
}

QVector<ClipboardContent> StrokeContent::toClipboardContent() const
{
    QVector<ClipboardContent> result;
    result.append(ClipboardContent{QString::fromLatin1(MIME_TYPE),
                                   QJsonDocument(toJson()).toJson(QJsonDocument::Compact)});

    if (isEmpty()) {
        return result;
    }

    Svg svg;
    if (!genSvg(true, false, false, CLIPBOARD_EXPORT_MARGIN, svg) || svg.svgData.isEmpty()) {
        qWarning() << "StrokeContent: generating clipboard svg failed";
        return result;
    }
    result.append(ClipboardContent{QStringLiteral("image/svg+xml"), svg.toDocument().toUtf8()});

    QByteArray png;
    if (svg.genBitmap(Stroke::EXPORT_IMAGE_SCALE, "PNG", -1, png)) {
        result.append(ClipboardContent{QStringLiteral("image/png"), png});
    } else {
        qWarning() << "StrokeContent: generating clipboard png failed";
    }
    return result;
}

QJsonObject StrokeContent::toJson() const
{
    QJsonObject obj;
    QJsonArray strokesArray;
    for (const auto& stroke : strokes) {
        strokesArray.append(stroke->toJson());
    }
    obj["strokes"] = strokesArray;

    if (m_hasBounds) {
        QJsonObject b;
        b["x"] = m_bounds.x();
        b["y"] = m_bounds.y();
        b["width"] = m_bounds.width();
        b["height"] = m_bounds.height();
        obj["bounds"] = b;
    }
    if (m_hasBackground) {
        obj["background"] = m_background.toJson();
    }
    return obj;
}

StrokeContent StrokeContent::fromJson(const QJsonObject& obj)
{
    StrokeContent content;
    const QJsonArray strokesArray = obj["strokes"].toArray();
    for (const QJsonValue& val : strokesArray) {
        std::unique_ptr<Stroke> stroke = Stroke::fromJson(val.toObject());
        if (!stroke) {
            qWarning() << "StrokeContent: skipping stroke that failed to load";
            continue;
        }
        content.strokes.append(std::shared_ptr<const Stroke>(std::move(stroke)));
    }

    if (obj.contains("bounds")) {
        const QJsonObject b = obj["bounds"].toObject();
        content.withBounds(QRectF(b["x"].toDouble(), b["y"].toDouble(),
                                  b["width"].toDouble(), b["height"].toDouble()));
    }
    if (obj.contains("background")) {
        content.withBackground(Background::fromJson(obj["background"].toObject()));
    }
    return content;
}
