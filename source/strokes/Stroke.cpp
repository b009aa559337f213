// ============================================================================
// Stroke - Implementation
// ============================================================================

#include "Stroke.h"
#include "BrushStroke.h"
#include "ShapeStroke.h"
#include "TextStroke.h"
#include "VectorImage.h"
#include "BitmapImage.h"
#include "../core/Bounds.h"
#include "../render/Svg.h"

#include <QBuffer>
#include <QPainter>
#include <QDebug>

QJsonObject Stroke::toJson() const
{
    QJsonObject obj;
    obj["type"] = type();
    return obj;
}

bool Stroke::genImages(const QRectF& viewport, qreal imageScale, GeneratedImages& out) const
{
    const QRectF strokeBounds = bounds();
    out.images.clear();
    out.viewport = viewport;

    auto drawFn = [this, imageScale](QPainter& painter) { return draw(painter, imageScale); };

    if (Bounds::contains(viewport, strokeBounds)) {
        RenderImage image;
        if (!RenderImage::genWithPainter(drawFn, strokeBounds, imageScale, image)) {
            return false;
        }
        out.coverage = GeneratedImages::Coverage::Full;
        out.images.append(image);
        return true;
    }

    out.coverage = GeneratedImages::Coverage::Partial;
    if (!Bounds::intersects(viewport, strokeBounds)) {
        return true;
    }

    const QRectF visible = Bounds::intersection(viewport, strokeBounds);
    if (visible.width() <= 0.0 || visible.height() <= 0.0) {
        // Touching edges only, nothing to rasterize.
        return true;
    }
    RenderImage image;
    if (!RenderImage::genWithPainter(drawFn, visible, imageScale, image)) {
        return false;
    }
    out.images.append(image);
    return true;
}

bool Stroke::genSvg(Svg& out) const
{
    return Svg::genWithPainter(
        [this](QPainter& painter) { return draw(painter, 1.0); },
        bounds(), out);
}

bool Stroke::exportToBitmapBytes(const char* format, qreal imageScale, QByteArray& out) const
{
    RenderImage image;
    if (!RenderImage::genWithPainter(
            [this, imageScale](QPainter& painter) { return draw(painter, imageScale); },
            bounds(), imageScale, image)) {
        return false;
    }

    QBuffer buffer(&out);
    buffer.open(QIODevice::WriteOnly);
    if (!image.image.save(&buffer, format)) {
        qWarning() << "Stroke: encoding" << type() << "as" << format << "failed";
        return false;
    }
    return true;
}

std::unique_ptr<Stroke> Stroke::fromJson(const QJsonObject& obj)
{
    const QString strokeType = obj["type"].toString();

    std::unique_ptr<Stroke> result;

    if (strokeType == "brushstroke") {
        result = std::make_unique<BrushStroke>();
    } else if (strokeType == "shapestroke") {
        result = std::make_unique<ShapeStroke>();
    } else if (strokeType == "textstroke") {
        result = std::make_unique<TextStroke>();
    } else if (strokeType == "vectorimage") {
        result = std::make_unique<VectorImage>();
    } else if (strokeType == "bitmapimage") {
        result = std::make_unique<BitmapImage>();
    } else {
        qWarning() << "Stroke: unknown stroke type" << strokeType;
        return nullptr;
    }

    result->loadFromJson(obj);
    if (!result->isValid()) {
        qWarning() << "Stroke: invalid" << strokeType << "data";
        return nullptr;
    }
    return result;
}
