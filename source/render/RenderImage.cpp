#include "RenderImage.h"

#include <QPainter>
#include <QDebug>
#include <QtMath>

void RenderImage::translate(const QPointF& offset)
{
    transform = transform * QTransform::fromTranslate(offset.x(), offset.y());
}

void RenderImage::rotate(qreal angle, const QPointF& center)
{
    QTransform rotation;
    rotation.translate(center.x(), center.y());
    rotation.rotateRadians(angle);
    rotation.translate(-center.x(), -center.y());
    transform = transform * rotation;
}

void RenderImage::scale(const QPointF& factors)
{
    transform = transform * QTransform::fromScale(factors.x(), factors.y());
}

void RenderImage::draw(QPainter& painter) const
{
    if (image.isNull()) {
        return;
    }
    painter.save();
    painter.setTransform(transform, true);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.drawImage(rect, image);
    painter.restore();
}

bool RenderImage::genWithPainter(const std::function<bool(QPainter&)>& draw,
                                 const QRectF& bounds, qreal imageScale, RenderImage& out)
{
    if (bounds.width() <= 0.0 || bounds.height() <= 0.0 || imageScale <= 0.0) {
        qWarning() << "RenderImage: cannot rasterize empty bounds" << bounds << "scale" << imageScale;
        return false;
    }

    const int pixelWidth = qCeil(bounds.width() * imageScale);
    const int pixelHeight = qCeil(bounds.height() * imageScale);
    if (pixelWidth > MAX_IMAGE_DIMENSION || pixelHeight > MAX_IMAGE_DIMENSION) {
        qWarning() << "RenderImage: image size" << pixelWidth << "x" << pixelHeight << "exceeds limit";
        return false;
    }

    QImage image(pixelWidth, pixelHeight, QImage::Format_ARGB32_Premultiplied);
    if (image.isNull()) {
        qWarning() << "RenderImage: allocating image failed" << pixelWidth << "x" << pixelHeight;
        return false;
    }
    image.fill(Qt::transparent);

    bool ok = false;
    {
        QPainter painter(&image);
        painter.setRenderHint(QPainter::Antialiasing, true);
        painter.scale(imageScale, imageScale);
        painter.translate(-bounds.topLeft());
        ok = draw(painter);
        painter.end();
    }
    if (!ok) {
        return false;
    }

    // The pixel grid is rounded up, so the image covers slightly more than bounds.
    out.image = image;
    out.rect = QRectF(bounds.topLeft(), QSizeF(pixelWidth / imageScale, pixelHeight / imageScale));
    out.transform = QTransform();
    return true;
}
