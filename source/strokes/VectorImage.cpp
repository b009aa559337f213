// ============================================================================
// VectorImage - Implementation
// ============================================================================

#include "VectorImage.h"

#include <QPainter>
#include <QSvgRenderer>
#include <QDebug>

std::unique_ptr<VectorImage> VectorImage::fromSvgData(const QByteArray& svgData, const QPointF& pos,
                                                      const QSizeF& size)
{
    QSvgRenderer renderer(svgData);
    if (!renderer.isValid()) {
        qWarning() << "VectorImage: could not parse SVG data";
        return nullptr;
    }

    QSizeF targetSize = size;
    if (targetSize.isEmpty()) {
        const QRectF viewBox = renderer.viewBoxF();
        targetSize = viewBox.isEmpty() ? QSizeF(renderer.defaultSize()) : viewBox.size();
    }
    if (targetSize.isEmpty()) {
        qWarning() << "VectorImage: SVG has no usable size";
        return nullptr;
    }

    auto image = std::make_unique<VectorImage>();
    image->m_svgData = svgData;
    image->m_rect = TransformedRect(QRectF(pos, targetSize));
    return image;
}

std::unique_ptr<Stroke> VectorImage::clone() const
{
    return std::make_unique<VectorImage>(*this);
}

bool VectorImage::isValid() const
{
    if (m_svgData.isEmpty() || m_rect.rect.isEmpty()) {
        return false;
    }
    QSvgRenderer renderer(m_svgData);
    return renderer.isValid();
}

bool VectorImage::draw(QPainter& painter, qreal imageScale) const
{
    Q_UNUSED(imageScale)

    // Parsed per draw call, the renderer is not safe to share across workers.
    QSvgRenderer renderer(m_svgData);
    if (!renderer.isValid()) {
        qWarning() << "VectorImage: SVG data became unreadable";
        return false;
    }

    painter.save();
    painter.setTransform(m_rect.transform, true);
    renderer.render(&painter, m_rect.rect);
    painter.restore();
    return true;
}

QJsonObject VectorImage::toJson() const
{
    QJsonObject obj = Stroke::toJson();
    obj["svg_data"] = QString::fromUtf8(m_svgData);
    obj["rect"] = m_rect.toJson();
    return obj;
}

void VectorImage::loadFromJson(const QJsonObject& obj)
{
    m_svgData = obj["svg_data"].toString().toUtf8();
    m_rect = TransformedRect::fromJson(obj["rect"].toObject());
}
