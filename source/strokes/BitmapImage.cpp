// ============================================================================
// BitmapImage - Implementation
// ============================================================================

#include "BitmapImage.h"

#include <QPainter>
#include <QBuffer>
#include <QCryptographicHash>
#include <QDebug>

std::unique_ptr<BitmapImage> BitmapImage::fromImageBytes(const QByteArray& data, const QPointF& pos,
                                                         const QSizeF& size)
{
    QImage decoded;
    if (!decoded.loadFromData(data)) {
        qWarning() << "BitmapImage: could not decode image data";
        return nullptr;
    }

    auto image = std::make_unique<BitmapImage>();
    image->m_imageBytes = data;
    image->m_image = decoded;
    image->m_rect = TransformedRect(QRectF(pos, size.isEmpty() ? QSizeF(decoded.size()) : size));
    return image;
}

std::unique_ptr<BitmapImage> BitmapImage::fromImage(const QImage& image, const QPointF& pos,
                                                    const QSizeF& size)
{
    if (image.isNull()) {
        return nullptr;
    }

    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    if (!image.save(&buffer, "PNG")) {
        qWarning() << "BitmapImage: encoding image as PNG failed";
        return nullptr;
    }
    buffer.close();

    auto result = std::make_unique<BitmapImage>();
    result->m_imageBytes = bytes;
    result->m_image = image;
    result->m_rect = TransformedRect(QRectF(pos, size.isEmpty() ? QSizeF(image.size()) : size));
    return result;
}

std::unique_ptr<Stroke> BitmapImage::clone() const
{
    return std::make_unique<BitmapImage>(*this);
}

QString BitmapImage::imageHash() const
{
    const QByteArray hash = QCryptographicHash::hash(m_imageBytes, QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

bool BitmapImage::draw(QPainter& painter, qreal imageScale) const
{
    Q_UNUSED(imageScale)

    if (m_image.isNull()) {
        return false;
    }

    painter.save();
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.setTransform(m_rect.transform, true);
    painter.drawImage(m_rect.rect, m_image);
    painter.restore();
    return true;
}

QJsonObject BitmapImage::toJson() const
{
    QJsonObject obj = Stroke::toJson();
    obj["data"] = QString::fromLatin1(m_imageBytes.toBase64());
    obj["rect"] = m_rect.toJson();
    return obj;
}

void BitmapImage::loadFromJson(const QJsonObject& obj)
{
    m_imageBytes = QByteArray::fromBase64(obj["data"].toString().toLatin1());
    m_rect = TransformedRect::fromJson(obj["rect"].toObject());
    m_image = QImage();
    if (!m_image.loadFromData(m_imageBytes)) {
        qWarning() << "BitmapImage: stored image data could not be decoded";
    }
}
