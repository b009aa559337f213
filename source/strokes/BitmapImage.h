#pragma once

// ============================================================================
// BitmapImage - An imported raster image
// ============================================================================
// The encoded bytes are the source of truth and are what gets serialized.
// The decoded QImage is kept alongside for drawing.
// ============================================================================

#include "Stroke.h"
#include "TransformedRect.h"

#include <QImage>
#include <QByteArray>

class BitmapImage : public Stroke {
public:
    BitmapImage() = default;

    /**
     * @brief Create from encoded image bytes (PNG, JPEG, ...).
     * @param data Encoded image.
     * @param pos Upper left corner in document coordinates.
     * @param size Target size. An empty size uses the pixel size.
     * @return nullptr if the bytes cannot be decoded.
     */
    static std::unique_ptr<BitmapImage> fromImageBytes(const QByteArray& data, const QPointF& pos,
                                                       const QSizeF& size = QSizeF());

    /**
     * @brief Create from a decoded image. It is re-encoded as PNG.
     */
    static std::unique_ptr<BitmapImage> fromImage(const QImage& image, const QPointF& pos,
                                                  const QSizeF& size = QSizeF());

    // ===== Stroke Interface =====
    Kind kind() const override { return Kind::BitmapImage; }
    QString type() const override { return QStringLiteral("bitmapimage"); }
    std::unique_ptr<Stroke> clone() const override;
    QRectF bounds() const override { return m_rect.bounds(); }
    QVector<QRectF> hitboxes() const override { return { m_rect.bounds() }; }
    void translate(const QPointF& offset) override { m_rect.translate(offset); }
    void rotate(qreal angle, const QPointF& center) override { m_rect.rotate(angle, center); }
    void scale(const QPointF& factors) override { m_rect.scale(factors); }
    bool draw(QPainter& painter, qreal imageScale) const override;
    bool isValid() const override { return !m_image.isNull() && !m_rect.rect.isEmpty(); }
    StrokeLayer defaultLayer() const override { return StrokeLayer::image(); }
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;

    const QByteArray& imageBytes() const { return m_imageBytes; }
    const QImage& image() const { return m_image; }
    const TransformedRect& placement() const { return m_rect; }

    /// SHA-256 of the encoded bytes, hex encoded.
    QString imageHash() const;

private:
    QByteArray m_imageBytes;
    QImage m_image;
    TransformedRect m_rect;
};
