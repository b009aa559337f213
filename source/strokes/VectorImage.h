#pragma once

// ============================================================================
// VectorImage - An imported SVG drawing
// ============================================================================

#include "Stroke.h"
#include "TransformedRect.h"

#include <QByteArray>

class VectorImage : public Stroke {
public:
    VectorImage() = default;

    /**
     * @brief Create a vector image from SVG markup.
     * @param svgData Complete SVG document.
     * @param pos Upper left corner in document coordinates.
     * @param size Target size. An empty size uses the intrinsic size of the SVG.
     * @return nullptr if the markup cannot be parsed.
     */
    static std::unique_ptr<VectorImage> fromSvgData(const QByteArray& svgData, const QPointF& pos,
                                                    const QSizeF& size = QSizeF());

    // ===== Stroke Interface =====
    Kind kind() const override { return Kind::VectorImage; }
    QString type() const override { return QStringLiteral("vectorimage"); }
    std::unique_ptr<Stroke> clone() const override;
    QRectF bounds() const override { return m_rect.bounds(); }
    QVector<QRectF> hitboxes() const override { return { m_rect.bounds() }; }
    void translate(const QPointF& offset) override { m_rect.translate(offset); }
    void rotate(qreal angle, const QPointF& center) override { m_rect.rotate(angle, center); }
    void scale(const QPointF& factors) override { m_rect.scale(factors); }
    bool draw(QPainter& painter, qreal imageScale) const override;
    bool isValid() const override;
    StrokeLayer defaultLayer() const override { return StrokeLayer::image(); }
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;

    const QByteArray& svgData() const { return m_svgData; }
    const TransformedRect& placement() const { return m_rect; }

private:
    QByteArray m_svgData;
    TransformedRect m_rect;
};
