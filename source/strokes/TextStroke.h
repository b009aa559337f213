#pragma once

// ============================================================================
// TextStroke - A block of text placed on the canvas
// ============================================================================
// The text is laid out inside TransformedRect::rect. The rectangle height is
// derived from the text and the font, the width is either fixed or the
// natural width of the longest line.
// ============================================================================

#include "Stroke.h"
#include "TransformedRect.h"

#include <QFont>

/**
 * @brief Font and color of a text stroke.
 */
struct TextStyle {
    QString fontFamily = QStringLiteral("sans-serif");
    qreal fontSize = 24.0;          ///< Point size in document units
    bool bold = false;
    bool italic = false;
    QColor color = Qt::black;
    Qt::Alignment alignment = Qt::AlignLeft;

    QFont font() const;

    QJsonObject toJson() const;
    static TextStyle fromJson(const QJsonObject& obj);
};

class TextStroke : public Stroke {
public:
    TextStroke() = default;

    /**
     * @brief Create a text stroke at a position.
     * @param text Content, may contain newlines.
     * @param pos Upper left corner in document coordinates.
     * @param style Font and color.
     * @param maxWidth Wrap width. 0 means no wrapping.
     */
    TextStroke(const QString& text, const QPointF& pos, const TextStyle& style, qreal maxWidth = 0.0);

    // ===== Stroke Interface =====
    Kind kind() const override { return Kind::Text; }
    QString type() const override { return QStringLiteral("textstroke"); }
    std::unique_ptr<Stroke> clone() const override;
    QRectF bounds() const override { return m_rect.bounds(); }
    QVector<QRectF> hitboxes() const override;
    void translate(const QPointF& offset) override { m_rect.translate(offset); }
    void rotate(qreal angle, const QPointF& center) override { m_rect.rotate(angle, center); }
    void scale(const QPointF& factors) override { m_rect.scale(factors); }
    bool draw(QPainter& painter, qreal imageScale) const override;
    void setStrokeColor(const QColor& color) override { m_style.color = color; }
    void setToDarkestColor() override;
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;

    // ===== Text Specific =====
    const QString& text() const { return m_text; }
    void setText(const QString& text);

    const TextStyle& style() const { return m_style; }
    void setStyle(const TextStyle& style);

    const TransformedRect& placement() const { return m_rect; }

private:
    /// Recompute the rectangle size from text, font and wrap width.
    void updateLayout();

    int textFlags() const;

    QString m_text;
    TextStyle m_style;
    qreal m_maxWidth = 0.0;
    TransformedRect m_rect;
};
