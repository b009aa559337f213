// ============================================================================
// TextStroke - Implementation
// ============================================================================

#include "TextStroke.h"
#include "../core/Bounds.h"

#include <QPainter>
#include <QFontMetricsF>
#include <QtMath>

namespace {
constexpr qreal MAX_LAYOUT_WIDTH = 1.0e6;
}

// ===== TextStyle =====

QFont TextStyle::font() const
{
    QFont f(fontFamily);
    f.setPointSizeF(qMax(fontSize, 1.0));
    f.setBold(bold);
    f.setItalic(italic);
    return f;
}

QJsonObject TextStyle::toJson() const
{
    QJsonObject obj;
    obj["font_family"] = fontFamily;
    obj["font_size"] = fontSize;
    obj["bold"] = bold;
    obj["italic"] = italic;
    obj["color"] = ColorUtils::toJson(color);
    obj["alignment"] = static_cast<int>(alignment);
    return obj;
}

TextStyle TextStyle::fromJson(const QJsonObject& obj)
{
    TextStyle style;
    style.fontFamily = obj["font_family"].toString(style.fontFamily);
    style.fontSize = obj["font_size"].toDouble(style.fontSize);
    style.bold = obj["bold"].toBool(false);
    style.italic = obj["italic"].toBool(false);
    style.color = ColorUtils::fromJson(obj["color"].toString(), Qt::black);
    style.alignment = static_cast<Qt::Alignment>(obj["alignment"].toInt(Qt::AlignLeft));
    return style;
}

// ===== TextStroke =====

TextStroke::TextStroke(const QString& text, const QPointF& pos, const TextStyle& style, qreal maxWidth)
    : m_text(text)
    , m_style(style)
    , m_maxWidth(maxWidth)
    , m_rect(QRectF(pos, QSizeF(0.0, 0.0)))
{
    updateLayout();
}

std::unique_ptr<Stroke> TextStroke::clone() const
{
    return std::make_unique<TextStroke>(*this);
}

void TextStroke::setText(const QString& text)
{
    m_text = text;
    updateLayout();
}

void TextStroke::setStyle(const TextStyle& style)
{
    m_style = style;
    updateLayout();
}

int TextStroke::textFlags() const
{
    int flags = static_cast<int>(m_style.alignment) | Qt::AlignTop;
    if (m_maxWidth > 0.0) {
        flags |= Qt::TextWordWrap;
    }
    return flags;
}

void TextStroke::updateLayout()
{
    const QFontMetricsF metrics(m_style.font());
    const qreal layoutWidth = m_maxWidth > 0.0 ? m_maxWidth : MAX_LAYOUT_WIDTH;
    const QRectF measured = metrics.boundingRect(QRectF(0.0, 0.0, layoutWidth, MAX_LAYOUT_WIDTH),
                                                 textFlags(), m_text.isEmpty() ? QStringLiteral(" ") : m_text);

    const qreal width = m_maxWidth > 0.0 ? m_maxWidth : qMax(measured.width(), 1.0);
    const qreal height = qMax(measured.height(), metrics.height());
    m_rect.rect.setSize(QSizeF(width, height));
}

QVector<QRectF> TextStroke::hitboxes() const
{
    return { bounds() };
}

void TextStroke::setToDarkestColor()
{
    m_style.color = ColorUtils::darkest(m_style.color);
}

bool TextStroke::draw(QPainter& painter, qreal imageScale) const
{
    Q_UNUSED(imageScale)

    painter.save();
    painter.setTransform(m_rect.transform, true);
    painter.setFont(m_style.font());
    painter.setPen(m_style.color);
    painter.drawText(m_rect.rect, textFlags(), m_text);
    painter.restore();
    return true;
}

QJsonObject TextStroke::toJson() const
{
    QJsonObject obj = Stroke::toJson();
    obj["text"] = m_text;
    obj["style"] = m_style.toJson();
    obj["max_width"] = m_maxWidth;
    obj["rect"] = m_rect.toJson();
    return obj;
}

void TextStroke::loadFromJson(const QJsonObject& obj)
{
    m_text = obj["text"].toString();
    m_style = TextStyle::fromJson(obj["style"].toObject());
    m_maxWidth = obj["max_width"].toDouble(0.0);
    m_rect = TransformedRect::fromJson(obj["rect"].toObject());
    // Size is derived, only the origin and transform are authoritative.
    updateLayout();
}
