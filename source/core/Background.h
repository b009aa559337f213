#pragma once

// ============================================================================
// Background - Page background color and pattern
// ============================================================================
// Patterns are aligned to the document origin, so neighbouring pages and
// partial exports line up with what is drawn on the canvas.
// ============================================================================

#include <QColor>
#include <QRectF>
#include <QString>
#include <QJsonObject>

class QPainter;

struct Background {
    enum class Pattern {
        None,
        Lines,      ///< Horizontal ruled lines
        Grid,
        Dots
    };

    QColor color = QColor(255, 255, 255);
    Pattern pattern = Pattern::Grid;
    qreal patternSpacing = 32.0;            ///< Distance between lines or dots
    QColor patternColor = QColor(200, 200, 200);
    qreal patternWidth = 1.0;               ///< Line width, or dot diameter for Dots

    /**
     * @brief Paint color and pattern into @p rect.
     * @param painter Painter set up in document coordinates.
     * @param rect Region to fill, in document coordinates.
     * @param withPattern False paints the color only.
     */
    void draw(QPainter& painter, const QRectF& rect, bool withPattern) const;

    /**
     * @brief Copy tuned for printing: white paper, pattern kept readable.
     *
     * A dark pattern on a dark background would vanish on white paper, so
     * the pattern color is brightness-inverted when the background was dark.
     */
    Background optimizedForPrinting() const;

    QJsonObject toJson() const;
    static Background fromJson(const QJsonObject& obj);

    static QString patternToString(Pattern pattern);
    static Pattern patternFromString(const QString& str);
};
