#pragma once

// ============================================================================
// StrokeStyle - Visual style of brush and shape strokes
// ============================================================================

#include <QColor>
#include <QJsonObject>
#include <QString>

/**
 * @brief How pen pressure maps to stroke width.
 */
enum class PressureCurve {
    Const,      ///< Pressure is ignored
    Linear,
    Sqrt,
    Cbrt,
    Pow2,
    Pow3
};

/**
 * @brief Style of a brush (pen) stroke.
 */
struct BrushStyle {
    QColor color = Qt::black;
    qreal width = 2.0;                                  ///< Width at full pressure
    PressureCurve pressureCurve = PressureCurve::Linear;

    /**
     * @brief Width at the given pressure.
     * @param pressure Pen pressure in [0, 1].
     */
    qreal widthAt(qreal pressure) const;

    QJsonObject toJson() const;
    static BrushStyle fromJson(const QJsonObject& obj);
};

/**
 * @brief Style of a shape stroke: outline plus optional fill.
 */
struct ShapeStyle {
    QColor strokeColor = Qt::black;
    qreal strokeWidth = 2.0;
    QColor fillColor = Qt::transparent;   ///< Transparent means no fill

    bool hasFill() const { return fillColor.alpha() > 0; }

    QJsonObject toJson() const;
    static ShapeStyle fromJson(const QJsonObject& obj);
};

// ===== Color helpers =====

namespace ColorUtils {

/// Perceived brightness in [0, 1].
qreal luma(const QColor& color);

/// Same hue and saturation with inverted lightness.
QColor invertedBrightness(const QColor& color);

/// The darker of the color and its brightness-inverted counterpart.
QColor darkest(const QColor& color);

/// Serialize as #AARRGGBB.
QString toJson(const QColor& color);
QColor fromJson(const QString& str, const QColor& fallback);

} // namespace ColorUtils
