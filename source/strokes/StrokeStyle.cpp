#include "StrokeStyle.h"

#include <QtMath>
#include <cmath>

namespace {

QString pressureCurveName(PressureCurve curve)
{
    switch (curve) {
        case PressureCurve::Const:  return QStringLiteral("const");
        case PressureCurve::Linear: return QStringLiteral("linear");
        case PressureCurve::Sqrt:   return QStringLiteral("sqrt");
        case PressureCurve::Cbrt:   return QStringLiteral("cbrt");
        case PressureCurve::Pow2:   return QStringLiteral("pow2");
        case PressureCurve::Pow3:   return QStringLiteral("pow3");
    }
    return QStringLiteral("linear");
}

PressureCurve pressureCurveFromName(const QString& name)
{
    if (name == "const") return PressureCurve::Const;
    if (name == "sqrt")  return PressureCurve::Sqrt;
    if (name == "cbrt")  return PressureCurve::Cbrt;
    if (name == "pow2")  return PressureCurve::Pow2;
    if (name == "pow3")  return PressureCurve::Pow3;
    return PressureCurve::Linear;
}

} // namespace

// ===== BrushStyle =====

qreal BrushStyle::widthAt(qreal pressure) const
{
    const qreal p = qBound(0.0, pressure, 1.0);
    switch (pressureCurve) {
        case PressureCurve::Const:  return width;
        case PressureCurve::Linear: return width * p;
        case PressureCurve::Sqrt:   return width * qSqrt(p);
        case PressureCurve::Cbrt:   return width * std::cbrt(p);
        case PressureCurve::Pow2:   return width * p * p;
        case PressureCurve::Pow3:   return width * p * p * p;
    }
    return width;
}

QJsonObject BrushStyle::toJson() const
{
    QJsonObject obj;
    obj["color"] = ColorUtils::toJson(color);
    obj["width"] = width;
    obj["pressure_curve"] = pressureCurveName(pressureCurve);
    return obj;
}

BrushStyle BrushStyle::fromJson(const QJsonObject& obj)
{
    BrushStyle style;
    style.color = ColorUtils::fromJson(obj["color"].toString(), Qt::black);
    style.width = obj["width"].toDouble(2.0);
    style.pressureCurve = pressureCurveFromName(obj["pressure_curve"].toString());
    return style;
}

// ===== ShapeStyle =====

QJsonObject ShapeStyle::toJson() const
{
    QJsonObject obj;
    obj["stroke_color"] = ColorUtils::toJson(strokeColor);
    obj["stroke_width"] = strokeWidth;
    obj["fill_color"] = ColorUtils::toJson(fillColor);
    return obj;
}

ShapeStyle ShapeStyle::fromJson(const QJsonObject& obj)
{
    ShapeStyle style;
    style.strokeColor = ColorUtils::fromJson(obj["stroke_color"].toString(), Qt::black);
    style.strokeWidth = obj["stroke_width"].toDouble(2.0);
    style.fillColor = ColorUtils::fromJson(obj["fill_color"].toString(), Qt::transparent);
    return style;
}

// ===== ColorUtils =====

namespace ColorUtils {

qreal luma(const QColor& color)
{
    return 0.2126 * color.redF() + 0.7152 * color.greenF() + 0.0722 * color.blueF();
}

QColor invertedBrightness(const QColor& color)
{
    float h = 0, s = 0, l = 0, a = 0;
    color.toHsl().getHslF(&h, &s, &l, &a);
    if (h < 0) {
        h = 0;  // achromatic
    }
    return QColor::fromHslF(h, s, 1.0f - l, a);
}

QColor darkest(const QColor& color)
{
    const QColor inverted = invertedBrightness(color);
    return (luma(inverted) > luma(color)) ? color : inverted;
}

QString toJson(const QColor& color)
{
    return color.name(QColor::HexArgb);
}

QColor fromJson(const QString& str, const QColor& fallback)
{
    if (str.isEmpty()) {
        return fallback;
    }
    QColor color(str);
    return color.isValid() ? color : fallback;
}

} // namespace ColorUtils
