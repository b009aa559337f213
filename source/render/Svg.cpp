#include "Svg.h"
#include "../core/Bounds.h"

#include <QBuffer>
#include <QPainter>
#include <QSvgGenerator>
#include <QSvgRenderer>
#include <QImage>
#include <QImageWriter>
#include <QXmlStreamReader>
#include <QDebug>
#include <QtMath>

void Svg::merge(const Svg& other)
{
    bounds = svgData.isEmpty() ? other.bounds : Bounds::merged(bounds, other.bounds);
    svgData += other.svgData;
}

bool Svg::genWithPainter(const std::function<bool(QPainter&)>& draw,
                         const QRectF& bounds, Svg& out)
{
    if (bounds.width() <= 0.0 || bounds.height() <= 0.0) {
        qWarning() << "Svg: cannot generate markup for empty bounds" << bounds;
        return false;
    }

    QBuffer buffer;
    buffer.open(QIODevice::WriteOnly);

    QSvgGenerator generator;
    generator.setOutputDevice(&buffer);
    generator.setSize(QSize(qCeil(bounds.width()), qCeil(bounds.height())));
    generator.setViewBox(bounds);

    bool ok = false;
    {
        QPainter painter;
        if (!painter.begin(&generator)) {
            qWarning() << "Svg: failed to begin painting on svg generator";
            return false;
        }
        painter.setRenderHint(QPainter::Antialiasing, true);
        ok = draw(painter);
        painter.end();
    }
    if (!ok) {
        return false;
    }

    // Strip the XML declaration and the root element written by the generator.
    const QString document = QString::fromUtf8(buffer.data());
    const int rootStart = document.indexOf(QLatin1String("<svg"));
    const int contentStart = rootStart >= 0 ? document.indexOf(QLatin1Char('>'), rootStart) : -1;
    const int rootEnd = document.lastIndexOf(QLatin1String("</svg>"));
    if (contentStart < 0 || rootEnd < contentStart) {
        qWarning() << "Svg: generator output has no root element";
        return false;
    }

    out.svgData = document.mid(contentStart + 1, rootEnd - contentStart - 1);
    out.bounds = bounds;
    return true;
}

QString Svg::wrapSvgRoot(const QString& data, const QRectF& viewBox,
                         const QRectF& bounds, bool preserveAspectRatio)
{
    return QStringLiteral(
               "<svg x=\"%1\" y=\"%2\" width=\"%3\" height=\"%4\" viewBox=\"%5 %6 %7 %8\" "
               "preserveAspectRatio=\"%9\" version=\"1.2\" baseProfile=\"tiny\" "
               "xmlns=\"http://www.w3.org/2000/svg\" "
               "xmlns:xlink=\"http://www.w3.org/1999/xlink\">\n")
               .arg(bounds.x())
               .arg(bounds.y())
               .arg(bounds.width())
               .arg(bounds.height())
               .arg(viewBox.x())
               .arg(viewBox.y())
               .arg(viewBox.width())
               .arg(viewBox.height())
               .arg(preserveAspectRatio ? QStringLiteral("xMidYMid") : QStringLiteral("none"))
        + data + QStringLiteral("\n</svg>\n");
}

QString Svg::addXmlHeader(const QString& svg)
{
    return QStringLiteral("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>\n") + svg;
}

QString Svg::toDocument() const
{
    // The root is positioned at the origin; the view box keeps document coordinates.
    const QRectF rootBounds(QPointF(0, 0), bounds.size());
    return addXmlHeader(wrapSvgRoot(svgData, bounds, rootBounds, false));
}

bool Svg::genBitmap(qreal imageScale, const char* format, int quality, QByteArray& out) const
{
    const QSize size(qCeil(bounds.width() * imageScale), qCeil(bounds.height() * imageScale));
    if (size.isEmpty() || imageScale <= 0.0) {
        qWarning() << "Svg: cannot rasterize empty bounds" << bounds << "at scale" << imageScale;
        return false;
    }

    QXmlStreamReader reader(toDocument());
    QSvgRenderer renderer(&reader);
    if (!renderer.isValid()) {
        qWarning() << "Svg: generated markup could not be parsed";
        return false;
    }

    const bool opaque = qstricmp(format, "JPEG") == 0 || qstricmp(format, "JPG") == 0;
    QImage image(size, opaque ? QImage::Format_RGB32 : QImage::Format_ARGB32_Premultiplied);
    if (image.isNull()) {
        qWarning() << "Svg: failed to allocate image of size" << size;
        return false;
    }
    image.fill(opaque ? Qt::white : Qt::transparent);

    {
        QPainter painter(&image);
        painter.setRenderHint(QPainter::Antialiasing, true);
        painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
        renderer.render(&painter, QRectF(QPointF(0, 0), QSizeF(size)));
    }

    out.clear();
    QBuffer buffer(&out);
    buffer.open(QIODevice::WriteOnly);
    QImageWriter writer(&buffer, format);
    writer.setQuality(quality);
    if (!writer.write(image)) {
        qWarning() << "Svg: encoding" << format << "failed:" << writer.errorString();
        return false;
    }
    return true;
}
