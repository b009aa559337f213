#include "XoppWriter.h"
#include "../core/Document.h"
#include "../store/StrokeContent.h"
#include "../strokes/BrushStroke.h"

#include <QObject>
#include <QStringList>
#include <QXmlStreamWriter>
#include <QDebug>

// miniz - cross-platform ZIP library (MIT license)
#include "miniz.h"

namespace {

constexpr unsigned char GZIP_ID1 = 0x1f;
constexpr unsigned char GZIP_ID2 = 0x8b;
constexpr unsigned char GZIP_DEFLATE = 0x08;
constexpr int GZIP_HEADER_LEN = 10;
constexpr int GZIP_TRAILER_LEN = 8;

// Header flag bits
constexpr unsigned char FHCRC = 0x02;
constexpr unsigned char FEXTRA = 0x04;
constexpr unsigned char FNAME = 0x08;
constexpr unsigned char FCOMMENT = 0x10;

QString xoppValue(qreal value)
{
    return QString::number(value, 'f', XoppWriter::VALUE_DECIMALS);
}

void appendLe32(QByteArray& out, quint32 value)
{
    out.append(static_cast<char>(value & 0xff));
    out.append(static_cast<char>((value >> 8) & 0xff));
    out.append(static_cast<char>((value >> 16) & 0xff));
    out.append(static_cast<char>((value >> 24) & 0xff));
}

quint32 readLe32(const unsigned char* p)
{
    return static_cast<quint32>(p[0])
        | (static_cast<quint32>(p[1]) << 8)
        | (static_cast<quint32>(p[2]) << 16)
        | (static_cast<quint32>(p[3]) << 24);
}

} // namespace

// ============================================================================
// Gzip
// ============================================================================

bool XoppWriter::gzipCompress(const QByteArray& data, QByteArray& out)
{
    size_t deflatedLen = 0;
    void* deflated = tdefl_compress_mem_to_heap(data.constData(), static_cast<size_t>(data.size()),
                                                &deflatedLen, TDEFL_DEFAULT_MAX_PROBES);
    if (!deflated) {
        qWarning() << "XoppWriter: deflate failed for" << data.size() << "bytes";
        return false;
    }

    const mz_ulong crc = mz_crc32(MZ_CRC32_INIT,
                                  reinterpret_cast<const unsigned char*>(data.constData()),
                                  static_cast<size_t>(data.size()));

    out.clear();
    out.reserve(GZIP_HEADER_LEN + static_cast<int>(deflatedLen) + GZIP_TRAILER_LEN);
    const char header[GZIP_HEADER_LEN] = {
        static_cast<char>(GZIP_ID1), static_cast<char>(GZIP_ID2), static_cast<char>(GZIP_DEFLATE),
        0,              // flags
        0, 0, 0, 0,     // mtime
        0,              // extra flags
        static_cast<char>(0xff)    // unknown OS
    };
    out.append(header, GZIP_HEADER_LEN);
    out.append(static_cast<const char*>(deflated), static_cast<int>(deflatedLen));
    appendLe32(out, static_cast<quint32>(crc));
    appendLe32(out, static_cast<quint32>(data.size()));

    mz_free(deflated);
    return true;
}

bool XoppWriter::gzipDecompress(const QByteArray& data, QByteArray& out)
{
    const auto* bytes = reinterpret_cast<const unsigned char*>(data.constData());
    const int size = data.size();
    if (size < GZIP_HEADER_LEN + GZIP_TRAILER_LEN
        || bytes[0] != GZIP_ID1 || bytes[1] != GZIP_ID2 || bytes[2] != GZIP_DEFLATE) {
        qWarning() << "XoppWriter: not a gzip stream";
        return false;
    }

    const unsigned char flags = bytes[3];
    int pos = GZIP_HEADER_LEN;
    if (flags & FEXTRA) {
        if (pos + 2 > size) {
            return false;
        }
        pos += 2 + (bytes[pos] | (bytes[pos + 1] << 8));
    }
    if (flags & FNAME) {
        while (pos < size && bytes[pos] != 0) {
            pos++;
        }
        pos++;
    }
    if (flags & FCOMMENT) {
        while (pos < size && bytes[pos] != 0) {
            pos++;
        }
        pos++;
    }
    if (flags & FHCRC) {
        pos += 2;
    }
    if (pos > size - GZIP_TRAILER_LEN) {
        qWarning() << "XoppWriter: truncated gzip header";
        return false;
    }

    size_t inflatedLen = 0;
    void* inflated = tinfl_decompress_mem_to_heap(bytes + pos,
                                                  static_cast<size_t>(size - GZIP_TRAILER_LEN - pos),
                                                  &inflatedLen, 0);
    if (!inflated) {
        qWarning() << "XoppWriter: inflate failed";
        return false;
    }
    out = QByteArray(static_cast<const char*>(inflated), static_cast<int>(inflatedLen));
    mz_free(inflated);

    const quint32 expectedCrc = readLe32(bytes + size - GZIP_TRAILER_LEN);
    const mz_ulong crc = mz_crc32(MZ_CRC32_INIT,
                                  reinterpret_cast<const unsigned char*>(out.constData()),
                                  static_cast<size_t>(out.size()));
    if (static_cast<quint32>(crc) != expectedCrc) {
        qWarning() << "XoppWriter: gzip checksum mismatch";
        out.clear();
        return false;
    }
    return true;
}

// ============================================================================
// XML
// ============================================================================

QString XoppWriter::colorToXopp(const QColor& color)
{
    const QColor rgb = color.toRgb();
    return QStringLiteral("#%1%2%3%4")
        .arg(rgb.red(), 2, 16, QLatin1Char('0'))
        .arg(rgb.green(), 2, 16, QLatin1Char('0'))
        .arg(rgb.blue(), 2, 16, QLatin1Char('0'))
        .arg(rgb.alpha(), 2, 16, QLatin1Char('0'));
}

void XoppWriter::writePage(QXmlStreamWriter& xml, const StrokeContent& page,
                           const Document& document)
{
    const qreal dpi = document.format.dpi;
    const QRectF pageBounds = page.bounds();
    const QPointF origin = pageBounds.topLeft();

    auto coord = [&](qreal value, qreal originValue) {
        return xoppValue(convertDpi(value - originValue, dpi, DPI));
    };

    xml.writeStartElement("page");
    xml.writeAttribute("width", xoppValue(convertDpi(pageBounds.width(), dpi, DPI)));
    xml.writeAttribute("height", xoppValue(convertDpi(pageBounds.height(), dpi, DPI)));

    xml.writeEmptyElement("background");
    xml.writeAttribute("type", "solid");
    xml.writeAttribute("color", colorToXopp(document.background.color));
    xml.writeAttribute("style", "plain");

    struct XoppStroke {
        QString color;
        QString widths;
        QString coords;
    };
    struct XoppImage {
        QRectF bounds;
        QByteArray png;
    };
    QVector<XoppStroke> xoppStrokes;
    QVector<XoppImage> xoppImages;

    for (const auto& stroke : page.strokes) {
        if (stroke->kind() == Stroke::Kind::Brush) {
            const auto* brush = static_cast<const BrushStroke*>(stroke.get());
            const QVector<StrokePoint> elements = brush->path().flattened();
            // Xournal++ needs at least two points
            if (elements.size() < 2) {
                continue;
            }

            QStringList widths;
            widths.append(xoppValue(convertDpi(brush->style().width, dpi, DPI)));
            QStringList coords;
            for (const StrokePoint& element : elements) {
                widths.append(xoppValue(convertDpi(brush->style().widthAt(element.pressure), dpi, DPI)));
                coords.append(coord(element.pos.x(), origin.x()));
                coords.append(coord(element.pos.y(), origin.y()));
            }
            xoppStrokes.append(XoppStroke{colorToXopp(brush->style().color),
                                          widths.join(QLatin1Char(' ')),
                                          coords.join(QLatin1Char(' '))});
            continue;
        }

        XoppImage image;
        if (!stroke->exportToBitmapBytes("PNG", Stroke::EXPORT_IMAGE_SCALE, image.png)) {
            qWarning() << "XoppWriter: rasterizing" << stroke->type() << "failed, skipped";
            continue;
        }
        image.bounds = stroke->bounds();
        xoppImages.append(image);
    }

    // Images go into the lower layer, pen strokes on top
    xml.writeStartElement("layer");
    for (const XoppImage& image : xoppImages) {
        xml.writeStartElement("image");
        xml.writeAttribute("left", coord(image.bounds.left(), origin.x()));
        xml.writeAttribute("top", coord(image.bounds.top(), origin.y()));
        xml.writeAttribute("right", coord(image.bounds.right(), origin.x()));
        xml.writeAttribute("bottom", coord(image.bounds.bottom(), origin.y()));
        xml.writeCharacters(QString::fromLatin1(image.png.toBase64()));
        xml.writeEndElement();
    }
    xml.writeEndElement();

    xml.writeStartElement("layer");
    for (const XoppStroke& stroke : xoppStrokes) {
        xml.writeStartElement("stroke");
        xml.writeAttribute("tool", "pen");
        xml.writeAttribute("color", stroke.color);
        xml.writeAttribute("width", stroke.widths);
        xml.writeCharacters(stroke.coords);
        xml.writeEndElement();
    }
    xml.writeEndElement();

    xml.writeEndElement(); // page
}

QByteArray XoppWriter::toXml(const QVector<StrokeContent>& pages, const Document& document)
{
    QByteArray result;
    QXmlStreamWriter xml(&result);
    xml.writeStartDocument();
    xml.writeStartElement("xournal");
    xml.writeAttribute("creator", "InkCore");
    xml.writeAttribute("fileversion", "4");
    xml.writeTextElement("title", "Xournal++ document - see https://github.com/xournalpp/xournalpp "
                                  "(exported from InkCore)");

    for (const StrokeContent& page : pages) {
        if (!page.bounds().isValid()) {
            continue;
        }
        writePage(xml, page, document);
    }

    xml.writeEndElement();
    xml.writeEndDocument();
    return result;
}

bool XoppWriter::write(const QVector<StrokeContent>& pages, const Document& document,
                       QByteArray& out, QString* errorMessage)
{
    if (document.format.dpi <= 0.0) {
        if (errorMessage) {
            *errorMessage = QObject::tr("Invalid document DPI: %1").arg(document.format.dpi);
        }
        return false;
    }

    const QByteArray xml = toXml(pages, document);
    if (!gzipCompress(xml, out)) {
        if (errorMessage) {
            *errorMessage = QObject::tr("Failed to compress the Xournal++ document");
        }
        return false;
    }
    return true;
}
