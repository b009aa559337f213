// ============================================================================
// Document - Implementation
// ============================================================================

#include "Document.h"
#include "Bounds.h"

#include <QUuid>
#include <QtMath>
#include <QDebug>

#include <utility>

namespace {

// Upper bound of tiles returned by splitOriginAligned().
constexpr int MAX_TILES = 100000;

// Overlap below this does not count as a page.
constexpr qreal TILE_EPSILON = 1e-6;

} // namespace

// ===== Format =====

void Format::setOrientation(Orientation o)
{
    orientation = o;
    const bool landscape = width > height;
    if ((o == Orientation::Landscape) != landscape) {
        std::swap(width, height);
    }
}

QJsonObject Format::toJson() const
{
    QJsonObject obj;
    obj["width"] = width;
    obj["height"] = height;
    obj["dpi"] = dpi;
    obj["orientation"] = orientation == Orientation::Landscape ? "landscape" : "portrait";
    return obj;
}

Format Format::fromJson(const QJsonObject& obj)
{
    Format format;
    format.width = obj["width"].toDouble(A4_WIDTH);
    format.height = obj["height"].toDouble(A4_HEIGHT);
    format.dpi = obj["dpi"].toDouble(96.0);
    format.orientation = obj["orientation"].toString() == "landscape"
        ? Orientation::Landscape : Orientation::Portrait;

    if (format.width <= 0.0 || format.height <= 0.0 || format.dpi <= 0.0) {
        qWarning() << "Format::fromJson: invalid format, using A4";
        return Format();
    }
    return format;
}

// ===== Document =====

Document::Document()
{
    width = format.width;
    height = format.height;
}

Document Document::createNew(const QString& name, Layout layout)
{
    Document doc;
    doc.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    doc.name = name;
    doc.created = QDateTime::currentDateTimeUtc();
    doc.lastModified = doc.created;
    doc.layout = layout;
    return doc;
}

QVector<QRectF> Document::splitOriginAligned(const QRectF& bounds, const QSizeF& tileSize,
                                             SplitOrder order)
{
    QVector<QRectF> tiles;
    if (tileSize.width() <= 0.0 || tileSize.height() <= 0.0 || bounds.isEmpty()) {
        return tiles;
    }

    const qreal tw = tileSize.width();
    const qreal th = tileSize.height();
    const int colStart = qFloor(bounds.left() / tw);
    const int colEnd = qCeil(bounds.right() / tw);     // exclusive
    const int rowStart = qFloor(bounds.top() / th);
    const int rowEnd = qCeil(bounds.bottom() / th);

    const qint64 count = qint64(colEnd - colStart) * qint64(rowEnd - rowStart);
    if (count > MAX_TILES) {
        qWarning() << "Document::splitOriginAligned: too many tiles" << count;
        return tiles;
    }
    tiles.reserve(static_cast<int>(count));

    auto addTile = [&](int col, int row) {
        const QRectF tile(col * tw, row * th, tw, th);
        const QRectF overlap = tile.intersected(bounds);
        if (overlap.width() > TILE_EPSILON && overlap.height() > TILE_EPSILON) {
            tiles.append(tile);
        }
    };

    if (order == SplitOrder::RowMajor) {
        for (int row = rowStart; row < rowEnd; ++row) {
            for (int col = colStart; col < colEnd; ++col) {
                addTile(col, row);
            }
        }
    } else {
        for (int col = colStart; col < colEnd; ++col) {
            for (int row = rowStart; row < rowEnd; ++row) {
                addTile(col, row);
            }
        }
    }
    return tiles;
}

QVector<QRectF> Document::pagesBounds(SplitOrder order) const
{
    return splitOriginAligned(bounds(), format.size(), order);
}

QVector<QRectF> Document::pagesBoundsWithContent(const QVector<QRectF>& contentBounds,
                                                 SplitOrder order) const
{
    QVector<QRectF> result;
    const QVector<QRectF> pages = pagesBounds(order);
    for (const QRectF& page : pages) {
        for (const QRectF& content : contentBounds) {
            if (Bounds::intersects(page, content)) {
                result.append(page);
                break;
            }
        }
    }

    if (result.isEmpty()) {
        result.append(QRectF(QPointF(0.0, 0.0), format.size()));
    }
    return result;
}

bool Document::resizeToFitContent(const QRectF& contentBounds)
{
    const qreal fw = format.width;
    const qreal fh = format.height;
    const QRectF content = contentBounds.isValid() ? contentBounds : QRectF(0.0, 0.0, 0.0, 0.0);

    const qreal contentRight = qMax<qreal>(content.right(), 0.0);
    const qreal contentBottom = qMax<qreal>(content.bottom(), 0.0);

    QRectF newBounds;
    switch (layout) {
        case Layout::FixedSize:
        {
            const int pages = qMax(1, qCeil(contentBottom / fh));
            newBounds = QRectF(0.0, 0.0, fw, pages * fh);
            break;
        }
        case Layout::ContinuousVertical:
            newBounds = QRectF(0.0, 0.0, fw, qMax(contentBottom + fh, fh));
            break;

        case Layout::SemiInfinite:
        {
            // One page of padding to the right and below
            const int cols = qCeil(contentRight / fw) + 1;
            const int rows = qCeil(contentBottom / fh) + 1;
            newBounds = QRectF(0.0, 0.0, cols * fw, rows * fh);
            break;
        }
        case Layout::Infinite:
        {
            const qreal left = content.left() < 0.0 ? (qFloor(content.left() / fw) - 1) * fw : 0.0;
            const qreal top = content.top() < 0.0 ? (qFloor(content.top() / fh) - 1) * fh : 0.0;
            const qreal right = (qCeil(contentRight / fw) + 1) * fw;
            const qreal bottom = (qCeil(contentBottom / fh) + 1) * fh;
            newBounds = QRectF(QPointF(left, top), QPointF(right, bottom));
            break;
        }
    }

    if (newBounds == bounds()) {
        return false;
    }

    x = newBounds.x();
    y = newBounds.y();
    width = newBounds.width();
    height = newBounds.height();
    return true;
}

bool Document::addPageFixedSize()
{
    if (layout != Layout::FixedSize) {
        return false;
    }
    height += format.height;
    return true;
}

bool Document::removePageFixedSize()
{
    if (layout != Layout::FixedSize || height <= format.height) {
        return false;
    }
    height = qMax(format.height, height - format.height);
    return true;
}

// ===== Serialization =====

QString Document::layoutToString(Layout layout)
{
    switch (layout) {
        case Layout::FixedSize:          return QStringLiteral("fixed_size");
        case Layout::ContinuousVertical: return QStringLiteral("continuous_vertical");
        case Layout::SemiInfinite:       return QStringLiteral("semi_infinite");
        case Layout::Infinite:           return QStringLiteral("infinite");
    }
    return QStringLiteral("continuous_vertical");
}

Document::Layout Document::layoutFromString(const QString& str)
{
    if (str == "fixed_size")    return Layout::FixedSize;
    if (str == "semi_infinite") return Layout::SemiInfinite;
    if (str == "infinite")      return Layout::Infinite;
    return Layout::ContinuousVertical;
}

QJsonObject Document::toJson() const
{
    QJsonObject obj;
    obj["format_version"] = formatVersion;
    obj["id"] = id;
    obj["name"] = name;
    obj["created"] = created.toString(Qt::ISODate);
    obj["last_modified"] = lastModified.toString(Qt::ISODate);

    obj["x"] = x;
    obj["y"] = y;
    obj["width"] = width;
    obj["height"] = height;

    obj["format"] = format.toJson();
    obj["background"] = background.toJson();
    obj["layout"] = layoutToString(layout);
    return obj;
}

Document Document::fromJson(const QJsonObject& obj)
{
    Document doc;
    doc.formatVersion = obj["format_version"].toString("1.0");
    doc.id = obj["id"].toString();
    doc.name = obj["name"].toString();
    doc.created = QDateTime::fromString(obj["created"].toString(), Qt::ISODate);
    doc.lastModified = QDateTime::fromString(obj["last_modified"].toString(), Qt::ISODate);

    if (doc.id.isEmpty()) {
        doc.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }

    doc.format = Format::fromJson(obj["format"].toObject());
    doc.background = Background::fromJson(obj["background"].toObject());
    doc.layout = layoutFromString(obj["layout"].toString());

    doc.x = obj["x"].toDouble(0.0);
    doc.y = obj["y"].toDouble(0.0);
    doc.width = obj["width"].toDouble(doc.format.width);
    doc.height = obj["height"].toDouble(doc.format.height);
    if (doc.width <= 0.0 || doc.height <= 0.0) {
        qWarning() << "Document::fromJson: invalid document size, resetting to one page";
        doc.width = doc.format.width;
        doc.height = doc.format.height;
    }
    return doc;
}
