#pragma once

// ============================================================================
// Document - Page format, background and layout of a notebook
// ============================================================================
// The document is one rectangle in document coordinates (x, y, width,
// height). Pages are not stored: they are the format-sized tiles of that
// rectangle, aligned to the origin, computed on demand by pagesBounds().
// The layout decides how the rectangle grows when content is added.
//
// Document is a pure data class. Strokes live in the StrokeStore.
// ============================================================================

#include "Background.h"

#include <QString>
#include <QDateTime>
#include <QJsonObject>
#include <QRectF>
#include <QSizeF>
#include <QVector>

/**
 * @brief Page format (size and resolution).
 */
struct Format {
    enum class Orientation {
        Portrait,
        Landscape
    };

    qreal width = A4_WIDTH;     ///< Page width in document units (1/96 inch at 96 DPI)
    qreal height = A4_HEIGHT;
    qreal dpi = 96.0;
    Orientation orientation = Orientation::Portrait;

    QSizeF size() const { return QSizeF(width, height); }

    /// Swap width and height if they do not match @p o.
    void setOrientation(Orientation o);

    QJsonObject toJson() const;
    static Format fromJson(const QJsonObject& obj);

    // A4 at 96 DPI
    static constexpr qreal A4_WIDTH = 793.7007874015749;
    static constexpr qreal A4_HEIGHT = 1122.5196850393702;
};

/**
 * @brief Order in which page tiles are listed.
 */
enum class SplitOrder {
    RowMajor,       ///< Left to right, then top to bottom
    ColumnMajor     ///< Top to bottom, then left to right
};

class Document {
public:
    /**
     * @brief How the document grows with its content.
     */
    enum class Layout {
        FixedSize,          ///< Whole pages, grown and shrunk to fit content
        ContinuousVertical, ///< One page wide, grows downwards with padding
        SemiInfinite,       ///< Grows right and down, never left of or above the origin
        Infinite            ///< Grows in every direction
    };

    // ===== Identity & Metadata =====
    QString id;                         ///< UUID for tracking
    QString name;                       ///< Title, used as export metadata
    QDateTime created;
    QDateTime lastModified;
    QString formatVersion = "1.0";

    // ===== Geometry =====
    qreal x = 0.0;
    qreal y = 0.0;
    qreal width = Format::A4_WIDTH;
    qreal height = Format::A4_HEIGHT;

    // ===== Config =====
    Format format;
    Background background;
    Layout layout = Layout::ContinuousVertical;

    Document();

    /// Create a document with a fresh id and timestamps.
    static Document createNew(const QString& name, Layout layout = Layout::ContinuousVertical);

    QRectF bounds() const { return QRectF(x, y, width, height); }

    /**
     * @brief Bounds of every page of the document.
     *
     * Pages are format-sized tiles aligned to the document origin.
     */
    QVector<QRectF> pagesBounds(SplitOrder order = SplitOrder::RowMajor) const;

    /**
     * @brief Pages that intersect content.
     * @param contentBounds Bounds of every non-trashed stroke.
     * @return The pages intersecting any of the boxes. Falls back to the
     *         first page when nothing intersects, so exports are never empty.
     */
    QVector<QRectF> pagesBoundsWithContent(const QVector<QRectF>& contentBounds,
                                           SplitOrder order = SplitOrder::RowMajor) const;

    int pageCount() const { return pagesBounds().size(); }

    /**
     * @brief Resize the document to fit the given content.
     * @param contentBounds Union of the non-trashed stroke bounds, invalid if there is no content.
     * @return true if the document rectangle changed.
     */
    bool resizeToFitContent(const QRectF& contentBounds);

    /**
     * @brief Grow a FixedSize document by one page. No-op for other layouts.
     */
    bool addPageFixedSize();

    /**
     * @brief Shrink a FixedSize document by one page, never below one page.
     */
    bool removePageFixedSize();

    /// Mark as modified now.
    void touch() { lastModified = QDateTime::currentDateTimeUtc(); }

    // ===== Serialization =====

    QJsonObject toJson() const;
    static Document fromJson(const QJsonObject& obj);

    static QString layoutToString(Layout layout);
    static Layout layoutFromString(const QString& str);

    /**
     * @brief Split @p bounds into tiles of @p tileSize aligned to the origin.
     *
     * Tiles that merely touch the edge of @p bounds are not included.
     */
    static QVector<QRectF> splitOriginAligned(const QRectF& bounds, const QSizeF& tileSize,
                                              SplitOrder order);
};
