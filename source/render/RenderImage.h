#pragma once

// ============================================================================
// RenderImage - A positioned raster tile of a stroke
// ============================================================================
// Render images are produced on worker threads and cached per stroke in the
// render component. They carry their own transform so that translate,
// rotate and scale can move the cached pixels without re-rasterizing.
// ============================================================================

#include <QImage>
#include <QRectF>
#include <QTransform>
#include <QVector>

#include <functional>

class QPainter;

struct RenderImage {
    QImage image;           ///< Premultiplied ARGB pixels
    QRectF rect;            ///< Target rectangle in document coordinates (before transform)
    QTransform transform;   ///< Applied to rect when drawing

    /// Bounds of the image in document coordinates, transform applied.
    QRectF bounds() const { return transform.mapRect(rect); }

    void translate(const QPointF& offset);
    void rotate(qreal angle, const QPointF& center);
    void scale(const QPointF& factors);

    /**
     * @brief Draw the image into its document-space rectangle.
     *
     * The painter is expected to be set up in document coordinates.
     */
    void draw(QPainter& painter) const;

    /**
     * @brief Rasterize with a painter callback.
     *
     * Allocates an image covering @p bounds at @p imageScale, sets up the
     * painter so that the callback draws in document coordinates, and stores
     * the result in @p out.
     *
     * @param draw Callback drawing the content. Returning false aborts.
     * @param bounds Region to rasterize in document coordinates.
     * @param imageScale Pixels per document unit.
     * @return false if the region is empty, too large, or the callback failed.
     */
    static bool genWithPainter(const std::function<bool(QPainter&)>& draw,
                               const QRectF& bounds, qreal imageScale, RenderImage& out);

    /// Upper bound for either pixel dimension of a single render image.
    static constexpr int MAX_IMAGE_DIMENSION = 16384;
};

/**
 * @brief Result of rasterizing a stroke against a viewport.
 */
struct GeneratedImages {
    enum class Coverage {
        Full,       ///< Images cover the whole stroke
        Partial     ///< Images only cover the stroke inside `viewport`
    };

    Coverage coverage = Coverage::Full;
    QVector<RenderImage> images;
    QRectF viewport;    ///< Valid region for Coverage::Partial
};
