#pragma once

// ============================================================================
// StrokeContent - Strokes carried across the clipboard or export boundary
// ============================================================================
// Holds shared, read-only strokes in rendering order. Nothing in here points
// back into the live store, so content can be handed to worker threads or
// put on the clipboard while the store keeps changing.
// ============================================================================

#include "../core/Background.h"
#include "../strokes/Stroke.h"

#include <QByteArray>
#include <QJsonObject>
#include <QRectF>
#include <QString>
#include <QVector>

#include <memory>

struct Svg;

/**
 * @brief One representation of clipboard data.
 */
struct ClipboardContent {
    QString mimeType;
    QByteArray data;
};

class StrokeContent {
public:
    QVector<std::shared_ptr<const Stroke>> strokes;    ///< In rendering order

    StrokeContent() = default;
    explicit StrokeContent(const QVector<std::shared_ptr<const Stroke>>& strokes)
        : strokes(strokes) {}

    /// Use explicit bounds instead of the union of the stroke bounds (pages, viewports).
    StrokeContent& withBounds(const QRectF& bounds);
    StrokeContent& withBackground(const Background& background);

    bool hasExplicitBounds() const { return m_hasBounds; }
    bool hasBackground() const { return m_hasBackground; }
    const Background& background() const { return m_background; }

    bool isEmpty() const { return strokes.isEmpty(); }

    /**
     * @brief Explicit bounds if set, otherwise the union of the stroke bounds.
     * @return Invalid QRectF when there are neither bounds nor strokes.
     */
    QRectF bounds() const;

    /**
     * @brief Generate SVG markup of the content.
     *
     * The background, if present and requested, covers the bounds grown by
     * @p margin. Strokes are clipped to the bounds.
     *
     * @param out Receives the markup. Left empty when there are no bounds.
     * @return false if generating the markup failed.
     */
    bool genSvg(bool withBackground, bool withPattern, bool optimizePrinting, qreal margin,
                Svg& out) const;

    /**
     * @brief Draw the content onto a painter in document coordinates.
     * @return false if a stroke failed to draw.
     */
    bool draw(QPainter& painter, bool withBackground, bool withPattern, bool optimizePrinting,
              qreal margin, qreal imageScale) const;

    /**
     * @brief Clipboard representations: native JSON, SVG and PNG.
     *
     * The SVG and PNG entries are skipped with a warning when rendering fails;
     * the native entry is always present.
     */
    QVector<ClipboardContent> toClipboardContent() const;

    QJsonObject toJson() const;

    /**
     * @brief Deserialize content. Strokes that fail to load are skipped.
     */
    static StrokeContent fromJson(const QJsonObject& obj);

    static constexpr const char* MIME_TYPE = "application/x-inkcore-stroke-content";
    static constexpr qreal CLIPBOARD_EXPORT_MARGIN = 6.0;

private:
    /// Draw strokes, replacing colors with their darkest variant when printing.
    bool drawStrokes(QPainter& painter, bool optimizePrinting, qreal imageScale) const;

    QRectF m_bounds;
    bool m_hasBounds = false;
    Background m_background;
    bool m_hasBackground = false;
};
