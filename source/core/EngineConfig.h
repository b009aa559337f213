#pragma once

// ============================================================================
// EngineConfig - Tunables of the stroke store and the render scheduler
// ============================================================================
// Persisted inside the document snapshot next to the document config.
// ============================================================================

#include <QJsonObject>

struct StoreConfig {
    /// Eraser remnants with fewer segments than this are dropped instead of kept as strokes.
    int eraserMinSplitSegments = 2;

    /// Maximum number of history entries, including the current one.
    int historyMaxLen = 100;

    QJsonObject toJson() const;
    static StoreConfig fromJson(const QJsonObject& obj);
};

struct RenderConfig {
    /// The viewport is extended by this factor of its size on every side before rendering.
    qreal viewportMarginFactor = 0.4;

    /**
     * @brief Fraction of the margin that may be used up before re-rendering.
     *
     * A ForViewport stroke is re-rendered once the viewport, extended by
     * viewportMarginFactor * rerenderThreshold, leaves the rendered region.
     */
    qreal rerenderThreshold = 0.7;

    /// Completions rendered at a scale further off than this are discarded.
    qreal imageScaleTolerance = 0.01;

    QJsonObject toJson() const;
    static RenderConfig fromJson(const QJsonObject& obj);
};
