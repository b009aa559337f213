#pragma once

// ============================================================================
// Components - Per-stroke state held beside the stroke table
// ============================================================================

#include "../strokes/StrokeLayer.h"
#include "../render/RenderImage.h"

#include <QJsonObject>

struct TrashComponent {
    bool trashed = false;

    QJsonObject toJson() const {
        QJsonObject obj;
        obj["trashed"] = trashed;
        return obj;
    }
    static TrashComponent fromJson(const QJsonObject& obj) {
        return TrashComponent{obj["trashed"].toBool(false)};
    }
};

struct SelectionComponent {
    bool selected = false;

    QJsonObject toJson() const {
        QJsonObject obj;
        obj["selected"] = selected;
        return obj;
    }
    static SelectionComponent fromJson(const QJsonObject& obj) {
        return SelectionComponent{obj["selected"].toBool(false)};
    }
};

/**
 * @brief Rendering order of a stroke.
 *
 * Compared by layer first, then by the chrono stamp `t`.
 */
struct ChronoComponent {
    quint32 t = 0;
    StrokeLayer layer;

    bool operator<(const ChronoComponent& other) const {
        if (layer != other.layer) {
            return layer < other.layer;
        }
        return t < other.t;
    }

    QJsonObject toJson() const {
        QJsonObject obj;
        obj["t"] = static_cast<qint64>(t);
        obj["layer"] = layer.toString();
        return obj;
    }
    static ChronoComponent fromJson(const QJsonObject& obj) {
        ChronoComponent comp;
        comp.t = static_cast<quint32>(obj["t"].toDouble());
        comp.layer = StrokeLayer::fromString(obj["layer"].toString());
        return comp;
    }
};

/**
 * @brief Cached rasterization of a stroke.
 *
 * Not part of history and not persisted. The cached images always follow the
 * stroke's transforms, even while the state is Dirty.
 */
struct RenderComponent {
    enum class State {
        Complete,       ///< Images cover the whole stroke
        ForViewport,    ///< Images are valid while the viewport stays inside `viewport`
        Busy,           ///< A render task is in flight
        Dirty           ///< Images are missing or outdated
    };

    State state = State::Dirty;
    QRectF viewport;                ///< Only meaningful for ForViewport
    QVector<RenderImage> images;

    /// Set when the stroke changed while a task was in flight.
    bool pendingDirty = false;

    /// Identifies the in-flight task; older completions are dropped.
    quint64 ticket = 0;
};
