#pragma once

// ============================================================================
// StrokeKey - Generation checked handle to a stroke
// ============================================================================
// `index` addresses a slot in the StrokeTable arena, `generation` must match
// the generation stored in that slot. Generations are never reused within a
// store, so a key of a removed stroke can never resolve to another stroke.
// ============================================================================

#include <QtGlobal>
#include <QHashFunctions>
#include <QDebug>

struct StrokeKey {
    quint32 index = 0;
    quint32 generation = 0;     ///< 0 is never handed out

    bool isNull() const { return generation == 0; }

    bool operator==(const StrokeKey& other) const {
        return index == other.index && generation == other.generation;
    }
    bool operator!=(const StrokeKey& other) const { return !(*this == other); }

    /// Arbitrary but stable ordering, for sorting and tests.
    bool operator<(const StrokeKey& other) const {
        return index != other.index ? index < other.index : generation < other.generation;
    }
};

inline size_t qHash(const StrokeKey& key, size_t seed = 0)
{
    return qHashMulti(seed, key.index, key.generation);
}

inline QDebug operator<<(QDebug debug, const StrokeKey& key)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "StrokeKey(" << key.index << "v" << key.generation << ")";
    return debug;
}
