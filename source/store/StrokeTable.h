#pragma once

// ============================================================================
// StrokeTable - Arena of shared strokes addressed by StrokeKey
// ============================================================================
// Slots are reused through a free list, generations are not: the caller
// passes a fresh generation on every insert. The table itself is implicitly
// shared (copy = O(1)), and each stroke is a shared_ptr, so a history entry
// and the live store share both the table and the strokes until one side
// writes.
// ============================================================================

#include "StrokeKey.h"
#include "../strokes/Stroke.h"

#include <QSharedData>
#include <QSharedDataPointer>
#include <QVector>

#include <memory>

class StrokeTable {
public:
    StrokeTable();

    /**
     * @brief Store a stroke in a free slot.
     * @param stroke Stroke to store, must not be null.
     * @param generation Fresh, non-zero generation for the new key.
     */
    StrokeKey insert(std::shared_ptr<Stroke> stroke, quint32 generation);

    /// Remove and return the stroke. nullptr for unknown or stale keys.
    std::shared_ptr<Stroke> remove(const StrokeKey& key);

    bool contains(const StrokeKey& key) const;

    /// Shared stroke for reading. nullptr for unknown or stale keys. Never detaches.
    std::shared_ptr<const Stroke> get(const StrokeKey& key) const;

    /**
     * @brief Slot holding the stroke, for copy-on-write mutation.
     *
     * Detaches the table if it is shared. The stroke itself may still be
     * shared with history; callers clone it when use_count() > 1.
     *
     * @return nullptr for unknown or stale keys.
     */
    std::shared_ptr<Stroke>* slotMut(const StrokeKey& key);

    /// Keys of all stored strokes, in slot order.
    QVector<StrokeKey> keys() const;

    int size() const { return d->count; }
    bool isEmpty() const { return d->count == 0; }

    void clear();

    bool isSharedWith(const StrokeTable& other) const { return d.constData() == other.d.constData(); }

private:
    struct Slot {
        quint32 generation = 0;             ///< 0 when the slot is free
        std::shared_ptr<Stroke> stroke;
    };

    struct Data : public QSharedData {
        QVector<Slot> slots;
        QVector<quint32> freeList;
        int count = 0;
    };

    const Slot* findSlot(const StrokeKey& key) const;

    QSharedDataPointer<Data> d;
};
