#pragma once

// ============================================================================
// ComponentTable - Implicitly shared sparse map keyed by StrokeKey
// ============================================================================
// Copying a table is O(1): both copies share one QHash until one of them is
// written to. History entries hold copies of the live tables, and
// isSharedWith() tells whether the live table changed since the copy.
//
// Only the non-const accessors detach. Read paths must go through the const
// overloads (or constData()) to keep sharing intact.
// ============================================================================

#include "StrokeKey.h"

#include <QSharedData>
#include <QSharedDataPointer>
#include <QHash>
#include <QVector>

template <typename T>
class ComponentTable {
public:
    ComponentTable() : d(new Data) {}

    bool contains(const StrokeKey& key) const { return d->map.contains(key); }
    int size() const { return d->map.size(); }
    bool isEmpty() const { return d->map.isEmpty(); }

    /// Pointer to the value, nullptr if absent. Never detaches.
    const T* get(const StrokeKey& key) const {
        auto it = d->map.constFind(key);
        return it == d->map.constEnd() ? nullptr : &it.value();
    }

    /// Mutable pointer to the value, nullptr if absent. Detaches if shared.
    T* getMut(const StrokeKey& key) {
        if (!d.constData()->map.contains(key)) {
            return nullptr;
        }
        auto it = d->map.find(key);
        return &it.value();
    }

    void insert(const StrokeKey& key, const T& value) { d->map.insert(key, value); }

    bool remove(const StrokeKey& key) {
        if (!d.constData()->map.contains(key)) {
            return false;
        }
        return d->map.remove(key) > 0;
    }

    void clear() {
        if (!d.constData()->map.isEmpty()) {
            d->map.clear();
        }
    }

    QVector<StrokeKey> keys() const {
        QVector<StrokeKey> result;
        result.reserve(d->map.size());
        for (auto it = d->map.constBegin(); it != d->map.constEnd(); ++it) {
            result.append(it.key());
        }
        return result;
    }

    const QHash<StrokeKey, T>& constData() const { return d->map; }

    /// True when both tables still share the same storage.
    bool isSharedWith(const ComponentTable& other) const { return d.constData() == other.d.constData(); }

private:
    struct Data : public QSharedData {
        QHash<StrokeKey, T> map;
    };

    QSharedDataPointer<Data> d;
};
