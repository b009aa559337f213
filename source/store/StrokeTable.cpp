// ============================================================================
// StrokeTable - Implementation
// ============================================================================

#include "StrokeTable.h"

StrokeTable::StrokeTable()
    : d(new Data)
{
}

const StrokeTable::Slot* StrokeTable::findSlot(const StrokeKey& key) const
{
    const Data* data = d.constData();
    if (key.isNull() || key.index >= static_cast<quint32>(data->slots.size())) {
        return nullptr;
    }
    const Slot& slot = data->slots.at(static_cast<int>(key.index));
    if (slot.generation != key.generation || !slot.stroke) {
        return nullptr;
    }
    return &slot;
}

StrokeKey StrokeTable::insert(std::shared_ptr<Stroke> stroke, quint32 generation)
{
    Slot slot;
    slot.generation = generation;
    slot.stroke = std::move(stroke);

    StrokeKey key;
    key.generation = generation;

    if (!d->freeList.isEmpty()) {
        key.index = d->freeList.takeLast();
        d->slots[static_cast<int>(key.index)] = slot;
    } else {
        key.index = static_cast<quint32>(d->slots.size());
        d->slots.append(slot);
    }
    d->count++;
    return key;
}

std::shared_ptr<Stroke> StrokeTable::remove(const StrokeKey& key)
{
    if (!findSlot(key)) {
        return nullptr;
    }
    Slot& slot = d->slots[static_cast<int>(key.index)];
    std::shared_ptr<Stroke> stroke = std::move(slot.stroke);
    slot.stroke.reset();
    slot.generation = 0;
    d->freeList.append(key.index);
    d->count--;
    return stroke;
}

bool StrokeTable::contains(const StrokeKey& key) const
{
    return findSlot(key) != nullptr;
}

std::shared_ptr<const Stroke> StrokeTable::get(const StrokeKey& key) const
{
    const Slot* slot = findSlot(key);
    return slot ? slot->stroke : nullptr;
}

std::shared_ptr<Stroke>* StrokeTable::slotMut(const StrokeKey& key)
{
    if (!findSlot(key)) {
        return nullptr;
    }
    return &d->slots[static_cast<int>(key.index)].stroke;
}

QVector<StrokeKey> StrokeTable::keys() const
{
    const Data* data = d.constData();
    QVector<StrokeKey> result;
    result.reserve(data->count);
    for (int i = 0; i < data->slots.size(); ++i) {
        const Slot& slot = data->slots.at(i);
        if (slot.stroke) {
            result.append(StrokeKey{static_cast<quint32>(i), slot.generation});
        }
    }
    return result;
}

void StrokeTable::clear()
{
    if (d.constData()->slots.isEmpty()) {
        return;
    }
    d->slots.clear();
    d->freeList.clear();
    d->count = 0;
}
