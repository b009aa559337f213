#pragma once

// ============================================================================
// HistoryEntry - One undo step of the stroke store
// ============================================================================
// Copies of the live tables. Every table is implicitly shared, so creating an
// entry is O(1) and an entry costs memory only for what changed afterwards.
// Neither the spatial index nor the render components are part of an entry.
// ============================================================================

#include "ComponentTable.h"
#include "Components.h"
#include "StrokeTable.h"

struct HistoryEntry {
    StrokeTable strokes;
    ComponentTable<TrashComponent> trash;
    ComponentTable<SelectionComponent> selection;
    ComponentTable<ChronoComponent> chrono;
    quint32 chronoCounter = 0;

    /**
     * @brief Identity comparison: true when no table was written since one
     *        entry was copied from the other.
     */
    bool isSharedWith(const HistoryEntry& other) const {
        return strokes.isSharedWith(other.strokes)
            && trash.isSharedWith(other.trash)
            && selection.isSharedWith(other.selection)
            && chrono.isSharedWith(other.chrono)
            && chronoCounter == other.chronoCounter;
    }
};
