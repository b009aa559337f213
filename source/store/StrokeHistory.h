#pragma once

// ============================================================================
// StrokeHistory - Bounded linear undo/redo history
// ============================================================================
// A list of entries plus the index of the live one. Recording drops every
// entry after the live one (the redo branch) and evicts the oldest entries
// once the list is longer than maxLen(). The list always holds at least one
// entry, the state undo can step back to last.
// ============================================================================

#include "HistoryEntry.h"

#include <QList>

class StrokeHistory {
public:
    explicit StrokeHistory(int maxLen = DEFAULT_MAX_LEN);

    /// Replace the whole history with a single entry.
    void clear(const HistoryEntry& initial);

    /**
     * @brief Push @p current as the new live entry.
     *
     * No-op when @p current is the live entry (identity comparison).
     * @return true if an entry was pushed.
     */
    bool record(const HistoryEntry& current);

    /**
     * @brief Overwrite the live entry with @p current and drop the redo branch.
     * @return true if the live entry changed.
     */
    bool updateLatest(const HistoryEntry& current);

    /// True when @p state is identical to the live entry.
    bool isLive(const HistoryEntry& state) const;

    /**
     * @brief Move the live index one step back.
     * @return The entry to restore, or nullptr if there is nothing to undo.
     */
    const HistoryEntry* stepBack();

    /**
     * @brief Move the live index one step forward.
     * @return The entry to restore, or nullptr if there is nothing to redo.
     */
    const HistoryEntry* stepForward();

    bool canUndo() const { return m_liveIndex > 0; }
    bool canRedo() const { return m_liveIndex < m_entries.size() - 1; }

    int size() const { return m_entries.size(); }
    int liveIndex() const { return m_liveIndex; }

    int maxLen() const { return m_maxLen; }

    /// Change the bound, evicting the oldest entries if needed.
    void setMaxLen(int maxLen);

    static constexpr int DEFAULT_MAX_LEN = 100;

private:
    void evictOldest();

    QList<HistoryEntry> m_entries;
    int m_liveIndex = 0;
    int m_maxLen = DEFAULT_MAX_LEN;
};
