// ============================================================================
// StrokeHistory - Implementation
// ============================================================================

#include "StrokeHistory.h"

#include <QDebug>

StrokeHistory::StrokeHistory(int maxLen)
    : m_maxLen(qMax(1, maxLen))
{
    m_entries.append(HistoryEntry());
}

void StrokeHistory::clear(const HistoryEntry& initial)
{
    m_entries.clear();
    m_entries.append(initial);
    m_liveIndex = 0;
}

bool StrokeHistory::isLive(const HistoryEntry& state) const
{
    return m_entries.at(m_liveIndex).isSharedWith(state);
}

bool StrokeHistory::record(const HistoryEntry& current)
{
    if (isLive(current)) {
#ifdef QT_DEBUG
        qDebug() << "StrokeHistory: state has not changed, not recording";
#endif
        return false;
    }

    // Recording a new state drops the redo branch
    while (m_entries.size() > m_liveIndex + 1) {
        m_entries.removeLast();
    }

    m_entries.append(current);
    m_liveIndex++;
    evictOldest();
    return true;
}

bool StrokeHistory::updateLatest(const HistoryEntry& current)
{
    if (isLive(current)) {
        return false;
    }

    while (m_entries.size() > m_liveIndex + 1) {
        m_entries.removeLast();
    }
    m_entries[m_liveIndex] = current;
    return true;
}

const HistoryEntry* StrokeHistory::stepBack()
{
    if (!canUndo()) {
        return nullptr;
    }
    m_liveIndex--;
    return &m_entries.at(m_liveIndex);
}

const HistoryEntry* StrokeHistory::stepForward()
{
    if (!canRedo()) {
        return nullptr;
    }
    m_liveIndex++;
    return &m_entries.at(m_liveIndex);
}

void StrokeHistory::setMaxLen(int maxLen)
{
    m_maxLen = qMax(1, maxLen);
    evictOldest();
}

void StrokeHistory::evictOldest()
{
    while (m_entries.size() > m_maxLen) {
        m_entries.removeFirst();
        m_liveIndex = qMax(0, m_liveIndex - 1);
    }
}
