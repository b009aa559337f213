#pragma once

// ============================================================================
// SpatialIndex - R-tree from StrokeKey to bounding box
// ============================================================================
// Guttman R-tree with quadratic split. Each key appears at most once; the
// box last stored for a key is kept in a side table so update() and remove()
// can find the leaf without scanning the whole tree. rebuild() bulk loads
// with Sort-Tile-Recursive packing, which is what undo and document loading
// use.
//
// All box tests are inclusive (see Bounds), so degenerate boxes of straight
// strokes are found like any other.
// ============================================================================

#include "StrokeKey.h"

#include <QHash>
#include <QPair>
#include <QRectF>
#include <QVector>

#include <memory>
#include <vector>

class SpatialIndex {
public:
    SpatialIndex();
    ~SpatialIndex();

    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    /// Insert a key. An existing entry for the key is replaced.
    void insert(const StrokeKey& key, const QRectF& bounds);

    /// Replace the box of a key, inserting it if absent.
    void update(const StrokeKey& key, const QRectF& bounds);

    /// @return false if the key was not indexed.
    bool remove(const StrokeKey& key);

    bool contains(const StrokeKey& key) const { return m_boxes.contains(key); }

    /// Box stored for the key, or an invalid QRectF.
    QRectF boxFor(const StrokeKey& key) const { return m_boxes.value(key); }

    /// Keys whose box intersects @p region (unordered).
    QVector<StrokeKey> keysIntersecting(const QRectF& region) const;

    /// Keys whose box lies completely inside @p region (unordered).
    QVector<StrokeKey> keysContainedIn(const QRectF& region) const;

    /// Replace the whole content, bulk loading the tree.
    void rebuild(const QVector<QPair<StrokeKey, QRectF>>& entries);

    void clear();

    int size() const { return m_boxes.size(); }
    bool isEmpty() const { return m_boxes.isEmpty(); }

    /// Height of the tree (1 for a single leaf). For tests.
    int height() const;

    /// Check parent links, node boxes and fill factors. For tests.
    bool checkInvariants() const;

    static constexpr int MAX_ENTRIES = 16;
    static constexpr int MIN_ENTRIES = 6;

private:
    struct Node;

    Node* chooseLeaf(const QRectF& box) const;
    Node* findLeaf(Node* node, const StrokeKey& key, const QRectF& box) const;
    void insertIntoLeaf(const StrokeKey& key, const QRectF& box);
    void adjustTree(Node* node, std::unique_ptr<Node> split);
    std::unique_ptr<Node> splitNode(Node* node);
    void condenseTree(Node* leaf);
    void collectLeafEntries(const Node* node, QVector<QPair<StrokeKey, QRectF>>& out) const;
    bool checkNode(const Node* node, int depth, int& leafDepth) const;

    static QRectF nodeBox(const Node* node);

    std::unique_ptr<Node> m_root;
    QHash<StrokeKey, QRectF> m_boxes;
};
