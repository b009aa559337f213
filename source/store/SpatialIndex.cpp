// ============================================================================
// SpatialIndex - Implementation
// ============================================================================

#include "SpatialIndex.h"
#include "../core/Bounds.h"

#include <QDebug>
#include <QtMath>

#include <algorithm>
#include <limits>

namespace {

// Node boxes are unions computed through QRectF (x, y, w, h) and can be off by
// an ulp against the boxes they were built from.
constexpr qreal NODE_TOLERANCE = 1e-6;

qreal halfPerimeter(const QRectF& box)
{
    return qMax<qreal>(0.0, box.width()) + qMax<qreal>(0.0, box.height());
}

qreal enlargement(const QRectF& box, const QRectF& added)
{
    return Bounds::area(Bounds::merged(box, added)) - Bounds::area(box);
}

/**
 * Sort-Tile-Recursive grouping: returns groups of at most @p maxEntries
 * indices into @p boxes, spatially clustered.
 */
QVector<QVector<int>> strTiles(const QVector<QRectF>& boxes, int maxEntries)
{
    QVector<QVector<int>> groups;
    const int n = boxes.size();
    if (n == 0) {
        return groups;
    }

    QVector<int> order(n);
    for (int i = 0; i < n; ++i) {
        order[i] = i;
    }
    std::sort(order.begin(), order.end(), [&boxes](int a, int b) {
        return boxes[a].center().x() < boxes[b].center().x();
    });

    const int nodeCount = (n + maxEntries - 1) / maxEntries;
    const int sliceCount = qMax(1, qCeil(qSqrt(static_cast<qreal>(nodeCount))));
    const int sliceSize = sliceCount * maxEntries;

    for (int s = 0; s < n; s += sliceSize) {
        QVector<int> slice = order.mid(s, sliceSize);
        std::sort(slice.begin(), slice.end(), [&boxes](int a, int b) {
            return boxes[a].center().y() < boxes[b].center().y();
        });
        for (int c = 0; c < slice.size(); c += maxEntries) {
            groups.append(slice.mid(c, maxEntries));
        }
    }
    return groups;
}

} // namespace

struct SpatialIndex::Node {
    bool leaf = true;
    Node* parent = nullptr;
    QVector<QRectF> boxes;
    QVector<StrokeKey> keys;                        ///< Leaf entries
    std::vector<std::unique_ptr<Node>> children;    ///< Internal entries

    int count() const { return boxes.size(); }

    int indexOfChild(const Node* child) const {
        for (size_t i = 0; i < children.size(); ++i) {
            if (children[i].get() == child) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }
};

SpatialIndex::SpatialIndex()
    : m_root(std::make_unique<Node>())
{
}

SpatialIndex::~SpatialIndex() = default;

QRectF SpatialIndex::nodeBox(const Node* node)
{
    if (node->boxes.isEmpty()) {
        return QRectF();
    }
    QRectF result = node->boxes.first();
    for (int i = 1; i < node->boxes.size(); ++i) {
        result = Bounds::merged(result, node->boxes[i]);
    }
    return result;
}

// ============================================================================
// Insertion
// ============================================================================

void SpatialIndex::insert(const StrokeKey& key, const QRectF& bounds)
{
    if (m_boxes.contains(key)) {
        remove(key);
    }
    m_boxes.insert(key, bounds);
    insertIntoLeaf(key, bounds);
}

void SpatialIndex::update(const StrokeKey& key, const QRectF& bounds)
{
    const auto it = m_boxes.constFind(key);
    if (it != m_boxes.constEnd() && it.value() == bounds) {
        return;
    }
    insert(key, bounds);
}

SpatialIndex::Node* SpatialIndex::chooseLeaf(const QRectF& box) const
{
    Node* node = m_root.get();
    while (!node->leaf) {
        int best = 0;
        qreal bestGrowth = std::numeric_limits<qreal>::max();
        qreal bestArea = std::numeric_limits<qreal>::max();
        qreal bestPerimeter = std::numeric_limits<qreal>::max();
        for (int i = 0; i < node->count(); ++i) {
            const QRectF& childBox = node->boxes[i];
            const qreal growth = enlargement(childBox, box);
            const qreal area = Bounds::area(childBox);
            const qreal perimeter = halfPerimeter(Bounds::merged(childBox, box));
            if (growth < bestGrowth
                || (growth == bestGrowth && area < bestArea)
                || (growth == bestGrowth && area == bestArea && perimeter < bestPerimeter)) {
                best = i;
                bestGrowth = growth;
                bestArea = area;
                bestPerimeter = perimeter;
            }
        }
        node = node->children[static_cast<size_t>(best)].get();
    }
    return node;
}

void SpatialIndex::insertIntoLeaf(const StrokeKey& key, const QRectF& box)
{
    Node* leaf = chooseLeaf(box);
    leaf->boxes.append(box);
    leaf->keys.append(key);

    std::unique_ptr<Node> split;
    if (leaf->count() > MAX_ENTRIES) {
        split = splitNode(leaf);
    }
    adjustTree(leaf, std::move(split));
}

void SpatialIndex::adjustTree(Node* node, std::unique_ptr<Node> split)
{
    while (node != m_root.get()) {
        Node* parent = node->parent;
        const int idx = parent->indexOfChild(node);
        parent->boxes[idx] = nodeBox(node);

        if (split) {
            split->parent = parent;
            parent->boxes.append(nodeBox(split.get()));
            parent->children.push_back(std::move(split));
            split.reset();
            if (parent->count() > MAX_ENTRIES) {
                split = splitNode(parent);
            }
        }
        node = parent;
    }

    if (split) {
        // Root was split: grow the tree by one level.
        auto newRoot = std::make_unique<Node>();
        newRoot->leaf = false;
        std::unique_ptr<Node> oldRoot = std::move(m_root);
        oldRoot->parent = newRoot.get();
        split->parent = newRoot.get();
        newRoot->boxes.append(nodeBox(oldRoot.get()));
        newRoot->boxes.append(nodeBox(split.get()));
        newRoot->children.push_back(std::move(oldRoot));
        newRoot->children.push_back(std::move(split));
        m_root = std::move(newRoot);
    }
}

std::unique_ptr<SpatialIndex::Node> SpatialIndex::splitNode(Node* node)
{
    const int n = node->count();
    const QVector<QRectF> boxes = node->boxes;

    // Quadratic seed selection: the pair wasting the most area together.
    int seedA = 0;
    int seedB = 1;
    qreal worstWaste = -std::numeric_limits<qreal>::max();
    qreal worstPerimeter = -std::numeric_limits<qreal>::max();
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            const QRectF m = Bounds::merged(boxes[i], boxes[j]);
            const qreal waste = Bounds::area(m) - Bounds::area(boxes[i]) - Bounds::area(boxes[j]);
            const qreal perimeter = halfPerimeter(m);
            if (waste > worstWaste || (waste == worstWaste && perimeter > worstPerimeter)) {
                worstWaste = waste;
                worstPerimeter = perimeter;
                seedA = i;
                seedB = j;
            }
        }
    }

    QVector<int> groupA{seedA};
    QVector<int> groupB{seedB};
    QRectF boxA = boxes[seedA];
    QRectF boxB = boxes[seedB];

    QVector<int> remaining;
    for (int i = 0; i < n; ++i) {
        if (i != seedA && i != seedB) {
            remaining.append(i);
        }
    }

    while (!remaining.isEmpty()) {
        if (groupA.size() + remaining.size() <= MIN_ENTRIES) {
            groupA += remaining;
            break;
        }
        if (groupB.size() + remaining.size() <= MIN_ENTRIES) {
            groupB += remaining;
            break;
        }

        // Pick the entry with the strongest preference for one group.
        int pick = 0;
        qreal bestDiff = -1.0;
        for (int r = 0; r < remaining.size(); ++r) {
            const QRectF& box = boxes[remaining[r]];
            const qreal diff = qAbs(enlargement(boxA, box) - enlargement(boxB, box));
            if (diff > bestDiff) {
                bestDiff = diff;
                pick = r;
            }
        }

        const int entry = remaining.takeAt(pick);
        const QRectF& box = boxes[entry];
        const qreal growA = enlargement(boxA, box);
        const qreal growB = enlargement(boxB, box);

        bool toA;
        if (growA != growB) {
            toA = growA < growB;
        } else if (Bounds::area(boxA) != Bounds::area(boxB)) {
            toA = Bounds::area(boxA) < Bounds::area(boxB);
        } else {
            toA = groupA.size() <= groupB.size();
        }

        if (toA) {
            groupA.append(entry);
            boxA = Bounds::merged(boxA, box);
        } else {
            groupB.append(entry);
            boxB = Bounds::merged(boxB, box);
        }
    }

    auto sibling = std::make_unique<Node>();
    sibling->leaf = node->leaf;
    sibling->parent = node->parent;

    const QVector<StrokeKey> keys = node->keys;
    std::vector<std::unique_ptr<Node>> children = std::move(node->children);
    node->boxes.clear();
    node->keys.clear();
    node->children.clear();

    auto moveEntry = [&](Node* target, int idx) {
        target->boxes.append(boxes[idx]);
        if (target->leaf) {
            target->keys.append(keys[idx]);
        } else {
            std::unique_ptr<Node>& child = children[static_cast<size_t>(idx)];
            child->parent = target;
            target->children.push_back(std::move(child));
        }
    };
    for (int idx : groupA) {
        moveEntry(node, idx);
    }
    for (int idx : groupB) {
        moveEntry(sibling.get(), idx);
    }
    return sibling;
}

// ============================================================================
// Removal
// ============================================================================

SpatialIndex::Node* SpatialIndex::findLeaf(Node* node, const StrokeKey& key, const QRectF& box) const
{
    if (node->leaf) {
        return node->keys.contains(key) ? node : nullptr;
    }
    for (int i = 0; i < node->count(); ++i) {
        if (Bounds::intersects(Bounds::loosened(node->boxes[i], NODE_TOLERANCE), box)) {
            Node* found = findLeaf(node->children[static_cast<size_t>(i)].get(), key, box);
            if (found) {
                return found;
            }
        }
    }
    return nullptr;
}

bool SpatialIndex::remove(const StrokeKey& key)
{
    const auto it = m_boxes.find(key);
    if (it == m_boxes.end()) {
        return false;
    }
    const QRectF box = it.value();
    m_boxes.erase(it);

    Node* leaf = findLeaf(m_root.get(), key, box);
    if (!leaf) {
        qWarning() << "SpatialIndex: entry for" << key << "not found in tree, rebuilding";
        QVector<QPair<StrokeKey, QRectF>> entries;
        entries.reserve(m_boxes.size());
        for (auto e = m_boxes.constBegin(); e != m_boxes.constEnd(); ++e) {
            entries.append(qMakePair(e.key(), e.value()));
        }
        rebuild(entries);
        return true;
    }

    const int idx = leaf->keys.indexOf(key);
    leaf->keys.remove(idx);
    leaf->boxes.remove(idx);
    condenseTree(leaf);
    return true;
}

void SpatialIndex::collectLeafEntries(const Node* node, QVector<QPair<StrokeKey, QRectF>>& out) const
{
    if (node->leaf) {
        for (int i = 0; i < node->count(); ++i) {
            out.append(qMakePair(node->keys[i], node->boxes[i]));
        }
        return;
    }
    for (const auto& child : node->children) {
        collectLeafEntries(child.get(), out);
    }
}

void SpatialIndex::condenseTree(Node* leaf)
{
    QVector<QPair<StrokeKey, QRectF>> orphans;

    Node* node = leaf;
    while (node != m_root.get()) {
        Node* parent = node->parent;
        const int idx = parent->indexOfChild(node);
        if (node->count() < MIN_ENTRIES) {
            collectLeafEntries(node, orphans);
            parent->boxes.remove(idx);
            parent->children.erase(parent->children.begin() + idx);
        } else {
            parent->boxes[idx] = nodeBox(node);
        }
        node = parent;
    }

    while (!m_root->leaf && m_root->count() == 1) {
        std::unique_ptr<Node> child = std::move(m_root->children.front());
        child->parent = nullptr;
        m_root = std::move(child);
    }
    if (!m_root->leaf && m_root->count() == 0) {
        m_root = std::make_unique<Node>();
    }

    for (const auto& entry : orphans) {
        insertIntoLeaf(entry.first, entry.second);
    }
}

void SpatialIndex::clear()
{
    m_root = std::make_unique<Node>();
    m_boxes.clear();
}

// ============================================================================
// Bulk load
// ============================================================================

void SpatialIndex::rebuild(const QVector<QPair<StrokeKey, QRectF>>& entries)
{
    m_boxes.clear();
    for (const auto& entry : entries) {
        m_boxes.insert(entry.first, entry.second);
    }
    m_root = std::make_unique<Node>();
    if (m_boxes.isEmpty()) {
        return;
    }

    // Leaves
    QVector<StrokeKey> keys;
    QVector<QRectF> boxes;
    keys.reserve(m_boxes.size());
    boxes.reserve(m_boxes.size());
    for (auto it = m_boxes.constBegin(); it != m_boxes.constEnd(); ++it) {
        keys.append(it.key());
        boxes.append(it.value());
    }

    std::vector<std::unique_ptr<Node>> level;
    for (const QVector<int>& group : strTiles(boxes, MAX_ENTRIES)) {
        auto leaf = std::make_unique<Node>();
        for (int idx : group) {
            leaf->keys.append(keys[idx]);
            leaf->boxes.append(boxes[idx]);
        }
        level.push_back(std::move(leaf));
    }

    // Upper levels
    while (level.size() > 1) {
        QVector<QRectF> levelBoxes;
        levelBoxes.reserve(static_cast<int>(level.size()));
        for (const auto& node : level) {
            levelBoxes.append(nodeBox(node.get()));
        }

        std::vector<std::unique_ptr<Node>> parents;
        for (const QVector<int>& group : strTiles(levelBoxes, MAX_ENTRIES)) {
            auto parent = std::make_unique<Node>();
            parent->leaf = false;
            for (int idx : group) {
                std::unique_ptr<Node>& child = level[static_cast<size_t>(idx)];
                child->parent = parent.get();
                parent->boxes.append(levelBoxes[idx]);
                parent->children.push_back(std::move(child));
            }
            parents.push_back(std::move(parent));
        }
        level = std::move(parents);
    }

    m_root = std::move(level.front());
    m_root->parent = nullptr;
}

// ============================================================================
// Queries
// ============================================================================

QVector<StrokeKey> SpatialIndex::keysIntersecting(const QRectF& region) const
{
    QVector<StrokeKey> result;
    QVector<const Node*> stack{m_root.get()};
    while (!stack.isEmpty()) {
        const Node* node = stack.takeLast();
        for (int i = 0; i < node->count(); ++i) {
            if (node->leaf) {
                if (Bounds::intersects(node->boxes[i], region)) {
                    result.append(node->keys[i]);
                }
            } else if (Bounds::intersects(Bounds::loosened(node->boxes[i], NODE_TOLERANCE), region)) {
                stack.append(node->children[static_cast<size_t>(i)].get());
            }
        }
    }
    return result;
}

QVector<StrokeKey> SpatialIndex::keysContainedIn(const QRectF& region) const
{
    QVector<StrokeKey> result;
    QVector<const Node*> stack{m_root.get()};
    while (!stack.isEmpty()) {
        const Node* node = stack.takeLast();
        for (int i = 0; i < node->count(); ++i) {
            if (node->leaf) {
                if (Bounds::contains(region, node->boxes[i])) {
                    result.append(node->keys[i]);
                }
            } else if (Bounds::intersects(Bounds::loosened(node->boxes[i], NODE_TOLERANCE), region)) {
                stack.append(node->children[static_cast<size_t>(i)].get());
            }
        }
    }
    return result;
}

// ============================================================================
// Diagnostics
// ============================================================================

int SpatialIndex::height() const
{
    int h = 1;
    const Node* node = m_root.get();
    while (!node->leaf && !node->children.empty()) {
        node = node->children.front().get();
        ++h;
    }
    return h;
}

bool SpatialIndex::checkNode(const Node* node, int depth, int& leafDepth) const
{
    if (node != m_root.get() && (node->count() < 1 || node->count() > MAX_ENTRIES)) {
        qDebug() << "SpatialIndex: node with" << node->count() << "entries at depth" << depth;
        return false;
    }

    if (node->leaf) {
        if (node->keys.size() != node->boxes.size()) {
            return false;
        }
        if (leafDepth < 0) {
            leafDepth = depth;
        } else if (leafDepth != depth) {
            qDebug() << "SpatialIndex: leaves at depths" << leafDepth << "and" << depth;
            return false;
        }
        for (int i = 0; i < node->count(); ++i) {
            if (m_boxes.value(node->keys[i]) != node->boxes[i]) {
                return false;
            }
        }
        return true;
    }

    if (static_cast<int>(node->children.size()) != node->boxes.size()) {
        return false;
    }
    for (int i = 0; i < node->count(); ++i) {
        const Node* child = node->children[static_cast<size_t>(i)].get();
        if (child->parent != node) {
            qDebug() << "SpatialIndex: broken parent link at depth" << depth;
            return false;
        }
        const QRectF expected = nodeBox(child);
        if (!Bounds::contains(Bounds::loosened(node->boxes[i], NODE_TOLERANCE), expected)
            || !Bounds::contains(Bounds::loosened(expected, NODE_TOLERANCE), node->boxes[i])) {
            qDebug() << "SpatialIndex: stale node box at depth" << depth;
            return false;
        }
        if (!checkNode(child, depth + 1, leafDepth)) {
            return false;
        }
    }
    return true;
}

bool SpatialIndex::checkInvariants() const
{
    int leafDepth = -1;
    if (!checkNode(m_root.get(), 0, leafDepth)) {
        return false;
    }
    QVector<QPair<StrokeKey, QRectF>> entries;
    collectLeafEntries(m_root.get(), entries);
    return entries.size() == m_boxes.size();
}
