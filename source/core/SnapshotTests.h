#pragma once

// ============================================================================
// SnapshotTests - Unit tests for .inkc save and load
// ============================================================================

#include "EngineSnapshot.h"
#include "../store/StrokeStore.h"
#include "../strokes/StrokeTests.h"

#include <QDebug>
#include <QFile>
#include <QTemporaryDir>

namespace SnapshotTests {

/// Bounds of the rendered strokes, in rendering order.
inline QVector<QRectF> renderedBounds(const StrokeStore& store)
{
    QVector<QRectF> result;
    for (const StrokeKey& key : store.strokeKeysAsRendered()) {
        result.append(store.getStrokeRef(key)->bounds());
    }
    return result;
}

inline bool sameRects(const QVector<QRectF>& a, const QVector<QRectF>& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (int i = 0; i < a.size(); ++i) {
        if (!StrokeTests::fuzzyRectEqual(a.at(i), b.at(i), 1e-3)) {
            return false;
        }
    }
    return true;
}

inline void fillStore(StrokeStore& store)
{
    for (const auto& stroke : StrokeTests::makeAllVariants()) {
        store.insertStroke(std::shared_ptr<Stroke>(stroke->clone()));
    }
    const QVector<StrokeKey> keys = store.strokeKeysAsRendered();
    store.setTrashed(keys.at(1), true);
    store.setSelected(keys.at(3), true);
    store.setSelected(keys.at(0), true);
}

inline EngineSnapshot makeSnapshot()
{
    EngineSnapshot snapshot;
    snapshot.document = Document::createNew(QStringLiteral("Round Trip"), Document::Layout::Infinite);
    snapshot.document.background.pattern = Background::Pattern::Dots;
    snapshot.storeConfig.eraserMinSplitSegments = 3;
    snapshot.renderConfig.viewportMarginFactor = 0.25;
    snapshot.exportPrefs.doc.format = DocExportFormat::Pdf;
    return snapshot;
}

/**
 * @brief Save then load keeps strokes, components, order and config.
 */
inline bool testBytesRoundTrip()
{
    qDebug() << "=== Test: Bytes Round Trip ===";
    bool success = true;

    StrokeStore store;
    fillStore(store);
    const EngineSnapshot snapshot = makeSnapshot();

    QByteArray bytes;
    const EngineSnapshot::SnapshotResult saved = EngineSnapshot::saveToBytes(snapshot, store, bytes);
    if (!saved.success || bytes.isEmpty()) {
        qDebug() << "FAIL: save failed:" << saved.errorMessage;
        return false;
    }

    StrokeStore loadedStore;
    loadedStore.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 2));
    EngineSnapshot loaded;
    const EngineSnapshot::SnapshotResult result = EngineSnapshot::loadFromBytes(bytes, loaded, loadedStore);
    if (!result.success) {
        qDebug() << "FAIL: load failed:" << result.errorMessage;
        return false;
    }

    if (loadedStore.strokeCount() != store.strokeCount()) {
        qDebug() << "FAIL: stroke count" << loadedStore.strokeCount() << "expected" << store.strokeCount();
        success = false;
    }
    if (loadedStore.trashedKeysUnordered().size() != 1 || loadedStore.selectionKeysUnordered().size() != 2) {
        qDebug() << "FAIL: trash or selection components were not restored";
        success = false;
    }
    if (!sameRects(renderedBounds(loadedStore), renderedBounds(store))) {
        qDebug() << "FAIL: rendering order or geometry changed";
        success = false;
    }
    if (loadedStore.spatialIndex().size() != loadedStore.strokeCount()) {
        qDebug() << "FAIL: spatial index should be rebuilt on load";
        success = false;
    }
    if (loadedStore.canUndo()) {
        qDebug() << "FAIL: loading should reset the history";
        success = false;
    }

    if (loaded.document.name != snapshot.document.name
        || loaded.document.layout != Document::Layout::Infinite
        || loaded.document.background.pattern != Background::Pattern::Dots) {
        qDebug() << "FAIL: document config was not restored";
        success = false;
    }
    if (loadedStore.config().eraserMinSplitSegments != 3
        || !qFuzzyCompare(loaded.renderConfig.viewportMarginFactor, 0.25)
        || loaded.exportPrefs.doc.format != DocExportFormat::Pdf) {
        qDebug() << "FAIL: store, render or export config was not restored";
        success = false;
    }

    qDebug() << "  - Bytes round trip:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Corrupt input fails and leaves the store as it was.
 */
inline bool testCorruptInput()
{
    qDebug() << "=== Test: Corrupt Input ===";
    bool success = true;

    StrokeStore store;
    const StrokeKey key = store.insertStroke(StrokeTests::makeLineBrush(QPointF(0, 0), 3));
    EngineSnapshot snapshot;

    const EngineSnapshot::SnapshotResult result =
        EngineSnapshot::loadFromBytes(QByteArray("PK\x03\x04 definitely not a zip"), snapshot, store);
    if (result.success || result.errorMessage.isEmpty()) {
        qDebug() << "FAIL: corrupt bytes should fail with a message";
        success = false;
    }
    if (store.strokeCount() != 1 || !store.containsStroke(key)) {
        qDebug() << "FAIL: a failed load must not touch the store";
        success = false;
    }

    EngineSnapshot parsed;
    if (EngineSnapshot::fromJson(QJsonObject{{"version", 1}}, parsed)) {
        qDebug() << "FAIL: document.json without a document section should be rejected";
        success = false;
    }

    qDebug() << "  - Corrupt input:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Save to and load from a file.
 */
inline bool testFileRoundTrip()
{
    qDebug() << "=== Test: File Round Trip ===";
    bool success = true;

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qDebug() << "FAIL: could not create a temporary directory";
        return false;
    }
    const QString path = dir.filePath(QStringLiteral("nested/notes.inkc"));

    StrokeStore store;
    fillStore(store);
    const EngineSnapshot snapshot = makeSnapshot();

    EngineSnapshot::SnapshotResult result = EngineSnapshot::saveToFile(path, snapshot, store);
    if (!result.success || !QFile::exists(path)) {
        qDebug() << "FAIL: saving to" << path << "failed:" << result.errorMessage;
        return false;
    }

    StrokeStore loadedStore;
    EngineSnapshot loaded;
    result = EngineSnapshot::loadFromFile(path, loaded, loadedStore);
    if (!result.success || loadedStore.strokeCount() != store.strokeCount()) {
        qDebug() << "FAIL: loading from file failed:" << result.errorMessage;
        success = false;
    }

    result = EngineSnapshot::loadFromFile(dir.filePath(QStringLiteral("missing.inkc")), loaded, loadedStore);
    if (result.success) {
        qDebug() << "FAIL: loading a missing file should fail";
        success = false;
    }

    qDebug() << "  - File round trip:" << (success ? "OK" : "FAILED");
    return success;
}

/**
 * @brief Run all snapshot tests.
 * @return True if all tests pass.
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Snapshot Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testBytesRoundTrip();
    qDebug() << "";

    allPass &= testCorruptInput();
    qDebug() << "";

    allPass &= testFileRoundTrip();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL SNAPSHOT TESTS PASSED!";
    } else {
        qDebug() << "SOME SNAPSHOT TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace SnapshotTests
