#pragma once

// ============================================================================
// EngineSnapshot - Persisted document (.inkc)
// ============================================================================
// A .inkc file is a ZIP archive with two entries:
// - document.json: format version, document config, store and render config,
//   export preferences
// - store.json: every stroke with its trash, selection and chrono components
//
// Render components and the spatial index are not persisted; they are
// rebuilt when the store is loaded. Stroke keys are reassigned on load.
// ============================================================================

#include "Document.h"
#include "EngineConfig.h"
#include "../export/ExportPrefs.h"

#include <QByteArray>
#include <QString>

class StrokeStore;

/**
 * @brief Everything of a document except the strokes.
 *
 * Usage:
 * @code
 * EngineSnapshot snapshot;
 * auto result = EngineSnapshot::loadFromFile("notes.inkc", snapshot, store);
 * if (!result.success) {
 *     qWarning() << result.errorMessage;
 * }
 * @endcode
 */
struct EngineSnapshot {
    /**
     * @brief Result of a save or load.
     */
    struct SnapshotResult {
        bool success = false;       ///< True if the operation completed
        QString errorMessage;       ///< Error description if success is false
    };

    Document document;
    StoreConfig storeConfig;
    RenderConfig renderConfig;
    ExportPrefs exportPrefs;

    /// The document.json object.
    QJsonObject toJson() const;

    /**
     * @brief Parse document.json.
     * @return false if the object has no document section.
     */
    static bool fromJson(const QJsonObject& obj, EngineSnapshot& out);

    /**
     * @brief Serialize the snapshot and the store into a ZIP archive.
     */
    static SnapshotResult saveToBytes(const EngineSnapshot& snapshot, const StrokeStore& store,
                                      QByteArray& out);

    /**
     * @brief Load a ZIP archive written by saveToBytes().
     *
     * The store is replaced on success and left untouched on failure. Its
     * history is cleared and its config is set from the snapshot.
     */
    static SnapshotResult loadFromBytes(const QByteArray& bytes, EngineSnapshot& snapshot,
                                        StrokeStore& store);

    static SnapshotResult saveToFile(const QString& path, const EngineSnapshot& snapshot,
                                     const StrokeStore& store);
    static SnapshotResult loadFromFile(const QString& path, EngineSnapshot& snapshot,
                                       StrokeStore& store);

    static constexpr const char* DOCUMENT_ENTRY = "document.json";
    static constexpr const char* STORE_ENTRY = "store.json";
    static constexpr const char* FILE_EXTENSION = "inkc";
    static constexpr int FORMAT_VERSION = 1;
};
