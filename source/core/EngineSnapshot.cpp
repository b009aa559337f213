#include "EngineSnapshot.h"
#include "../store/StrokeStore.h"

#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QObject>
#include <QDebug>

#include <cstring>

// miniz - cross-platform ZIP library (MIT license)
#include "miniz.h"

namespace {

EngineSnapshot::SnapshotResult failure(const QString& message)
{
    qWarning() << "EngineSnapshot:" << message;
    EngineSnapshot::SnapshotResult result;
    result.errorMessage = message;
    return result;
}

/// Extract one entry as JSON. Returns false if it is missing or not an object.
bool readJsonEntry(mz_zip_archive& zip, const char* name, QJsonObject& out, QString& errorMessage)
{
    size_t size = 0;
    void* data = mz_zip_reader_extract_file_to_heap(&zip, name, &size, 0);
    if (!data) {
        errorMessage = QObject::tr("Archive has no %1").arg(QString::fromLatin1(name));
        return false;
    }
    const QByteArray bytes(static_cast<const char*>(data), static_cast<int>(size));
    mz_free(data);

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        errorMessage = QObject::tr("Invalid %1: %2")
                           .arg(QString::fromLatin1(name), parseError.errorString());
        return false;
    }
    out = doc.object();
    return true;
}

} // namespace

// ============================================================================
// JSON
// ============================================================================

QJsonObject EngineSnapshot::toJson() const
{
    QJsonObject obj;
    obj["version"] = FORMAT_VERSION;
    obj["document"] = document.toJson();
    obj["store_config"] = storeConfig.toJson();
    obj["render_config"] = renderConfig.toJson();
    obj["export_prefs"] = exportPrefs.toJson();
    return obj;
}

bool EngineSnapshot::fromJson(const QJsonObject& obj, EngineSnapshot& out)
{
    if (!obj["document"].isObject()) {
        qWarning() << "EngineSnapshot::fromJson: missing document section";
        return false;
    }

    const int version = obj["version"].toInt(FORMAT_VERSION);
    if (version > FORMAT_VERSION) {
        qWarning() << "EngineSnapshot::fromJson: file version" << version
                   << "is newer than" << FORMAT_VERSION << ", loading what is known";
    }

    out.document = Document::fromJson(obj["document"].toObject());
    out.storeConfig = StoreConfig::fromJson(obj["store_config"].toObject());
    out.renderConfig = RenderConfig::fromJson(obj["render_config"].toObject());
    out.exportPrefs = ExportPrefs::fromJson(obj["export_prefs"].toObject());
    return true;
}

// ============================================================================
// Archive
// ============================================================================

EngineSnapshot::SnapshotResult EngineSnapshot::saveToBytes(const EngineSnapshot& snapshot,
                                                           const StrokeStore& store,
                                                           QByteArray& out)
{
    const QByteArray documentJson = QJsonDocument(snapshot.toJson()).toJson(QJsonDocument::Indented);
    const QByteArray storeJson = QJsonDocument(store.toJson()).toJson(QJsonDocument::Compact);

    mz_zip_archive zipArchive;
    memset(&zipArchive, 0, sizeof(zipArchive));
    if (!mz_zip_writer_init_heap(&zipArchive, 0, 0)) {
        return failure(QObject::tr("Failed to create ZIP archive"));
    }

    if (!mz_zip_writer_add_mem(&zipArchive, DOCUMENT_ENTRY, documentJson.constData(),
                               static_cast<size_t>(documentJson.size()), MZ_BEST_COMPRESSION)) {
        mz_zip_writer_end(&zipArchive);
        return failure(QObject::tr("Failed to add %1 to archive").arg(DOCUMENT_ENTRY));
    }
    if (!mz_zip_writer_add_mem(&zipArchive, STORE_ENTRY, storeJson.constData(),
                               static_cast<size_t>(storeJson.size()), MZ_BEST_COMPRESSION)) {
        mz_zip_writer_end(&zipArchive);
        return failure(QObject::tr("Failed to add %1 to archive").arg(STORE_ENTRY));
    }

    void* archiveData = nullptr;
    size_t archiveSize = 0;
    if (!mz_zip_writer_finalize_heap_archive(&zipArchive, &archiveData, &archiveSize)) {
        mz_zip_writer_end(&zipArchive);
        return failure(QObject::tr("Failed to finalize ZIP archive"));
    }
    out = QByteArray(static_cast<const char*>(archiveData), static_cast<int>(archiveSize));
    mz_free(archiveData);
    mz_zip_writer_end(&zipArchive);

#ifdef QT_DEBUG
    qDebug() << "EngineSnapshot: saved" << store.strokeCount() << "strokes in" << out.size() << "bytes";
#endif

    SnapshotResult result;
    result.success = true;
    return result;
}

EngineSnapshot::SnapshotResult EngineSnapshot::loadFromBytes(const QByteArray& bytes,
                                                             EngineSnapshot& snapshot,
                                                             StrokeStore& store)
{
    mz_zip_archive zipArchive;
    memset(&zipArchive, 0, sizeof(zipArchive));
    if (!mz_zip_reader_init_mem(&zipArchive, bytes.constData(), static_cast<size_t>(bytes.size()), 0)) {
        return failure(QObject::tr("Not a valid document archive"));
    }

    QString errorMessage;
    QJsonObject documentObj;
    QJsonObject storeObj;
    const bool read = readJsonEntry(zipArchive, DOCUMENT_ENTRY, documentObj, errorMessage)
        && readJsonEntry(zipArchive, STORE_ENTRY, storeObj, errorMessage);
    mz_zip_reader_end(&zipArchive);
    if (!read) {
        return failure(errorMessage);
    }

    EngineSnapshot loaded;
    if (!fromJson(documentObj, loaded)) {
        return failure(QObject::tr("Invalid %1").arg(DOCUMENT_ENTRY));
    }

    // The store is only replaced once the whole stroke array is parsed
    if (!store.loadFromJson(storeObj, &errorMessage)) {
        return failure(errorMessage);
    }
    store.setConfig(loaded.storeConfig);
    snapshot = loaded;

    SnapshotResult result;
    result.success = true;
    return result;
}

EngineSnapshot::SnapshotResult EngineSnapshot::saveToFile(const QString& path,
                                                          const EngineSnapshot& snapshot,
                                                          const StrokeStore& store)
{
    if (path.isEmpty()) {
        return failure(QObject::tr("No destination path specified"));
    }

    QByteArray bytes;
    SnapshotResult result = saveToBytes(snapshot, store, bytes);
    if (!result.success) {
        return result;
    }

    QDir destDir = QFileInfo(path).absoluteDir();
    if (!destDir.exists() && !destDir.mkpath(".")) {
        return failure(QObject::tr("Failed to create destination directory: %1")
                           .arg(destDir.absolutePath()));
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return failure(QObject::tr("Failed to open %1 for writing: %2").arg(path, file.errorString()));
    }
    if (file.write(bytes) != bytes.size()) {
        file.close();
        QFile::remove(path);
        return failure(QObject::tr("Failed to write %1").arg(path));
    }
    file.close();
    return result;
}

EngineSnapshot::SnapshotResult EngineSnapshot::loadFromFile(const QString& path,
                                                            EngineSnapshot& snapshot,
                                                            StrokeStore& store)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return failure(QObject::tr("Failed to open %1: %2").arg(path, file.errorString()));
    }
    const QByteArray bytes = file.readAll();
    file.close();
    return loadFromBytes(bytes, snapshot, store);
}
