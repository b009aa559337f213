#include "DocumentDiscovery.h"

#include "../core/EngineSnapshot.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QSet>
#include <QDebug>

namespace BatchOps {

static QString documentSuffix()
{
    return QStringLiteral(".") + QLatin1String(EngineSnapshot::FILE_EXTENSION);
}

bool isDocumentFile(const QString& path)
{
    if (path.isEmpty()) {
        return false;
    }
    const QFileInfo info(path);
    return info.exists() && info.isFile()
           && info.fileName().endsWith(documentSuffix(), Qt::CaseInsensitive);
}

QStringList discoverDocuments(const QString& directory, bool recursive)
{
    QStringList results;

    QDir dir(directory);
    if (!dir.exists()) {
        qWarning() << "[DocumentDiscovery] Directory does not exist:" << directory;
        return results;
    }

    const QStringList filters{QStringLiteral("*") + documentSuffix()};
    QDirIterator it(dir.absolutePath(), filters, QDir::Files,
                    recursive ? QDirIterator::Subdirectories : QDirIterator::NoIteratorFlags);
    while (it.hasNext()) {
        results.append(it.next());
    }

    results.sort(Qt::CaseInsensitive);
    return results;
}

QStringList expandInputPaths(const QStringList& inputPaths, bool recursive)
{
    QSet<QString> seen;
    QStringList results;

    auto add = [&seen, &results](const QString& path) {
        if (!seen.contains(path)) {
            seen.insert(path);
            results.append(path);
        }
    };

    for (const QString& inputPath : inputPaths) {
        const QFileInfo info(inputPath);
        if (!info.exists()) {
            qWarning() << "[DocumentDiscovery] Path does not exist:" << inputPath;
            continue;
        }

        const QString absPath = info.absoluteFilePath();
        if (info.isDir()) {
            for (const QString& doc : discoverDocuments(absPath, recursive)) {
                add(doc);
            }
        } else if (isDocumentFile(absPath)) {
            add(absPath);
        } else {
            qWarning() << "[DocumentDiscovery] Not an .inkc document, skipping:" << inputPath;
        }
    }

    results.sort(Qt::CaseInsensitive);
    return results;
}

} // namespace BatchOps
