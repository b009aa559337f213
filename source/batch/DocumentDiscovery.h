#ifndef DOCUMENTDISCOVERY_H
#define DOCUMENTDISCOVERY_H

/**
 * @file DocumentDiscovery.h
 * @brief Finding .inkc documents from command line inputs.
 */

#include <QString>
#include <QStringList>

namespace BatchOps {

/**
 * @brief Check if a path is an existing .inkc file.
 */
bool isDocumentFile(const QString& path);

/**
 * @brief Find .inkc documents in a directory.
 *
 * @param directory Directory to search
 * @param recursive Search subdirectories
 * @return List of document paths (absolute), sorted alphabetically
 */
QStringList discoverDocuments(const QString& directory, bool recursive = false);

/**
 * @brief Expand input paths to a document list.
 *
 * - .inkc files are included as-is
 * - Directories are searched for .inkc files
 * - Non-existent paths and other files are skipped with a warning
 *
 * Glob patterns are expanded by the shell before reaching this function.
 *
 * @return Valid document paths (absolute), deduplicated and sorted
 */
QStringList expandInputPaths(const QStringList& inputPaths, bool recursive = false);

} // namespace BatchOps

#endif // DOCUMENTDISCOVERY_H
