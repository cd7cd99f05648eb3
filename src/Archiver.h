// Archiver.h
//
// Purpose:
//   Bundle a selection of local files/folders into ONE temporary tar.gz.
//
// Layout inside the archive:
//   Every selected path is stored under its base name; folders keep their
//   relative structure (including empty sub-folders). Symlinks are stored as
//   links, never followed.
//
// Ownership:
//   The archive file belongs to the caller (TransferOrchestrator), which is
//   the only code allowed to delete it. On failure nothing is left on disk.

#pragma once

#include <QString>
#include <QStringList>

#include "TransferRequest.h"
#include "TransferStatus.h"

class Archiver
{
public:
    // Creates the archive in tempDir (QDir::tempPath() when empty).
    // Fails with InputError when a path is missing/unreadable, when two
    // selections share a base name, or when the archive cannot be written.
    static bool createArchive(const QStringList& paths,
                              ArchiveArtifact* out,
                              TransferError* err,
                              const QString& tempDir = QString());

    // packdrop_<yyyyMMdd_HHmmss>_<8 hex>.tar.gz
    static QString makeArchiveName();

    // Name an input path gets at the archive root, taken from the absolute
    // path so "." and ".." get their folder's name ("" for "/" or empty).
    static QString entryNameFor(const QString& path);
};
