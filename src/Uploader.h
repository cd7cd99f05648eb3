// Uploader.h
//
// Purpose:
//   Stream the archive to <remoteDir>/<archive-name> over a borrowed session.
//
// Behaviour:
//   - remoteDir (and any missing parents) is created over SFTP first
//   - bytes are written in 64 KiB chunks, progress reported after each one
//   - the cancel flag is checked between chunks; a running chunk write
//     cannot be interrupted
//   - a failed/cancelled upload leaves the partial remote file in place
//   - optional post-upload size check against the local archive

#pragma once

#include <QString>
#include <QtGlobal>

#include <atomic>
#include <functional>

#include "RemoteSession.h"
#include "TransferRequest.h"
#include "TransferStatus.h"

class Uploader
{
public:
    using ProgressCb = std::function<void(quint64 done, quint64 total)>;

    static constexpr qint64 kChunkSize = 64 * 1024;

    struct Options {
        bool verifySize = true;
        const std::atomic_bool* cancel = nullptr;   // optional
        ProgressCb progress;                         // optional
    };

    // On success remotePathOut (optional) receives the final remote file path.
    static bool upload(RemoteSession& session,
                       const ArchiveArtifact& artifact,
                       const QString& remoteDir,
                       const Options& options,
                       QString* remotePathOut,
                       TransferError* err);

    // Creates remoteDir and its parents one level at a time.
    static bool ensureRemoteDir(RemoteSession& session, const QString& remoteDir, TransferError* err);

    // Path as the SFTP server should see it: "~/x" -> "x" (login dir
    // relative), duplicate slashes removed, trailing slash dropped.
    static QString normalizeRemoteDir(const QString& remoteDir);

    static QString joinRemote(const QString& dir, const QString& name);
};
