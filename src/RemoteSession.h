// RemoteSession.h
//
// Purpose:
//   The capabilities the transfer pipeline needs from an authenticated
//   remote connection:
//     - SFTP primitives (stat, mkdir, open-for-write)
//     - one-shot command execution
//
//   SshSession implements this on top of libssh. Tests plug in an
//   in-memory implementation so the whole pipeline runs without a server.
//
// Ownership:
//   Sessions are created and closed by the orchestrator only; Uploader and
//   RemoteCommand borrow them for the duration of a single call.

#pragma once

#include <QString>
#include <QtGlobal>

#include <functional>
#include <memory>

#include "TransferRequest.h"
#include "TransferStatus.h"

// Minimal metadata for a remote path.
struct RemoteEntry
{
    QString path;
    bool    isDir = false;
    quint64 size  = 0;
};

struct RemoteCommandResult
{
    int     exitCode = -1;
    QString stdoutText;
    QString stderrText;
    bool    timedOut = false;   // gave up waiting; the command may still be running
};

// A remote file opened for writing. Closing happens in the destructor
// unless close() was called explicitly (to observe close errors).
class RemoteFile
{
public:
    virtual ~RemoteFile() = default;

    // Returns bytes written, or -1 on error (see errorString()).
    virtual qint64 write(const char* data, qint64 len) = 0;

    virtual bool close(QString* err = nullptr) = 0;

    virtual QString errorString() const = 0;
};

class RemoteSession
{
public:
    virtual ~RemoteSession() = default;

    virtual bool isConnected() const = 0;

    // Safe to call multiple times.
    virtual void disconnect() = 0;

    // false + err when the path does not exist (or cannot be stat'ed).
    virtual bool statRemotePath(const QString& path, RemoteEntry* out, QString* err = nullptr) = 0;

    // Creates ONE directory level.
    virtual bool makeRemoteDir(const QString& path, int permsOctal, QString* err = nullptr) = 0;

    // Opens (create/truncate) a remote file for writing.
    virtual std::unique_ptr<RemoteFile> openRemoteFile(const QString& path, QString* err = nullptr) = 0;

    // Runs one command and waits for it. Returns false only when the channel
    // itself failed or timed out (out->timedOut set); a non-zero exit status
    // is reported in out. timeoutMs <= 0 waits for completion.
    virtual bool exec(const QString& command,
                      RemoteCommandResult* out,
                      QString* err = nullptr,
                      int timeoutMs = 0) = 0;
};

// Factory used by the orchestrator to open the session for one run.
// On failure returns nullptr and fills err (AuthenticationError / ConnectError).
using SessionConnector =
    std::function<std::unique_ptr<RemoteSession>(const TransferRequest& request, TransferError* err)>;
