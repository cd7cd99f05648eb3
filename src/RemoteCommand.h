// RemoteCommand.h
//
// Purpose:
//   Build and run the single remote command PackDrop issues: the in-place
//   extraction of the uploaded archive.
//
// Quoting:
//   Every path is single-quoted for POSIX sh ('it'"'"'s'). A leading "~/"
//   stays expandable by rewriting it to "$HOME"/'...'.

#pragma once

#include <QString>

#include "RemoteSession.h"
#include "TransferStatus.h"

class RemoteCommand
{
public:
    // One blocking round trip. A non-zero exit status (or a timeout) is a
    // RemoteCommandError whose message carries the exit code and stderr.
    // result (optional) is filled whenever the command actually ran.
    static bool run(RemoteSession& session,
                    const QString& command,
                    int timeoutMs,
                    RemoteCommandResult* result,
                    TransferError* err);

    // tar -xzf <archive> -C <dir> [&& rm -f <archive>]
    static QString buildExtractCommand(const QString& remoteDir,
                                       const QString& archiveName,
                                       bool removeArchive);

    // Single-quote s for sh.
    static QString shellQuote(const QString& s);

    // shellQuote(), except a leading "~/" (or a lone "~") stays expandable.
    static QString shellQuotePath(const QString& path);
};
