// RemoteCommand.cpp
#include "RemoteCommand.h"

#include <QDebug>

#include "Uploader.h"

QString RemoteCommand::shellQuote(const QString& s)
{
    QString out = s;
    out.replace("'", "'\"'\"'");
    return "'" + out + "'";
}

QString RemoteCommand::shellQuotePath(const QString& path)
{
    const QString p = path.trimmed();

    if (p == "~")
        return QStringLiteral("\"$HOME\"");
    if (p.startsWith("~/"))
        return "\"$HOME\"/" + shellQuote(p.mid(2));

    // Relative paths: keep them from being read as options by tar/rm.
    if (p.startsWith('-'))
        return shellQuote("./" + p);

    return shellQuote(p);
}

QString RemoteCommand::buildExtractCommand(const QString& remoteDir,
                                           const QString& archiveName,
                                           bool removeArchive)
{
    QString dir = remoteDir.trimmed();
    if (dir.isEmpty()) dir = QStringLiteral("~");

    // Same trailing-slash handling as the uploader, but keep "~/" so the shell
    // resolves it against $HOME.
    while (dir.size() > 1 && dir.endsWith('/'))
        dir.chop(1);

    const QString archivePath = Uploader::joinRemote(dir, archiveName);
    const QString qArchive = shellQuotePath(archivePath);
    const QString qDir = shellQuotePath(dir);

    QString cmd = QString("tar -xzf %1 -C %2").arg(qArchive, qDir);
    if (removeArchive)
        cmd += QString(" && rm -f %1").arg(qArchive);
    return cmd;
}

bool RemoteCommand::run(RemoteSession& session,
                        const QString& command,
                        int timeoutMs,
                        RemoteCommandResult* result,
                        TransferError* err)
{
    if (err) err->clear();
    if (result) *result = RemoteCommandResult{};

    qInfo().noquote() << QString("[REMOTE] exec: %1").arg(command);

    RemoteCommandResult r;
    QString e;
    if (!session.exec(command, &r, &e, timeoutMs)) {
        qWarning().noquote() << QString("[REMOTE] exec FAILED: %1").arg(e);
        if (r.timedOut) {
            if (result) *result = r;
            return failWith(err, TransferErrorKind::RemoteCommandError,
                            QString("Remote command did not finish within %1 s and may still be "
                                    "running on the server.").arg(timeoutMs / 1000.0, 0, 'f', 1));
        }
        return failWith(err, TransferErrorKind::RemoteCommandError,
                        e.isEmpty() ? QStringLiteral("Remote command could not be run.") : e);
    }

    if (result) *result = r;

    if (r.exitCode != 0) {
        const QString stderrText = r.stderrText.trimmed();
        qWarning().noquote() << QString("[REMOTE] exit=%1 stderr='%2'")
                                .arg(r.exitCode)
                                .arg(stderrText.left(400));
        return failWith(err, TransferErrorKind::RemoteCommandError,
                        stderrText.isEmpty()
                            ? QString("Remote command failed (exit %1).").arg(r.exitCode)
                            : QString("Remote command failed (exit %1): %2").arg(r.exitCode).arg(stderrText));
    }

    qInfo().noquote() << "[REMOTE] exit=0";
    return true;
}
