// Uploader.cpp
#include "Uploader.h"

#include <QDebug>
#include <QFile>
#include <QStringList>

QString Uploader::normalizeRemoteDir(const QString& remoteDir)
{
    QString p = remoteDir.trimmed();

    if (p == "~")
        return QStringLiteral(".");
    if (p.startsWith("~/"))
        p = p.mid(2);

    const bool absolute = p.startsWith('/');
    const QStringList parts = p.split('/', Qt::SkipEmptyParts);

    QString joined = parts.join('/');
    if (absolute)
        return "/" + joined;
    return joined.isEmpty() ? QStringLiteral(".") : joined;
}

QString Uploader::joinRemote(const QString& dir, const QString& name)
{
    if (dir.isEmpty() || dir == ".")
        return name;
    return dir.endsWith('/') ? (dir + name) : (dir + "/" + name);
}

bool Uploader::ensureRemoteDir(RemoteSession& session, const QString& remoteDir, TransferError* err)
{
    if (err) err->clear();

    const QString dir = normalizeRemoteDir(remoteDir);
    if (dir == "." || dir == "/")
        return true;

    QString e;
    RemoteEntry st;
    if (session.statRemotePath(dir, &st, &e)) {
        if (st.isDir) return true;
        return failWith(err, TransferErrorKind::TransferError,
                        QString("Remote path exists but is not a directory: %1").arg(dir));
    }

    // Walk from the root/login dir down, creating each missing level.
    const bool absolute = dir.startsWith('/');
    const QStringList parts = dir.split('/', Qt::SkipEmptyParts);

    QString current = absolute ? QStringLiteral("/") : QString();
    for (const QString& part : parts) {
        current = current.isEmpty() ? part : joinRemote(current, part);

        if (session.statRemotePath(current, &st, &e)) {
            if (!st.isDir) {
                return failWith(err, TransferErrorKind::TransferError,
                                QString("Remote path exists but is not a directory: %1").arg(current));
            }
            continue;
        }

        if (!session.makeRemoteDir(current, 0755, &e)) {
            // Lost a race with another writer? Accept an existing directory.
            if (session.statRemotePath(current, &st, nullptr) && st.isDir)
                continue;

            qWarning().noquote() << QString("[UPLOAD] mkdir FAIL '%1': %2").arg(current, e);
            return failWith(err, TransferErrorKind::TransferError,
                            QString("Failed to create remote directory '%1': %2").arg(current, e));
        }

        qInfo().noquote() << QString("[UPLOAD] created remote dir '%1'").arg(current);
    }

    return true;
}

bool Uploader::upload(RemoteSession& session,
                      const ArchiveArtifact& artifact,
                      const QString& remoteDir,
                      const Options& options,
                      QString* remotePathOut,
                      TransferError* err)
{
    if (err) err->clear();
    if (remotePathOut) remotePathOut->clear();

    auto canceled = [&]() -> bool {
        return options.cancel && options.cancel->load();
    };

    if (!artifact.isValid())
        return failWith(err, TransferErrorKind::TransferError, "No archive to upload.");

    QFile in(artifact.path);
    if (!in.open(QIODevice::ReadOnly)) {
        return failWith(err, TransferErrorKind::TransferError,
                        QString("Cannot open archive '%1': %2").arg(artifact.path, in.errorString()));
    }
    const quint64 total = (quint64)in.size();

    if (!ensureRemoteDir(session, remoteDir, err))
        return false;

    const QString remotePath = joinRemote(normalizeRemoteDir(remoteDir), artifact.fileName());

    qInfo().noquote() << QString("[UPLOAD] start %1 -> %2 (%3)")
                         .arg(artifact.path, remotePath, prettySize(total));

    QString e;
    std::unique_ptr<RemoteFile> out = session.openRemoteFile(remotePath, &e);
    if (!out)
        return failWith(err, TransferErrorKind::TransferError, e);

    if (options.progress) options.progress(0, total);

    QByteArray buf(kChunkSize, Qt::Uninitialized);
    quint64 sent = 0;

    while (!in.atEnd()) {
        if (canceled()) {
            qWarning().noquote() << QString("[UPLOAD] cancelled after %1 of %2; partial file left at %3")
                                    .arg(prettySize(sent), prettySize(total), remotePath);
            return failWith(err, TransferErrorKind::Canceled,
                            QString("Upload cancelled after %1 of %2. The partial file '%3' "
                                    "was left on the server.")
                                .arg(prettySize(sent), prettySize(total), remotePath));
        }

        const qint64 n = in.read(buf.data(), buf.size());
        if (n < 0) {
            return failWith(err, TransferErrorKind::TransferError,
                            QString("Local read failed: %1").arg(in.errorString()));
        }
        if (n == 0) break;

        const qint64 w = out->write(buf.constData(), n);
        if (w != n) {
            qWarning().noquote() << QString("[UPLOAD] FAIL %1 : %2").arg(remotePath, out->errorString());
            return failWith(err, TransferErrorKind::TransferError,
                            QString("Upload to '%1' failed after %2: %3")
                                .arg(remotePath, prettySize(sent), out->errorString()));
        }

        sent += (quint64)w;
        if (options.progress) options.progress(sent, total);
    }

    if (!out->close(&e)) {
        return failWith(err, TransferErrorKind::TransferError,
                        QString("Upload to '%1' did not complete: %2").arg(remotePath, e));
    }

    if (options.verifySize) {
        RemoteEntry st;
        if (!session.statRemotePath(remotePath, &st, &e)) {
            return failWith(err, TransferErrorKind::TransferError,
                            QString("Cannot verify uploaded file: %1").arg(e));
        }
        if (st.size != total) {
            return failWith(err, TransferErrorKind::TransferError,
                            QString("Size mismatch after upload: local %1 bytes, remote %2 bytes.")
                                .arg(total).arg(st.size));
        }
    }

    qInfo().noquote() << QString("[UPLOAD] OK %1 (%2)").arg(remotePath, prettySize(sent));

    if (remotePathOut) *remotePathOut = remotePath;
    return true;
}
