// TransferRequest.h
//
// Purpose:
//   Immutable description of one transfer attempt (who, where, what) and
//   the temporary archive produced for it.

#pragma once

#include <QString>
#include <QStringList>
#include <QtGlobal>

enum class AuthMethod {
    Password,
    PrivateKey
};

QString authMethodToString(AuthMethod m);
AuthMethod authMethodFromString(const QString& s);

struct Credential {
    AuthMethod method = AuthMethod::Password;

    QString password;     // Password only (never log)
    QString keyFile;      // PrivateKey only; "~/" is expanded locally
    QString passphrase;   // PrivateKey only, optional (never log)
};

struct TransferRequest {
    QString host;
    int     port = 22;
    QString username;
    Credential credential;

    QStringList sources;   // local files and/or folders
    QString remoteDir;

    bool extract = true;
    bool removeArchiveAfterExtract = true;
    bool verifyUpload = true;

    // Checks everything that can be checked locally before any work starts.
    bool validate(QString* err = nullptr) const;

    // Key file with a leading "~/" expanded against the local home directory.
    QString resolvedKeyFile() const;

    // "user@host:port" for logs (no secrets).
    QString target() const;
};

// The temporary tar.gz produced by the Archiver. Owned by the orchestrator run.
struct ArchiveArtifact {
    QString path;
    quint64 size = 0;

    bool isValid() const { return !path.isEmpty(); }
    QString fileName() const;
};
