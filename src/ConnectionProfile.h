#pragma once

#include <QString>

#include "TransferRequest.h"

/*
    ConnectionProfile
    -----------------
    A named, saved set of connection fields that pre-fills a transfer.

    Notes:
    - password is held in clear text in memory only; ProfileStore encrypts
      it on disk (ProfileCipher).
    - remotePath / extract / removeArchiveAfterExtract are defaults for the window, not for the core.
*/
struct ConnectionProfile
{
    QString name;

    QString host;
    int     port = 22;
    QString username;

    AuthMethod authMethod = AuthMethod::Password;
    QString password;   // Password auth only
    QString keyFile;    // PrivateKey auth only

    QString remotePath;
    bool    extract = true;
    bool    removeArchiveAfterExtract = true;

    // Copies the connection fields (and defaults) into a request.
    // Sources are left untouched.
    void applyTo(TransferRequest* req) const
    {
        if (!req) return;
        req->host = host;
        req->port = port;
        req->username = username;
        req->credential.method = authMethod;
        req->credential.password = password;
        req->credential.keyFile = keyFile;
        req->remoteDir = remotePath;
        req->extract = extract;
        req->removeArchiveAfterExtract = removeArchiveAfterExtract;
    }
};

/*
    ProfileResolver
    ---------------
    What the transfer side needs from a profile collection: turn a name
    into request fields. ProfileStore is the only implementation shipped.
*/
class ProfileResolver
{
public:
    virtual ~ProfileResolver() = default;

    // false + err when the profile does not exist.
    virtual bool resolveProfile(const QString& name, TransferRequest* out, QString* err = nullptr) const = 0;
};
