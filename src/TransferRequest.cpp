// TransferRequest.cpp
#include "TransferRequest.h"

#include <QDir>
#include <QFileInfo>

QString authMethodToString(AuthMethod m)
{
    return (m == AuthMethod::PrivateKey) ? QStringLiteral("key") : QStringLiteral("password");
}

AuthMethod authMethodFromString(const QString& s)
{
    const QString v = s.trimmed().toLower();
    if (v == "key" || v == "private_key" || v == "publickey")
        return AuthMethod::PrivateKey;
    return AuthMethod::Password;
}

QString TransferRequest::resolvedKeyFile() const
{
    const QString k = credential.keyFile.trimmed();
    if (k == "~")
        return QDir::homePath();
    if (k.startsWith("~/"))
        return QDir::homePath() + k.mid(1);
    return k;
}

QString TransferRequest::target() const
{
    return QString("%1@%2:%3").arg(username.trimmed(), host.trimmed()).arg(port);
}

bool TransferRequest::validate(QString* err) const
{
    if (err) err->clear();

    auto bad = [&](const QString& msg) -> bool {
        if (err) *err = msg;
        return false;
    };

    if (host.trimmed().isEmpty())
        return bad("Please enter a host/IP address.");
    if (port < 1 || port > 65535)
        return bad(QString("Invalid port %1 (expected 1-65535).").arg(port));
    if (username.trimmed().isEmpty())
        return bad("Please enter a username.");

    if (credential.method == AuthMethod::Password) {
        if (credential.password.isEmpty())
            return bad("Please enter a password.");
    } else {
        const QString key = resolvedKeyFile();
        if (key.isEmpty())
            return bad("Please select a private key file.");
        if (!QFileInfo::exists(key))
            return bad(QString("Private key file does not exist: %1").arg(key));
    }

    if (sources.isEmpty())
        return bad("Please select at least one file or folder to transfer.");
    if (remoteDir.trimmed().isEmpty())
        return bad("Please enter a remote destination path.");

    return true;
}

QString ArchiveArtifact::fileName() const
{
    return QFileInfo(path).fileName();
}
