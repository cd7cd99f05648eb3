// SshSession.h
//
// Purpose:
//   libssh-backed RemoteSession:
//     - connect + authenticate (password, or private key with optional passphrase)
//     - host key check against the user's known_hosts
//     - SFTP primitives (stat / mkdir / streaming write)
//     - one-shot remote exec with stdout/stderr capture and optional timeout
//
// Design boundary:
//   One instance == one authenticated connection. No retries: a failed
//   connect or auth is reported once and the caller decides what to do.
//   Never log secrets (passwords, passphrases).

#pragma once

#include <QString>

#include <memory>

#include "AppSettings.h"
#include "RemoteSession.h"

// Forward-declare libssh types to avoid pulling libssh headers into the header.
struct ssh_session_struct;
using ssh_session = ssh_session_struct*;
struct sftp_session_struct;
using sftp_session = sftp_session_struct*;

class SshSession : public RemoteSession
{
public:
    ~SshSession() override;

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    // Opens and authenticates a session for request.
    // Returns nullptr on failure with err->kind = ConnectError / AuthenticationError.
    static std::unique_ptr<SshSession> connect(const TransferRequest& request,
                                               const TransferSettings& settings,
                                               TransferError* err);

    // SessionConnector bound to the given settings (what the orchestrator uses).
    static SessionConnector connector(const TransferSettings& settings);

    // Connect + disconnect, for the "Test connection" button.
    static bool testConnection(const TransferRequest& request,
                               const TransferSettings& settings,
                               TransferError* err);

    // Maps an ssh_userauth_* result code to the error kind reported for it.
    static TransferErrorKind classifyAuthResult(int rc);

    // Password login falls back to keyboard-interactive when the server
    // refused the password method but offers SSH_AUTH_METHOD_INTERACTIVE.
    static bool shouldTryKeyboardInteractive(int passwordRc, int serverMethods);

    // Only rounds with zero or one prompt can be answered with the password.
    static bool canAnswerWithPassword(int promptCount);

    bool isConnected() const override;
    void disconnect() override;

    bool statRemotePath(const QString& path, RemoteEntry* out, QString* err = nullptr) override;
    bool makeRemoteDir(const QString& path, int permsOctal, QString* err = nullptr) override;
    std::unique_ptr<RemoteFile> openRemoteFile(const QString& path, QString* err = nullptr) override;

    bool exec(const QString& command,
              RemoteCommandResult* out,
              QString* err = nullptr,
              int timeoutMs = 0) override;

private:
    explicit SshSession(ssh_session session);

    bool ensureSftp(QString* err);
    QString sftpErrorText() const;

    ssh_session  m_session = nullptr;
    sftp_session m_sftp    = nullptr;   // lazily initialized, freed in disconnect()
};
