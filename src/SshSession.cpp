// SshSession.cpp
//
// Purpose:
//   libssh plumbing for PackDrop transfers.
//   - Creates and owns one libssh session (+ one lazily opened SFTP session)
//   - Authenticates with password or private key
//   - Provides the SFTP / exec primitives used by Uploader and RemoteCommand
//
// Error mapping:
//   ssh_connect / host key problems      -> ConnectError
//   credentials rejected / key unusable  -> AuthenticationError
//
// Notes:
//   - Never log secrets (passwords, passphrases).
//   - Secret bytes handed to libssh are wiped with sodium_memzero() afterwards.

#include "SshSession.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFile>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <sodium.h>

#include <fcntl.h>
#include <sys/stat.h>

// ------------------------------------------------------------
// Small helpers
// ------------------------------------------------------------
static QString libsshError(ssh_session s)
{
    if (!s) return QStringLiteral("libssh: null session");
    return QString::fromLocal8Bit(ssh_get_error(s));
}

static void wipe(QByteArray& secret)
{
    if (!secret.isEmpty())
        sodium_memzero(secret.data(), (size_t)secret.size());
}

// Logs the server key fingerprint (SHA256:...) if it can be computed.
static QString serverFingerprint(ssh_session s)
{
    ssh_key key = nullptr;
    if (ssh_get_server_publickey(s, &key) != SSH_OK || !key)
        return QString();

    unsigned char* hash = nullptr;
    size_t hlen = 0;
    QString out;

    if (ssh_get_publickey_hash(key, SSH_PUBLICKEY_HASH_SHA256, &hash, &hlen) == SSH_OK) {
        char* fp = ssh_get_fingerprint_hash(SSH_PUBLICKEY_HASH_SHA256, hash, hlen);
        if (fp) {
            out = QString::fromLatin1(fp);
            ssh_string_free_char(fp);
        }
        ssh_clean_pubkey_hash(&hash);
    }

    ssh_key_free(key);
    return out;
}

// ------------------------------------------------------------
// Host key policy
//   OK                 -> accept
//   CHANGED / OTHER    -> refuse (possible MITM)
//   UNKNOWN / NOT_FOUND-> strict ? refuse : record in known_hosts
// ------------------------------------------------------------
static bool verifyHostKey(ssh_session s, bool strict, const QString& host, TransferError* err)
{
    const QString fp = serverFingerprint(s);
    const enum ssh_known_hosts_e state = ssh_session_is_known_server(s);

    switch (state) {
        case SSH_KNOWN_HOSTS_OK:
            qInfo().noquote() << QString("[SSH] host key OK host='%1' %2").arg(host, fp);
            return true;

        case SSH_KNOWN_HOSTS_CHANGED:
        case SSH_KNOWN_HOSTS_OTHER:
            qWarning().noquote() << QString("[SSH] host key MISMATCH host='%1' %2").arg(host, fp);
            return failWith(err, TransferErrorKind::ConnectError,
                            QString("Host key for '%1' does not match known_hosts (%2). "
                                    "Refusing to connect.").arg(host, fp));

        case SSH_KNOWN_HOSTS_UNKNOWN:
        case SSH_KNOWN_HOSTS_NOT_FOUND:
            if (strict) {
                return failWith(err, TransferErrorKind::ConnectError,
                                QString("Host '%1' is not in known_hosts (%2) and strict "
                                        "host key checking is enabled.").arg(host, fp));
            }
            if (ssh_session_update_known_hosts(s) != SSH_OK) {
                qWarning().noquote() << QString("[SSH] could not record host key: %1")
                                        .arg(libsshError(s));
            } else {
                qInfo().noquote() << QString("[SSH] recorded new host key host='%1' %2").arg(host, fp);
            }
            return true;

        case SSH_KNOWN_HOSTS_ERROR:
            break;
    }

    return failWith(err, TransferErrorKind::ConnectError,
                    QString("Host key check failed: %1").arg(libsshError(s)));
}

// ------------------------------------------------------------
// SftpRemoteFile: RemoteFile over an sftp_file handle
// ------------------------------------------------------------
namespace {

class SftpRemoteFile : public RemoteFile
{
public:
    SftpRemoteFile(sftp_file f, ssh_session s) : m_file(f), m_session(s) {}

    ~SftpRemoteFile() override
    {
        if (m_file) sftp_close(m_file);
    }

    qint64 write(const char* data, qint64 len) override
    {
        if (!m_file) {
            m_error = QStringLiteral("File is closed.");
            return -1;
        }

        qint64 total = 0;
        while (total < len) {
            const ssize_t w = sftp_write(m_file, data + total, (size_t)(len - total));
            if (w < 0) {
                m_error = QString("SFTP write failed: %1").arg(libsshError(m_session));
                return -1;
            }
            total += (qint64)w;
        }
        return total;
    }

    bool close(QString* err) override
    {
        if (err) err->clear();
        if (!m_file) return true;

        const int rc = sftp_close(m_file);
        m_file = nullptr;
        if (rc != SSH_NO_ERROR) {
            m_error = QString("SFTP close failed: %1").arg(libsshError(m_session));
            if (err) *err = m_error;
            return false;
        }
        return true;
    }

    QString errorString() const override { return m_error; }

private:
    sftp_file   m_file = nullptr;
    ssh_session m_session = nullptr;
    QString     m_error;
};

} // namespace

// ------------------------------------------------------------
// Lifetime
// ------------------------------------------------------------
SshSession::SshSession(ssh_session session) : m_session(session) {}

SshSession::~SshSession()
{
    disconnect();
}

void SshSession::disconnect()
{
    if (m_sftp) {
        sftp_free(m_sftp);
        m_sftp = nullptr;
    }
    if (m_session) {
        qInfo().noquote() << "[SSH] disconnect";
        ssh_disconnect(m_session);
        ssh_free(m_session);
        m_session = nullptr;
    }
}

bool SshSession::isConnected() const
{
    return m_session != nullptr;
}

TransferErrorKind SshSession::classifyAuthResult(int rc)
{
    switch (rc) {
        case SSH_AUTH_SUCCESS:
            return TransferErrorKind::None;
        case SSH_AUTH_DENIED:
        case SSH_AUTH_PARTIAL:
            return TransferErrorKind::AuthenticationError;
        default:
            // SSH_AUTH_ERROR (transport broke during auth), SSH_AUTH_AGAIN
            return TransferErrorKind::ConnectError;
    }
}

bool SshSession::shouldTryKeyboardInteractive(int passwordRc, int serverMethods)
{
    return passwordRc == SSH_AUTH_DENIED
        && (serverMethods & SSH_AUTH_METHOD_INTERACTIVE) != 0;
}

bool SshSession::canAnswerWithPassword(int promptCount)
{
    return promptCount >= 0 && promptCount <= 1;
}

namespace {

// Keyboard-interactive exchange where the single prompt is the password.
int authKbdintWithPassword(ssh_session s, const QByteArray& pass)
{
    int rc = ssh_userauth_kbdint(s, nullptr, nullptr);
    for (int round = 0; rc == SSH_AUTH_INFO && round < 8; ++round) {
        const int n = ssh_userauth_kbdint_getnprompts(s);
        if (!SshSession::canAnswerWithPassword(n)) {
            qWarning().noquote() << QString("[SSH] keyboard-interactive asks %1 questions, giving up").arg(n);
            return SSH_AUTH_DENIED;
        }
        if (n == 1 && ssh_userauth_kbdint_setanswer(s, 0, pass.constData()) < 0)
            return SSH_AUTH_ERROR;
        rc = ssh_userauth_kbdint(s, nullptr, nullptr);
    }
    return (rc == SSH_AUTH_INFO) ? SSH_AUTH_DENIED : rc;
}

} // namespace

// ------------------------------------------------------------
// connect(): ssh_new -> options -> ssh_connect -> host key -> auth
// ------------------------------------------------------------
std::unique_ptr<SshSession> SshSession::connect(const TransferRequest& request,
                                                const TransferSettings& settings,
                                                TransferError* err)
{
    if (err) err->clear();

    const QString host = request.host.trimmed();
    const QString user = request.username.trimmed();
    const int port = (request.port > 0) ? request.port : 22;
    const bool useKey = (request.credential.method == AuthMethod::PrivateKey);

    if (host.isEmpty() || user.isEmpty()) {
        failWith(err, TransferErrorKind::InputError, "Host and username are required.");
        return nullptr;
    }

    qInfo().noquote() << QString("[SSH] connect start user='%1' host='%2' port=%3 auth=%4")
                         .arg(user, host)
                         .arg(port)
                         .arg(authMethodToString(request.credential.method));

    ssh_session s = ssh_new();
    if (!s) {
        failWith(err, TransferErrorKind::ConnectError, "ssh_new() failed.");
        return nullptr;
    }

    auto failAndFree = [&](TransferErrorKind kind, const QString& msg) -> std::unique_ptr<SshSession> {
        failWith(err, kind, msg);
        qWarning().noquote() << QString("[SSH] connect FAILED user='%1' host='%2': %3")
                                .arg(user, host, msg);
        if (ssh_is_connected(s))
            ssh_disconnect(s);
        ssh_free(s);
        return nullptr;
    };

    const QByteArray hostUtf8 = host.toUtf8();
    const QByteArray userUtf8 = user.toUtf8();
    long timeoutSec = settings.connectTimeoutSec > 0 ? settings.connectTimeoutSec : 10;

    if (ssh_options_set(s, SSH_OPTIONS_HOST, hostUtf8.constData()) != SSH_OK ||
        ssh_options_set(s, SSH_OPTIONS_USER, userUtf8.constData()) != SSH_OK ||
        ssh_options_set(s, SSH_OPTIONS_PORT, &port) != SSH_OK ||
        ssh_options_set(s, SSH_OPTIONS_TIMEOUT, &timeoutSec) != SSH_OK) {
        return failAndFree(TransferErrorKind::ConnectError,
                           QString("ssh_options_set failed: %1").arg(libsshError(s)));
    }

    // Network connect (single attempt, no retry)
    if (ssh_connect(s) != SSH_OK) {
        return failAndFree(TransferErrorKind::ConnectError,
                           QString("Cannot connect to %1:%2: %3").arg(host).arg(port).arg(libsshError(s)));
    }

    const char* kex = ssh_get_kex_algo(s);
    const char* cipherOut = ssh_get_cipher_out(s);
    qInfo().noquote() << QString("[SSH] ssh_connect OK host='%1' port=%2 kex='%3' cipher='%4'")
                         .arg(host)
                         .arg(port)
                         .arg(kex ? kex : "?", cipherOut ? cipherOut : "?");

    TransferError hostErr;
    if (!verifyHostKey(s, settings.strictHostKeyChecking, host, &hostErr))
        return failAndFree(hostErr.kind, hostErr.message);

    // Authentication
    int rc = SSH_AUTH_ERROR;

    if (useKey) {
        const QString keyPath = request.resolvedKeyFile();
        const QByteArray keyPath8 = QFile::encodeName(keyPath);
        QByteArray pass = request.credential.passphrase.toUtf8();

        ssh_key key = nullptr;
        const int irc = ssh_pki_import_privkey_file(keyPath8.constData(),
                                                    pass.isEmpty() ? nullptr : pass.constData(),
                                                    nullptr, nullptr, &key);
        wipe(pass);

        if (irc != SSH_OK || !key) {
            const QString why = (irc == SSH_EOF)
                ? QStringLiteral("file missing or unreadable")
                : QStringLiteral("wrong passphrase or unsupported key format");
            return failAndFree(TransferErrorKind::AuthenticationError,
                               QString("Cannot load private key '%1': %2").arg(keyPath, why));
        }

        rc = ssh_userauth_publickey(s, nullptr, key);
        ssh_key_free(key);
    } else {
        QByteArray pass = request.credential.password.toUtf8();
        rc = ssh_userauth_password(s, nullptr, pass.constData());
        if (shouldTryKeyboardInteractive(rc, ssh_userauth_list(s, nullptr))) {
            qInfo().noquote() << "[SSH] password method refused, trying keyboard-interactive";
            rc = authKbdintWithPassword(s, pass);
        }
        wipe(pass);
    }

    const TransferErrorKind authKind = classifyAuthResult(rc);
    if (authKind != TransferErrorKind::None) {
        const QString msg = (authKind == TransferErrorKind::AuthenticationError)
            ? QString("%1 authentication rejected for user '%2'.")
                  .arg(useKey ? "Public-key" : "Password", user)
            : QString("Authentication failed: %1").arg(libsshError(s));
        return failAndFree(authKind, msg);
    }

    qInfo().noquote() << QString("[SSH] connect OK user='%1' host='%2' port=%3")
                         .arg(user, host)
                         .arg(port);

    return std::unique_ptr<SshSession>(new SshSession(s));
}

SessionConnector SshSession::connector(const TransferSettings& settings)
{
    return [settings](const TransferRequest& request, TransferError* err) -> std::unique_ptr<RemoteSession> {
        return SshSession::connect(request, settings, err);
    };
}

bool SshSession::testConnection(const TransferRequest& request,
                                const TransferSettings& settings,
                                TransferError* err)
{
    std::unique_ptr<SshSession> s = connect(request, settings, err);
    if (!s) return false;
    s->disconnect();
    return true;
}

// ------------------------------------------------------------
// SFTP
// ------------------------------------------------------------
bool SshSession::ensureSftp(QString* err)
{
    if (m_sftp) return true;

    if (!m_session) {
        if (err) *err = QStringLiteral("Not connected.");
        return false;
    }

    sftp_session sftp = sftp_new(m_session);
    if (!sftp) {
        if (err) *err = QString("sftp_new failed: %1").arg(libsshError(m_session));
        return false;
    }

    if (sftp_init(sftp) != SSH_OK) {
        if (err) *err = QString("sftp_init failed: %1").arg(libsshError(m_session));
        sftp_free(sftp);
        return false;
    }

    m_sftp = sftp;
    return true;
}

QString SshSession::sftpErrorText() const
{
    const int code = m_sftp ? sftp_get_error(m_sftp) : SSH_FX_OK;
    QString what;
    switch (code) {
        case SSH_FX_NO_SUCH_FILE:
        case SSH_FX_NO_SUCH_PATH:        what = "no such file or directory"; break;
        case SSH_FX_PERMISSION_DENIED:   what = "permission denied"; break;
        case SSH_FX_FILE_ALREADY_EXISTS: what = "already exists"; break;
        case SSH_FX_WRITE_PROTECT:       what = "write protected"; break;
        case SSH_FX_NO_MEDIA:            what = "no media"; break;
        case SSH_FX_NO_CONNECTION:
        case SSH_FX_CONNECTION_LOST:     what = "connection lost"; break;
        case SSH_FX_FAILURE:             what = "failure (disk full or quota?)"; break;
        default:                         break;
    }

    const QString base = libsshError(m_session);
    return what.isEmpty() ? base : QString("%1 (%2)").arg(what, base);
}

bool SshSession::statRemotePath(const QString& path, RemoteEntry* out, QString* err)
{
    if (err) err->clear();
    if (out) *out = RemoteEntry{};
    if (!ensureSftp(err)) return false;

    sftp_attributes a = sftp_stat(m_sftp, path.toUtf8().constData());
    if (!a) {
        if (err) *err = QString("sftp_stat '%1': %2").arg(path, sftpErrorText());
        return false;
    }

    if (out) {
        out->path  = path;
        out->size  = (quint64)a->size;
        out->isDir = (a->type == SSH_FILEXFER_TYPE_DIRECTORY) ||
                     ((a->permissions & S_IFMT) == S_IFDIR);
    }

    sftp_attributes_free(a);
    return true;
}

bool SshSession::makeRemoteDir(const QString& path, int permsOctal, QString* err)
{
    if (err) err->clear();
    if (!ensureSftp(err)) return false;

    if (sftp_mkdir(m_sftp, path.toUtf8().constData(), (mode_t)permsOctal) != 0) {
        if (err) *err = QString("sftp_mkdir '%1': %2").arg(path, sftpErrorText());
        return false;
    }
    return true;
}

std::unique_ptr<RemoteFile> SshSession::openRemoteFile(const QString& path, QString* err)
{
    if (err) err->clear();
    if (!ensureSftp(err)) return nullptr;

    sftp_file f = sftp_open(m_sftp,
                            path.toUtf8().constData(),
                            O_WRONLY | O_CREAT | O_TRUNC,
                            S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (!f) {
        if (err) *err = QString("Cannot open remote file '%1': %2").arg(path, sftpErrorText());
        return nullptr;
    }

    return std::unique_ptr<RemoteFile>(new SftpRemoteFile(f, m_session));
}

// ------------------------------------------------------------
// exec(): run one command, capture stdout/stderr, read exit status.
// timeoutMs <= 0 means "no timeout".
// ------------------------------------------------------------
bool SshSession::exec(const QString& command, RemoteCommandResult* out, QString* err, int timeoutMs)
{
    if (out) *out = RemoteCommandResult{};
    if (err) err->clear();

    if (!m_session) {
        if (err) *err = QStringLiteral("Not connected.");
        return false;
    }

    ssh_channel ch = ssh_channel_new(m_session);
    if (!ch) {
        if (err) *err = QStringLiteral("ssh_channel_new failed.");
        return false;
    }

    auto cleanup = [&]() {
        if (ssh_channel_is_open(ch)) {
            ssh_channel_send_eof(ch);
            ssh_channel_close(ch);
        }
        ssh_channel_free(ch);
        ch = nullptr;
    };

    auto fail = [&](const QString& msg) -> bool {
        if (err) *err = msg;
        cleanup();
        return false;
    };

    if (ssh_channel_open_session(ch) != SSH_OK)
        return fail("ssh_channel_open_session failed: " + libsshError(m_session));

    if (ssh_channel_request_exec(ch, command.toUtf8().constData()) != SSH_OK)
        return fail("ssh_channel_request_exec failed: " + libsshError(m_session));

    QByteArray outBuf, errBuf;
    char buf[4096];

    // Non-blocking drain of whatever is buffered on one stream.
    auto drain = [&](int isStderr, QByteArray* into) -> bool {
        while (true) {
            const int n = ssh_channel_read_nonblocking(ch, buf, sizeof(buf), isStderr);
            if (n == SSH_ERROR) return false;
            if (n <= 0) return true;
            into->append(buf, n);
        }
    };

    QElapsedTimer timer;
    timer.start();

    while (true) {
        if (timeoutMs > 0 && timer.elapsed() > timeoutMs) {
            if (out) out->timedOut = true;
            return fail(QString("Remote command timed out after %1 ms.").arg(timeoutMs));
        }

        // Main tick: wait up to 50ms for stdout
        const int n = ssh_channel_read_timeout(ch, buf, sizeof(buf), 0, 50);
        if (n == SSH_ERROR)
            return fail("ssh_channel_read(stdout) failed: " + libsshError(m_session));
        if (n > 0)
            outBuf.append(buf, n);

        if (!drain(1, &errBuf))
            return fail("ssh_channel_read(stderr) failed: " + libsshError(m_session));

        if (ssh_channel_is_eof(ch)) {
            if (!drain(0, &outBuf) || !drain(1, &errBuf))
                return fail("ssh_channel_read(drain) failed: " + libsshError(m_session));
            break;
        }
    }

    ssh_channel_send_eof(ch);
    ssh_channel_close(ch);
    const int status = ssh_channel_get_exit_status(ch);
    ssh_channel_free(ch);
    ch = nullptr;

    if (out) {
        out->exitCode   = status;
        out->stdoutText = QString::fromUtf8(outBuf);
        out->stderrText = QString::fromUtf8(errBuf);
    }

    qDebug().noquote() << QString("[SSH] exec done exit=%1 stdout=%2B stderr=%3B")
                          .arg(status)
                          .arg(outBuf.size())
                          .arg(errBuf.size());
    return true;
}
