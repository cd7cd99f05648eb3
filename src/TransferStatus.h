// TransferStatus.h
//
// Purpose:
//   Error kinds and status events produced by one transfer run.
//   The worker only produces these; presentation code only consumes them.

#pragma once

#include <QString>
#include <QMetaType>
#include <QtGlobal>

enum class TransferErrorKind {
    None,
    InputError,           // missing/unreadable local path, invalid request
    AuthenticationError,  // credentials rejected, key unusable
    ConnectError,         // unreachable host, timeout, host key refused
    TransferError,        // SFTP I/O failure during upload
    RemoteCommandError,   // extraction exited non-zero / timed out
    CleanupError,         // non-fatal, logged only
    Canceled
};

QString errorKindToString(TransferErrorKind k);

// Out-parameter filled by every step on failure.
struct TransferError {
    TransferErrorKind kind = TransferErrorKind::None;
    QString message;

    void clear()
    {
        kind = TransferErrorKind::None;
        message.clear();
    }

    bool isSet() const { return kind != TransferErrorKind::None; }
};

// Small helper so call sites read like the QString* err convention:
//   return failWith(err, TransferErrorKind::TransferError, "...");
inline bool failWith(TransferError* err, TransferErrorKind kind, const QString& message)
{
    if (err) {
        err->kind = kind;
        err->message = message;
    }
    return false;
}

struct TransferStatus {
    enum class Kind {
        Started,
        Archiving,
        Connecting,
        Uploading,
        Extracting,
        Completed,
        Failed
    };

    QString transferId;
    Kind kind = Kind::Started;

    quint64 bytesDone  = 0;   // Uploading only
    quint64 bytesTotal = 0;   // Uploading only

    TransferErrorKind errorKind = TransferErrorKind::None;   // Failed only
    QString message;

    bool isTerminal() const { return kind == Kind::Completed || kind == Kind::Failed; }

    static TransferStatus make(const QString& id, Kind k, const QString& msg = QString());
    static TransferStatus uploading(const QString& id, quint64 done, quint64 total);
    static TransferStatus failed(const QString& id, const TransferError& e);
};

QString statusKindToString(TransferStatus::Kind k);

// One-line human readable rendering used by the log view and the file log.
QString describeStatus(const TransferStatus& s);

// "12.3 MB" style formatting (B, KB, MB, GB, TB; one decimal).
QString prettySize(quint64 bytes);

Q_DECLARE_METATYPE(TransferStatus)
