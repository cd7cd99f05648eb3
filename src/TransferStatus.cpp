// TransferStatus.cpp
#include "TransferStatus.h"

#include <QStringList>

QString errorKindToString(TransferErrorKind k)
{
    switch (k) {
        case TransferErrorKind::None:                return "None";
        case TransferErrorKind::InputError:          return "InputError";
        case TransferErrorKind::AuthenticationError: return "AuthenticationError";
        case TransferErrorKind::ConnectError:        return "ConnectError";
        case TransferErrorKind::TransferError:       return "TransferError";
        case TransferErrorKind::RemoteCommandError:  return "RemoteCommandError";
        case TransferErrorKind::CleanupError:        return "CleanupError";
        case TransferErrorKind::Canceled:            return "Canceled";
    }
    return "Unknown";
}

QString statusKindToString(TransferStatus::Kind k)
{
    switch (k) {
        case TransferStatus::Kind::Started:    return "Started";
        case TransferStatus::Kind::Archiving:  return "Archiving";
        case TransferStatus::Kind::Connecting: return "Connecting";
        case TransferStatus::Kind::Uploading:  return "Uploading";
        case TransferStatus::Kind::Extracting: return "Extracting";
        case TransferStatus::Kind::Completed:  return "Completed";
        case TransferStatus::Kind::Failed:     return "Failed";
    }
    return "Unknown";
}

TransferStatus TransferStatus::make(const QString& id, Kind k, const QString& msg)
{
    TransferStatus s;
    s.transferId = id;
    s.kind = k;
    s.message = msg;
    return s;
}

TransferStatus TransferStatus::uploading(const QString& id, quint64 done, quint64 total)
{
    TransferStatus s = make(id, Kind::Uploading);
    s.bytesDone = done;
    s.bytesTotal = total;
    return s;
}

TransferStatus TransferStatus::failed(const QString& id, const TransferError& e)
{
    TransferStatus s = make(id, Kind::Failed, e.message);
    s.errorKind = (e.kind == TransferErrorKind::None) ? TransferErrorKind::TransferError : e.kind;
    return s;
}

QString prettySize(quint64 bytes)
{
    if (bytes == 0) return QStringLiteral("0 B");

    static const char* units[] = { "B", "KB", "MB", "GB", "TB" };
    double v = (double)bytes;
    int i = 0;
    while (v >= 1024.0 && i < 4) {
        v /= 1024.0;
        ++i;
    }
    return QString("%1 %2").arg(v, 0, 'f', 1).arg(units[i]);
}

QString describeStatus(const TransferStatus& s)
{
    switch (s.kind) {
        case TransferStatus::Kind::Uploading:
            if (s.bytesTotal == 0)
                return QString("Uploading: %1").arg(prettySize(s.bytesDone));
            return QString("Uploading: %1 / %2")
                .arg(prettySize(s.bytesDone), prettySize(s.bytesTotal));

        case TransferStatus::Kind::Failed:
            return QString("Failed (%1): %2").arg(errorKindToString(s.errorKind), s.message);

        default:
            break;
    }

    const QString head = statusKindToString(s.kind);
    return s.message.isEmpty() ? head : QString("%1: %2").arg(head, s.message);
}
