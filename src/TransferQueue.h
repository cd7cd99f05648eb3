// TransferQueue.h
//
// Purpose:
//   Owns the single background worker that runs transfers, one at a time,
//   in submission order. The UI thread submits requests and listens to
//   signals; it never touches SSH, SFTP or the archive directly.
//
// Ordering:
//   Every status of a run is re-emitted on the queue's thread (queued), so
//   listeners observe Started ... Completed|Failed in emission order, and
//   finished() always follows that run's terminal transferStatus().

#pragma once

#include <QObject>
#include <QHash>
#include <QSharedPointer>
#include <QString>
#include <QThreadPool>

#include <atomic>

#include "AppSettings.h"
#include "RemoteSession.h"
#include "TransferRequest.h"
#include "TransferStatus.h"

class TransferQueue : public QObject
{
    Q_OBJECT
public:
    // connector defaults to SshSession::connector(settings).
    explicit TransferQueue(const TransferSettings& settings,
                           SessionConnector connector = SessionConnector(),
                           QObject* parent = nullptr);
    ~TransferQueue() override;

    // Queues one run; returns its transfer id (UUID without braces).
    QString enqueue(const TransferRequest& request);

    // Requests cancellation of one queued or running transfer.
    // Returns false for an unknown/finished id.
    bool cancel(const QString& transferId);
    void cancelAll();

    bool isBusy() const { return !m_active.isEmpty(); }
    int pendingCount() const { return m_active.size(); }

    void setTempDir(const QString& dir) { m_tempDir = dir; }

    // Blocks until queued runs are done (shutdown, tests).
    void waitForDone();

signals:
    void transferStatus(const TransferStatus& status);
    void finished(const QString& transferId, const TransferStatus& terminal);
    void idle();

private:
    TransferSettings m_settings;
    SessionConnector m_connector;
    QString m_tempDir;

    QThreadPool m_pool;
    QHash<QString, QSharedPointer<std::atomic_bool>> m_active;
};
