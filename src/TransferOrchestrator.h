// TransferOrchestrator.h
//
// Purpose:
//   Runs ONE transfer attempt end to end, strictly sequentially:
//
//     Idle -> Archiving -> Connecting -> Uploading -> [Extracting] -> Completed
//                  \___________\______________\____________\______-> Failed
//
//   Every run ends with exactly one terminal status (Completed or Failed),
//   emitted after cleanup: the temporary archive is deleted and the session
//   is closed on every exit path (success, failure, cancellation).
//
// Threading:
//   run() blocks; call it from a worker thread (see TransferQueue). The sink
//   is invoked on that same thread, in emission order.
//
// Cancellation:
//   Honoured at step boundaries and between upload chunks. A blocking
//   connect, chunk write or remote command is never interrupted.

#pragma once

#include <QString>

#include <atomic>
#include <functional>
#include <memory>

#include "AppSettings.h"
#include "RemoteSession.h"
#include "TransferRequest.h"
#include "TransferStatus.h"

class TransferOrchestrator
{
public:
    enum class State {
        Idle,
        Archiving,
        Connecting,
        Uploading,
        Extracting,
        Completed,
        Failed
    };

    using StatusSink = std::function<void(const TransferStatus&)>;

    TransferOrchestrator(SessionConnector connector, TransferSettings settings);

    // Directory for the temporary archive (QDir::tempPath() when empty).
    void setTempDir(const QString& dir) { m_tempDir = dir; }

    // Blocks until the run is over; returns the terminal status it emitted.
    // cancel may be null.
    TransferStatus run(const QString& transferId,
                       const TransferRequest& request,
                       const StatusSink& sink,
                       const std::atomic_bool* cancel = nullptr);

    State state() const { return m_state; }

    // Local path of the archive of the current/last run ("" before archiving).
    QString lastArchivePath() const { return m_lastArchivePath; }

    static QString stateToString(State s);

private:
    bool runSteps(const QString& transferId,
                  const TransferRequest& request,
                  const StatusSink& sink,
                  const std::atomic_bool* cancel,
                  ArchiveArtifact* artifact,
                  std::unique_ptr<RemoteSession>* session,
                  TransferError* err);

    void cleanup(ArchiveArtifact* artifact, std::unique_ptr<RemoteSession>* session);

    void enter(State s);

    SessionConnector m_connector;
    TransferSettings m_settings;
    QString m_tempDir;

    State m_state = State::Idle;
    QString m_lastArchivePath;
};
