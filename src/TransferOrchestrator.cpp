// TransferOrchestrator.cpp
#include "TransferOrchestrator.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>

#include <exception>
#include <utility>

#include "Archiver.h"
#include "RemoteCommand.h"
#include "Uploader.h"

QString TransferOrchestrator::stateToString(State s)
{
    switch (s) {
        case State::Idle:       return "Idle";
        case State::Archiving:  return "Archiving";
        case State::Connecting: return "Connecting";
        case State::Uploading:  return "Uploading";
        case State::Extracting: return "Extracting";
        case State::Completed:  return "Completed";
        case State::Failed:     return "Failed";
    }
    return "Unknown";
}

TransferOrchestrator::TransferOrchestrator(SessionConnector connector, TransferSettings settings)
    : m_connector(std::move(connector)),
      m_settings(settings)
{
}

void TransferOrchestrator::enter(State s)
{
    qDebug().noquote() << QString("[XFER] %1 -> %2").arg(stateToString(m_state), stateToString(s));
    m_state = s;
}

TransferStatus TransferOrchestrator::run(const QString& transferId,
                                         const TransferRequest& request,
                                         const StatusSink& sink,
                                         const std::atomic_bool* cancel)
{
    auto emitStatus = [&](const TransferStatus& s) {
        if (sink) sink(s);
    };

    m_state = State::Idle;
    m_lastArchivePath.clear();

    QElapsedTimer timer;
    timer.start();

    qInfo().noquote() << QString("[XFER] %1 start target=%2 sources=%3 remoteDir='%4' extract=%5")
                         .arg(transferId, request.target())
                         .arg(request.sources.size())
                         .arg(request.remoteDir)
                         .arg(request.extract ? "yes" : "no");

    emitStatus(TransferStatus::make(transferId, TransferStatus::Kind::Started, request.target()));

    ArchiveArtifact artifact;
    std::unique_ptr<RemoteSession> session;
    TransferError err;
    bool ok = false;

    try {
        ok = runSteps(transferId, request, sink, cancel, &artifact, &session, &err);
    } catch (const std::exception& e) {
        ok = false;
        err.kind = TransferErrorKind::TransferError;
        err.message = QString("Unexpected error: %1").arg(QString::fromLocal8Bit(e.what()));
    }

    cleanup(&artifact, &session);

    TransferStatus terminal;
    if (ok) {
        enter(State::Completed);
        terminal = TransferStatus::make(transferId, TransferStatus::Kind::Completed,
                                        "Transfer completed successfully.");
        qInfo().noquote() << QString("[XFER] %1 OK in %2 ms").arg(transferId).arg(timer.elapsed());
    } else {
        enter(State::Failed);
        terminal = TransferStatus::failed(transferId, err);
        qWarning().noquote() << QString("[XFER] %1 FAILED (%2) in %3 ms: %4")
                                .arg(transferId, errorKindToString(terminal.errorKind))
                                .arg(timer.elapsed())
                                .arg(terminal.message);
    }

    emitStatus(terminal);
    return terminal;
}

bool TransferOrchestrator::runSteps(const QString& transferId,
                                    const TransferRequest& request,
                                    const StatusSink& sink,
                                    const std::atomic_bool* cancel,
                                    ArchiveArtifact* artifact,
                                    std::unique_ptr<RemoteSession>* session,
                                    TransferError* err)
{
    auto emitStatus = [&](const TransferStatus& s) {
        if (sink) sink(s);
    };

    auto canceled = [&](const char* where) -> bool {
        if (!cancel || !cancel->load()) return false;
        qInfo().noquote() << QString("[XFER] %1 cancel honoured before %2").arg(transferId, where);
        failWith(err, TransferErrorKind::Canceled,
                 QString("Transfer cancelled before %1.").arg(QString::fromLatin1(where)));
        return true;
    };

    QString verr;
    if (!request.validate(&verr))
        return failWith(err, TransferErrorKind::InputError, verr);

    // 1) Archive
    if (canceled("archiving")) return false;
    enter(State::Archiving);
    emitStatus(TransferStatus::make(transferId, TransferStatus::Kind::Archiving,
                                    QString("Creating archive of %1 item(s)...").arg(request.sources.size())));

    if (!Archiver::createArchive(request.sources, artifact, err, m_tempDir))
        return false;
    m_lastArchivePath = artifact->path;

    // 2) Connect
    if (canceled("connecting")) return false;
    enter(State::Connecting);
    emitStatus(TransferStatus::make(transferId, TransferStatus::Kind::Connecting,
                                    QString("Archive created: %1. Connecting to %2...")
                                        .arg(prettySize(artifact->size), request.target())));

    if (!m_connector)
        return failWith(err, TransferErrorKind::ConnectError, "No session connector configured.");

    *session = m_connector(request, err);
    if (!*session) {
        if (err && !err->isSet())
            failWith(err, TransferErrorKind::ConnectError, "Connection failed.");
        return false;
    }

    // 3) Upload
    if (canceled("uploading")) return false;
    enter(State::Uploading);

    Uploader::Options opts;
    opts.verifySize = request.verifyUpload;
    opts.cancel = cancel;
    opts.progress = [&](quint64 done, quint64 total) {
        emitStatus(TransferStatus::uploading(transferId, done, total));
    };

    QString remotePath;
    if (!Uploader::upload(**session, *artifact, request.remoteDir, opts, &remotePath, err))
        return false;

    // 4) Extract (optional)
    if (!request.extract)
        return true;

    if (canceled("extracting")) return false;
    enter(State::Extracting);

    const QString cmd = RemoteCommand::buildExtractCommand(request.remoteDir,
                                                           artifact->fileName(),
                                                           request.removeArchiveAfterExtract);
    emitStatus(TransferStatus::make(transferId, TransferStatus::Kind::Extracting,
                                    QString("Extracting %1 on remote server...").arg(remotePath)));

    RemoteCommandResult result;
    return RemoteCommand::run(**session, cmd, m_settings.commandTimeoutMs, &result, err);
}

// Runs on every exit path. Failures here are CleanupError: logged only.
void TransferOrchestrator::cleanup(ArchiveArtifact* artifact, std::unique_ptr<RemoteSession>* session)
{
    if (session && *session) {
        (*session)->disconnect();
        session->reset();
    }

    if (!artifact || !artifact->isValid())
        return;

    if (QFileInfo::exists(artifact->path)) {
        QFile f(artifact->path);
        if (!f.remove()) {
            qWarning().noquote() << QString("[XFER] %1: could not delete temporary archive '%2': %3")
                                    .arg(errorKindToString(TransferErrorKind::CleanupError),
                                         artifact->path, f.errorString());
            return;
        }
    }

    qDebug().noquote() << QString("[XFER] removed temporary archive %1").arg(artifact->path);
    *artifact = ArchiveArtifact{};
}
