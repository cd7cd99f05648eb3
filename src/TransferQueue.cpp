// TransferQueue.cpp
#include "TransferQueue.h"

#include <QDebug>
#include <QFutureWatcher>
#include <QMetaObject>
#include <QUuid>
#include <QtConcurrent/QtConcurrent>

#include <utility>

#include "SshSession.h"
#include "TransferOrchestrator.h"

TransferQueue::TransferQueue(const TransferSettings& settings,
                             SessionConnector connector,
                             QObject* parent)
    : QObject(parent),
      m_settings(settings),
      m_connector(connector ? std::move(connector) : SshSession::connector(settings))
{
    qRegisterMetaType<TransferStatus>("TransferStatus");

    // One transfer at a time: runs never share a session or an archive.
    m_pool.setMaxThreadCount(1);
    m_pool.setExpiryTimeout(-1);
}

TransferQueue::~TransferQueue()
{
    cancelAll();
    m_pool.waitForDone();
}

void TransferQueue::waitForDone()
{
    m_pool.waitForDone();
}

QString TransferQueue::enqueue(const TransferRequest& request)
{
    const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);

    auto cancelFlag = QSharedPointer<std::atomic_bool>::create(false);
    m_active.insert(id, cancelFlag);

    qInfo().noquote() << QString("[QUEUE] enqueue %1 -> %2 (pending=%3)")
                         .arg(id, request.target())
                         .arg(m_active.size());

    const SessionConnector connector = m_connector;
    const TransferSettings settings = m_settings;
    const QString tempDir = m_tempDir;

    auto *watcher = new QFutureWatcher<TransferStatus>(this);

    connect(watcher, &QFutureWatcherBase::finished, this, [this, watcher, id]() {
        const TransferStatus terminal = watcher->result();
        watcher->deleteLater();

        m_active.remove(id);
        qInfo().noquote() << QString("[QUEUE] finished %1 (%2), pending=%3")
                             .arg(id, statusKindToString(terminal.kind))
                             .arg(m_active.size());

        emit finished(id, terminal);
        if (m_active.isEmpty())
            emit idle();
    });

    // Statuses are produced on the worker; hop them to our thread in order.
    auto sink = [this](const TransferStatus& s) {
        if (s.kind != TransferStatus::Kind::Uploading)
            qDebug().noquote() << QString("[QUEUE] %1 %2").arg(s.transferId, describeStatus(s));
        QMetaObject::invokeMethod(this, [this, s]() { emit transferStatus(s); },
                                  Qt::QueuedConnection);
    };

    watcher->setFuture(QtConcurrent::run(&m_pool,
        [connector, settings, tempDir, request, id, sink, cancelFlag]() -> TransferStatus {
            TransferOrchestrator orchestrator(connector, settings);
            orchestrator.setTempDir(tempDir);
            return orchestrator.run(id, request, sink, cancelFlag.data());
        }));

    return id;
}

bool TransferQueue::cancel(const QString& transferId)
{
    auto it = m_active.find(transferId);
    if (it == m_active.end())
        return false;

    it.value()->store(true);
    qInfo().noquote() << QString("[QUEUE] cancel requested for %1").arg(transferId);
    return true;
}

void TransferQueue::cancelAll()
{
    for (auto it = m_active.begin(); it != m_active.end(); ++it)
        it.value()->store(true);

    if (!m_active.isEmpty())
        qInfo().noquote() << QString("[QUEUE] cancel requested for %1 transfer(s)").arg(m_active.size());
}
