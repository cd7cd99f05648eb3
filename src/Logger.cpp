// Logger.cpp
#include "Logger.h"

#include <QAtomicInt>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>

#include <cstdio>
#include <cstdlib>
#include <memory>

// =====================================================
// Global logger state (process-wide)
// =====================================================

namespace {

QMutex                 g_mutex;         // guards g_file / g_path
std::unique_ptr<QFile> g_file;
QString                g_path;
QAtomicInt             g_level(1);      // 0=Errors only, 1=Normal, 2=Debug
QAtomicInt             g_echo(0);

// A handler that logs from inside itself would deadlock on g_mutex.
thread_local bool g_inHandler = false;

const char* levelName(QtMsgType t)
{
    switch (t) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "LOG";
}

int severity(QtMsgType t)
{
    switch (t) {
        case QtDebugMsg:    return 0;
        case QtInfoMsg:     return 1;
        case QtWarningMsg:  return 2;
        case QtCriticalMsg: return 3;
        case QtFatalMsg:    return 4;
    }
    return 4;
}

// 0 => WARN and up, 1 => INFO and up, 2 => everything
bool accepted(QtMsgType t)
{
    const int lvl = g_level.loadAcquire();
    return severity(t) >= 2 - lvl;
}

void writeStderr(const QByteArray& line)
{
    std::fprintf(stderr, "%s\n", line.constData());
    std::fflush(stderr);
}

void handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    if (type != QtFatalMsg && (!accepted(type) || g_inHandler))
        return;

    g_inHandler = true;

    const QByteArray line =
        Logger::formatRecord(type, ctx.file, ctx.line, ctx.function, msg).toUtf8();

    {
        QMutexLocker lock(&g_mutex);
        if (g_file && g_file->isOpen()) {
            g_file->write(line);
            g_file->write("\n");
            g_file->flush();
            if (g_echo.loadAcquire())
                writeStderr(line);
        } else {
            writeStderr(line);
        }
    }

    g_inHandler = false;

    if (type == QtFatalMsg)
        std::abort();
}

} // namespace

namespace Logger {

QString formatRecord(QtMsgType type, const char* file, int line, const char* function,
                     const QString& message)
{
    // One record = one physical line.
    QString clean = message;
    clean.replace("\r\n", " ");
    clean.replace('\r', ' ');
    clean.replace('\n', ' ');
    clean.replace('\t', ' ');
    clean = clean.simplified();

    QString out = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    out += QString(" [%1] ").arg(QLatin1String(levelName(type)));

    if (file && function) {
        out += QString("%1:%2 %3 - ")
                   .arg(QFileInfo(QString::fromUtf8(file)).fileName())
                   .arg(line)
                   .arg(QString::fromUtf8(function));
    }

    out += clean;
    return out;
}

void rotateIfNeeded(const QString& path, qint64 maxBytes, int keep)
{
    const QFileInfo fi(path);
    if (!fi.exists() || fi.size() < maxBytes)
        return;

    if (keep < 1) {
        QFile::remove(path);
        return;
    }

    QFile::remove(path + "." + QString::number(keep));
    for (int i = keep - 1; i >= 1; --i) {
        const QString from = path + "." + QString::number(i);
        if (QFileInfo::exists(from))
            QFile::rename(from, path + "." + QString::number(i + 1));
    }
    QFile::rename(path, path + ".1");
}

QString defaultLogFilePath(const QString& appName)
{
    const QString dir =
        QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/logs";
    return dir + "/" + appName + ".log";
}

void install(const QString& appName, const QString& filePath)
{
    const QString path = filePath.trimmed().isEmpty()
                             ? defaultLogFilePath(appName)
                             : QDir::cleanPath(filePath.trimmed());

    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    bool opened = false;
    {
        QMutexLocker lock(&g_mutex);
        g_file.reset(new QFile(path));
        opened = g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
        if (!opened)
            g_file.reset();
        g_path = opened ? path : QString();
    }

    qInstallMessageHandler(handler);

    if (opened)
        qInfo().noquote() << QString("Logger initialized: %1").arg(path);
    else
        qWarning().noquote() << QString("Logger: cannot open %1, logging to stderr").arg(path);
}

void uninstall()
{
    qInstallMessageHandler(nullptr);

    QMutexLocker lock(&g_mutex);
    if (g_file) g_file->close();
    g_file.reset();
    g_path.clear();
}

void setLogLevel(int level)
{
    g_level.storeRelease(qBound(0, level, 2));
}

int logLevel()
{
    return g_level.loadAcquire();
}

void setEchoToStderr(bool on)
{
    g_echo.storeRelease(on ? 1 : 0);
}

QString logFilePath()
{
    QMutexLocker lock(&g_mutex);
    return g_path;
}

} // namespace Logger
