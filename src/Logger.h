#pragma once
#include <QString>
#include <QtGlobal>

// Process-wide Qt message handler: one line per record
//   yyyy-MM-dd HH:mm:ss.zzz [LEVEL] file:line function - message
// written to <AppLocalDataLocation>/logs/<app>.log (or an override path),
// falling back to stderr when the file cannot be opened.
namespace Logger {
    // filePath empty => default location. Rotates before opening.
    void install(const QString& appName, const QString& filePath = QString());

    // Restores Qt's default handler and closes the file.
    void uninstall();

    // 0=Errors only, 1=Normal, 2=Debug
    void setLogLevel(int level);
    int  logLevel();

    // Also copy every accepted record to stderr (--verbose).
    void setEchoToStderr(bool on);

    QString logFilePath();
    QString defaultLogFilePath(const QString& appName);

    // Size-based rotation: path -> path.1 -> ... -> path.<keep>, oldest dropped.
    void rotateIfNeeded(const QString& path, qint64 maxBytes = 2 * 1024 * 1024, int keep = 3);

    // Record text without the trailing newline (exposed for tests).
    QString formatRecord(QtMsgType type, const char* file, int line, const char* function,
                         const QString& message);
}
