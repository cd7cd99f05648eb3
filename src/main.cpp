/*
 * PackDrop: archive, upload and unpack over SSH
 *
 * Licensed under the Apache License, Version 2.0
 * http://www.apache.org/licenses/LICENSE-2.0
 */

#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QGuiApplication>

#include "AppSettings.h"
#include "Logger.h"
#include "ProfileStore.h"
#include "TransferQueue.h"
#include "TransferWindow.h"

// main.cpp
// --------
// Application entry point.
//
// Responsibilities:
// - Set QCoreApplication metadata (org/app name/version) for QSettings and paths
// - Parse --verbose / --log-file
// - Install logging BEFORE anything else logs
// - Load profiles, create the transfer queue and the window, run the event loop
//
// Notes:
// - --verbose only changes log detail; it never changes transfer behaviour.
int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Stable names: they decide the QSettings file and QStandardPaths folders,
    // e.g. ~/.config/PackDrop/packdrop/ and ~/.local/share/PackDrop/packdrop/
    QCoreApplication::setOrganizationName("PackDrop");
    QCoreApplication::setApplicationName("packdrop");
    QGuiApplication::setApplicationDisplayName("PackDrop");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Archive local files, upload them over SSH and unpack them remotely.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOpt(QStringList() << "v" << "verbose",
                                  "Debug-level logging (also echoed to stderr).");
    QCommandLineOption logFileOpt(QStringList() << "log-file",
                                  "Write the log to <path> instead of the default location.",
                                  "path");
    parser.addOption(verboseOpt);
    parser.addOption(logFileOpt);
    parser.process(app);

    const bool verbose = parser.isSet(verboseOpt);

    Logger::setLogLevel(verbose ? 2 : AppSettings::logLevel());
    Logger::setEchoToStderr(verbose);

    const QString logPath = parser.isSet(logFileOpt) ? parser.value(logFileOpt)
                                                     : AppSettings::logFilePath();
    Logger::install("packdrop", logPath);

    qInfo().noquote() << QString("PackDrop %1 starting (log level %2)")
                         .arg(QCoreApplication::applicationVersion())
                         .arg(Logger::logLevel());

    const TransferSettings settings = AppSettings::loadTransferSettings();

    ProfileStore profiles;
    QString err;
    if (!profiles.load(&err))
        qWarning().noquote() << QString("[PROFILES] %1 (starting with no profiles)").arg(err);

    TransferQueue queue(settings);

    TransferWindow w(&profiles, &queue, settings);
    w.show();

    const int rc = app.exec();

    // A cancelled transfer still has to reach a step boundary and clean up.
    queue.cancelAll();
    queue.waitForDone();

    qInfo() << "PackDrop exiting, rc =" << rc;
    Logger::uninstall();
    return rc;
}
