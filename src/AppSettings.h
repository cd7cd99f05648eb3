// AppSettings.h
//
// Purpose:
//   Typed access to the QSettings keys PackDrop uses.
//
//   logging/level             0=Errors only, 1=Normal, 2=Debug
//   logging/filePath          empty => default log location
//   ssh/connectTimeoutSec     default 10
//   ssh/strictHostKeyChecking default false (unknown hosts are recorded)
//   remote/commandTimeoutMs   default 0 (wait for the command), > 0 => opt-in limit
//   ui/lastProfile            last profile selected in the window

#pragma once

#include <QString>

struct TransferSettings {
    int  connectTimeoutSec     = 10;
    bool strictHostKeyChecking = false;
    int  commandTimeoutMs      = 0;
};

namespace AppSettings {
    TransferSettings loadTransferSettings();
    void saveTransferSettings(const TransferSettings& s);

    int  logLevel();
    void setLogLevel(int level);

    QString logFilePath();

    QString lastProfile();
    void setLastProfile(const QString& name);
}
