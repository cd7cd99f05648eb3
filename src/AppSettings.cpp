// AppSettings.cpp
#include "AppSettings.h"

#include <QSettings>
#include <QtGlobal>

namespace AppSettings {

TransferSettings loadTransferSettings()
{
    QSettings s;
    TransferSettings t;

    t.connectTimeoutSec =
        qBound(1, s.value("ssh/connectTimeoutSec", t.connectTimeoutSec).toInt(), 600);
    t.strictHostKeyChecking =
        s.value("ssh/strictHostKeyChecking", t.strictHostKeyChecking).toBool();
    t.commandTimeoutMs =
        s.value("remote/commandTimeoutMs", t.commandTimeoutMs).toInt();

    return t;
}

void saveTransferSettings(const TransferSettings& t)
{
    QSettings s;
    s.setValue("ssh/connectTimeoutSec", t.connectTimeoutSec);
    s.setValue("ssh/strictHostKeyChecking", t.strictHostKeyChecking);
    s.setValue("remote/commandTimeoutMs", t.commandTimeoutMs);
}

int logLevel()
{
    return qBound(0, QSettings().value("logging/level", 1).toInt(), 2);
}

void setLogLevel(int level)
{
    QSettings().setValue("logging/level", qBound(0, level, 2));
}

QString logFilePath()
{
    return QSettings().value("logging/filePath", "").toString().trimmed();
}

QString lastProfile()
{
    return QSettings().value("ui/lastProfile", "").toString();
}

void setLastProfile(const QString& name)
{
    QSettings().setValue("ui/lastProfile", name);
}

} // namespace AppSettings
