// ProfileStore.cpp
//
// ProfileStore is the persistence boundary for connection profiles.
// Responsibilities:
// - Serialize/deserialize profiles to JSON
// - Encrypt/decrypt saved passwords (ProfileCipher)
// - Atomic writes (QSaveFile)
//
// Non-responsibilities:
// - No UI (dialogs/widgets)
// - No SSH/network operations
//
// Schema:
// {
//   "format": 1,
//   "profiles": [
//     {
//       "name": "...",
//       "host": "...",
//       "port": 22,
//       "user": "...",
//       "auth": "password" | "key",
//       "password": "sb1:...",     // optional, never in exports
//       "key_file": "...",         // optional
//       "remote_path": "...",      // optional
//       "extract": true,
//       "remove_archive": true
//     }
//   ]
// }
//

#include "ProfileStore.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>
#include <QStandardPaths>

#include "ProfileCipher.h"

static constexpr int kFormatVersion = 1;

ProfileStore::ProfileStore(const QString& path)
    : m_path(path.isEmpty() ? defaultPath() : path)
{
}

QString ProfileStore::defaultPath()
{
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(dir).filePath("profiles.json");
}

int ProfileStore::indexOf(const QString& name) const
{
    for (int i = 0; i < m_profiles.size(); ++i) {
        if (m_profiles[i].name == name)
            return i;
    }
    return -1;
}

QByteArray ProfileStore::toJson(const QVector<ConnectionProfile>& profiles, bool includePasswords, QString* err)
{
    if (err) err->clear();

    QJsonArray arr;
    for (const auto& p : profiles) {
        QJsonObject obj;

        obj["name"] = p.name;
        obj["host"] = p.host;
        obj["port"] = p.port;
        obj["user"] = p.username;
        obj["auth"] = authMethodToString(p.authMethod);

        if (includePasswords && !p.password.isEmpty()) {
            QString stored;
            QString cerr;
            if (!ProfileCipher::encryptSecret(p.password, &stored, &cerr)) {
                if (err) *err = QCoreApplication::translate("ProfileStore",
                                                            "Could not encrypt password for '%1': %2")
                                    .arg(p.name, cerr);
                return QByteArray();
            }
            obj["password"] = stored;
        }

        if (!p.keyFile.trimmed().isEmpty())
            obj["key_file"] = p.keyFile.trimmed();

        if (!p.remotePath.trimmed().isEmpty())
            obj["remote_path"] = p.remotePath.trimmed();

        // Always stored for schema stability.
        obj["extract"] = p.extract;
        obj["remove_archive"] = p.removeArchiveAfterExtract;

        arr.append(obj);
    }

    QJsonObject root;
    root["format"] = kFormatVersion;
    root["profiles"] = arr;

    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

bool ProfileStore::fromJson(const QByteArray& data, QVector<ConnectionProfile>* out, QString* err)
{
    if (err) err->clear();
    if (!out) return false;
    out->clear();

    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        if (err) *err = QCoreApplication::translate("ProfileStore", "Invalid JSON in profiles file: %1")
                            .arg(perr.errorString());
        return false;
    }

    const QJsonObject root = doc.object();
    const int format = root.value("format").toInt(kFormatVersion);
    if (format > kFormatVersion) {
        if (err) *err = QCoreApplication::translate("ProfileStore",
                                                    "Profiles file format %1 is newer than supported (%2)")
                            .arg(format).arg(kFormatVersion);
        return false;
    }

    const QJsonArray arr = root.value("profiles").toArray();
    for (const QJsonValue& val : arr) {
        if (!val.isObject())
            continue;

        const QJsonObject obj = val.toObject();

        ConnectionProfile p;
        p.name       = obj.value("name").toString().trimmed();
        p.host       = obj.value("host").toString().trimmed();
        p.port       = obj.value("port").toInt(22);
        p.username   = obj.value("user").toString().trimmed();
        p.authMethod = authMethodFromString(obj.value("auth").toString());
        p.keyFile    = obj.value("key_file").toString();
        p.remotePath = obj.value("remote_path").toString();
        p.extract    = obj.value("extract").toBool(true);
        p.removeArchiveAfterExtract = obj.value("remove_archive").toBool(true);

        const QString stored = obj.value("password").toString();
        if (!stored.isEmpty()) {
            QString cerr;
            if (!ProfileCipher::decryptSecret(stored, &p.password, &cerr)) {
                qWarning().noquote() << QString("[PROFILES] password for '%1' ignored: %2").arg(p.name, cerr);
                p.password.clear();
            }
        }

        // Skip incomplete profiles
        if (p.host.isEmpty() || p.username.isEmpty())
            continue;

        if (p.name.isEmpty())
            p.name = QString("%1@%2").arg(p.username, p.host);

        if (p.port < 1 || p.port > 65535)
            p.port = 22;

        out->push_back(p);
    }

    return true;
}

bool ProfileStore::writeFile(const QString& filePath, const QByteArray& data, QString* err)
{
    const QString dir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(dir)) {
        if (err) *err = QCoreApplication::translate("ProfileStore", "Could not create directory %1").arg(dir);
        return false;
    }

    QSaveFile f(filePath);
    if (!f.open(QIODevice::WriteOnly)) {
        if (err) *err = QCoreApplication::translate("ProfileStore", "Could not write %1: %2")
                            .arg(filePath, f.errorString());
        return false;
    }

    if (f.write(data) != data.size() || !f.commit()) {
        if (err) *err = QCoreApplication::translate("ProfileStore", "Could not write %1: %2")
                            .arg(filePath, f.errorString());
        return false;
    }

    return true;
}

bool ProfileStore::load(QString* err)
{
    if (err) err->clear();
    m_profiles.clear();

    QFile f(m_path);
    if (!f.exists())
        return true;

    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = QCoreApplication::translate("ProfileStore", "Could not open %1: %2")
                            .arg(m_path, f.errorString());
        return false;
    }

    const QByteArray data = f.readAll();
    f.close();

    if (!fromJson(data, &m_profiles, err)) {
        qWarning().noquote() << QString("[PROFILES] load failed: %1").arg(err ? *err : QString());
        return false;
    }

    qInfo().noquote() << QString("[PROFILES] loaded %1 profile(s) from %2").arg(m_profiles.size()).arg(m_path);
    return true;
}

bool ProfileStore::save(QString* err) const
{
    if (err) err->clear();

    QString jerr;
    const QByteArray data = toJson(m_profiles, true, &jerr);
    if (!jerr.isEmpty()) {
        if (err) *err = jerr;
        return false;
    }

    if (!writeFile(m_path, data, err))
        return false;

    qInfo().noquote() << QString("[PROFILES] saved %1 profile(s) to %2").arg(m_profiles.size()).arg(m_path);
    return true;
}

QStringList ProfileStore::names() const
{
    QStringList out;
    out.reserve(m_profiles.size());
    for (const auto& p : m_profiles)
        out << p.name;
    return out;
}

bool ProfileStore::contains(const QString& name) const
{
    return indexOf(name) >= 0;
}

bool ProfileStore::profile(const QString& name, ConnectionProfile* out) const
{
    const int i = indexOf(name);
    if (i < 0) return false;
    if (out) *out = m_profiles[i];
    return true;
}

bool ProfileStore::saveProfile(const ConnectionProfile& p, QString* err)
{
    if (err) err->clear();

    ConnectionProfile copy = p;
    copy.name = copy.name.trimmed();
    if (copy.name.isEmpty()) {
        if (err) *err = QCoreApplication::translate("ProfileStore", "Profile name is required.");
        return false;
    }
    if (copy.host.trimmed().isEmpty() || copy.username.trimmed().isEmpty()) {
        if (err) *err = QCoreApplication::translate("ProfileStore", "Profile needs a host and a username.");
        return false;
    }

    const int i = indexOf(copy.name);
    if (i >= 0)
        m_profiles[i] = copy;
    else
        m_profiles.push_back(copy);

    return save(err);
}

bool ProfileStore::deleteProfile(const QString& name, QString* err)
{
    if (err) err->clear();

    const int i = indexOf(name);
    if (i < 0) {
        if (err) *err = QCoreApplication::translate("ProfileStore", "Profile '%1' not found.").arg(name);
        return false;
    }

    m_profiles.removeAt(i);
    return save(err);
}

bool ProfileStore::exportProfiles(const QString& filePath, QString* err) const
{
    if (err) err->clear();

    if (!writeFile(filePath, toJson(m_profiles, false), err))
        return false;

    qInfo().noquote() << QString("[PROFILES] exported %1 profile(s) to %2 (passwords omitted)")
                         .arg(m_profiles.size()).arg(filePath);
    return true;
}

bool ProfileStore::importProfiles(const QString& filePath, int* importedCount, QString* err)
{
    if (err) err->clear();
    if (importedCount) *importedCount = 0;

    QFile f(filePath);
    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = QCoreApplication::translate("ProfileStore", "Could not open %1: %2")
                            .arg(filePath, f.errorString());
        return false;
    }

    QVector<ConnectionProfile> incoming;
    if (!fromJson(f.readAll(), &incoming, err))
        return false;

    for (const auto& p : incoming) {
        const int i = indexOf(p.name);
        if (i >= 0) {
            // Exports carry no password: keep the one we already have.
            ConnectionProfile merged = p;
            if (merged.password.isEmpty())
                merged.password = m_profiles[i].password;
            m_profiles[i] = merged;
        } else {
            m_profiles.push_back(p);
        }
    }

    if (!save(err))
        return false;

    if (importedCount) *importedCount = incoming.size();
    qInfo().noquote() << QString("[PROFILES] imported %1 profile(s) from %2").arg(incoming.size()).arg(filePath);
    return true;
}

bool ProfileStore::resolveProfile(const QString& name, TransferRequest* out, QString* err) const
{
    if (err) err->clear();

    ConnectionProfile p;
    if (!profile(name, &p)) {
        if (err) *err = QCoreApplication::translate("ProfileStore", "Profile '%1' not found.").arg(name);
        return false;
    }

    p.applyTo(out);
    return true;
}
