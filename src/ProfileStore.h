#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include "ConnectionProfile.h"

/*
    ProfileStore
    ------------
    Persists named connection profiles.

    Responsibilities:
    - Define where profiles.json lives (AppConfigLocation by default)
    - Load / save the whole collection (JSON, atomic write)
    - Look up, add/replace and delete single profiles
    - Import / export profile files for sharing between machines
    - Resolve a profile name into TransferRequest fields (ProfileResolver)

    Design notes:
    - Saved passwords are encrypted with ProfileCipher; exported files never
      contain passwords.
    - Unknown JSON fields are ignored on load (forward compatible).
    - Names are unique (case-sensitive); saving an existing name replaces it.
*/

class ProfileStore : public ProfileResolver
{
public:
    // path empty => defaultPath()
    explicit ProfileStore(const QString& path = QString());

    /*
        <AppConfigLocation>/profiles.json
        The directory is created on demand by save().
    */
    static QString defaultPath();

    QString path() const { return m_path; }

    /*
        Reads the file into memory.
        - Missing file => empty collection, NOT an error.
        - Invalid JSON => false + err, collection left empty.
        - Entries without host or username are skipped.
        - A password that cannot be decrypted loads as empty (warning logged).
    */
    bool load(QString* err = nullptr);

    // Writes the whole collection (QSaveFile: all or nothing).
    bool save(QString* err = nullptr) const;

    QStringList names() const;
    bool contains(const QString& name) const;

    // false when not found
    bool profile(const QString& name, ConnectionProfile* out) const;
    QVector<ConnectionProfile> profiles() const { return m_profiles; }

    // Add or replace by name, then save().
    bool saveProfile(const ConnectionProfile& p, QString* err = nullptr);

    // Remove by name, then save(). Unknown name => false + err.
    bool deleteProfile(const QString& name, QString* err = nullptr);

    // Writes every profile to filePath WITHOUT passwords.
    bool exportProfiles(const QString& filePath, QString* err = nullptr) const;

    /*
        Merges profiles from filePath (same schema) into the collection,
        replacing same-named entries, then save().
        importedCount (optional) receives the number of merged profiles.
    */
    bool importProfiles(const QString& filePath, int* importedCount = nullptr, QString* err = nullptr);

    bool resolveProfile(const QString& name, TransferRequest* out, QString* err = nullptr) const override;

    // JSON (de)serialisation of a file body, shared by load/save/import/export.
    static QByteArray toJson(const QVector<ConnectionProfile>& profiles, bool includePasswords,
                             QString* err = nullptr);
    static bool fromJson(const QByteArray& data, QVector<ConnectionProfile>* out, QString* err = nullptr);

private:
    static bool writeFile(const QString& filePath, const QByteArray& data, QString* err);

    int indexOf(const QString& name) const;

    QString m_path;
    QVector<ConnectionProfile> m_profiles;
};
