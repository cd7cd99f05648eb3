// ProfileCipher.cpp
//
// Format
// ------
//   "sb1:" + base64( NONCE || CIPHERTEXT )
//
// NONCE      : crypto_aead_xchacha20poly1305_ietf_NPUBBYTES (24)
// CIPHERTEXT : password UTF-8 + Poly1305 tag (16)
// AD         : the "sb1:" prefix, so a value cannot be relabelled
//
// Key
// ---
// Argon2id(machine id | user | home) with a fixed application salt.
// INTERACTIVE limits: it runs once per process, on first use.
//
// IMPORTANT: never log plain text, stored values or the key.

#include "ProfileCipher.h"

#include <QByteArray>
#include <QDir>
#include <QMutex>
#include <QMutexLocker>
#include <QSysInfo>

#include <sodium.h>

#include <cstring>

namespace {

// libsodium requires sodium_init() once per process.
bool sodiumInitOnce(QString* err)
{
    static bool inited = false;
    if (inited) return true;

    if (sodium_init() < 0) {
        if (err) *err = "libsodium init failed";
        return false;
    }
    inited = true;
    return true;
}

QByteArray keyMaterial()
{
    QByteArray m("packdrop-profile-key|");
    m += QSysInfo::machineUniqueId();
    m += '|';
    m += qEnvironmentVariable("USER", qEnvironmentVariable("USERNAME")).toUtf8();
    m += '|';
    m += QDir::homePath().toUtf8();
    return m;
}

QMutex g_keyMutex;
bool g_keyReady = false;
unsigned char g_key[crypto_aead_xchacha20poly1305_ietf_KEYBYTES];

// Copies the cached key into out (deriving it on first use).
bool profileKey(unsigned char* out, QString* err)
{
    QMutexLocker lock(&g_keyMutex);

    if (!g_keyReady) {
        if (!sodiumInitOnce(err)) return false;

        static const char kSaltLabel[] = "PackDrop profile salt v1";
        unsigned char salt[crypto_pwhash_SALTBYTES];
        crypto_generichash(salt, sizeof salt,
                           reinterpret_cast<const unsigned char*>(kSaltLabel), sizeof kSaltLabel - 1,
                           nullptr, 0);

        QByteArray material = keyMaterial();
        const int rc = crypto_pwhash(
            g_key, sizeof g_key,
            material.constData(),
            (unsigned long long)material.size(),
            salt,
            crypto_pwhash_OPSLIMIT_INTERACTIVE,
            crypto_pwhash_MEMLIMIT_INTERACTIVE,
            crypto_pwhash_ALG_ARGON2ID13);
        sodium_memzero(material.data(), (size_t)material.size());

        if (rc != 0) {
            if (err) *err = "Argon2id failed (crypto_pwhash)";
            return false;
        }
        g_keyReady = true;
    }

    memcpy(out, g_key, sizeof g_key);
    return true;
}

} // namespace

namespace ProfileCipher {

bool isEncrypted(const QString& stored)
{
    return stored.startsWith(QLatin1String(kPrefix));
}

bool encryptSecret(const QString& plain, QString* outStored, QString* err)
{
    if (err) err->clear();
    if (!outStored) return false;
    outStored->clear();

    if (plain.isEmpty())
        return true;

    unsigned char key[crypto_aead_xchacha20poly1305_ietf_KEYBYTES];
    if (!profileKey(key, err)) return false;

    unsigned char nonce[crypto_aead_xchacha20poly1305_ietf_NPUBBYTES];
    randombytes_buf(nonce, sizeof nonce);

    QByteArray msg = plain.toUtf8();
    const QByteArray ad(kPrefix);

    QByteArray cipher;
    cipher.resize(msg.size() + crypto_aead_xchacha20poly1305_ietf_ABYTES);

    unsigned long long clen = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
        reinterpret_cast<unsigned char*>(cipher.data()), &clen,
        reinterpret_cast<const unsigned char*>(msg.constData()),
        (unsigned long long)msg.size(),
        reinterpret_cast<const unsigned char*>(ad.constData()),
        (unsigned long long)ad.size(),
        nullptr,
        nonce, key);

    sodium_memzero(key, sizeof key);
    sodium_memzero(msg.data(), (size_t)msg.size());

    if (rc != 0) {
        if (err) *err = "XChaCha20-Poly1305 encrypt failed";
        return false;
    }
    cipher.resize((int)clen);

    QByteArray blob(reinterpret_cast<const char*>(nonce), (int)sizeof nonce);
    blob.append(cipher);

    *outStored = QLatin1String(kPrefix) + QString::fromLatin1(blob.toBase64());
    return true;
}

bool decryptSecret(const QString& stored, QString* outPlain, QString* err)
{
    if (err) err->clear();
    if (!outPlain) return false;
    outPlain->clear();

    if (stored.isEmpty())
        return true;

    if (!isEncrypted(stored)) {
        *outPlain = stored;
        return true;
    }

    const QByteArray blob = QByteArray::fromBase64(
        stored.mid(int(sizeof kPrefix) - 1).toLatin1(),
        QByteArray::AbortOnBase64DecodingErrors);

    const int nonceLen = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
    if (blob.size() < nonceLen + (int)crypto_aead_xchacha20poly1305_ietf_ABYTES) {
        if (err) *err = "Stored secret is truncated or not valid base64";
        return false;
    }

    unsigned char key[crypto_aead_xchacha20poly1305_ietf_KEYBYTES];
    if (!profileKey(key, err)) return false;

    const unsigned char* nonce = reinterpret_cast<const unsigned char*>(blob.constData());
    const QByteArray cipher = blob.mid(nonceLen);
    const QByteArray ad(kPrefix);

    QByteArray plain;
    plain.resize(cipher.size() - crypto_aead_xchacha20poly1305_ietf_ABYTES);

    unsigned long long plen = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
        reinterpret_cast<unsigned char*>(plain.data()), &plen,
        nullptr,
        reinterpret_cast<const unsigned char*>(cipher.constData()),
        (unsigned long long)cipher.size(),
        reinterpret_cast<const unsigned char*>(ad.constData()),
        (unsigned long long)ad.size(),
        nonce, key);

    sodium_memzero(key, sizeof key);

    if (rc != 0) {
        sodium_memzero(plain.data(), (size_t)plain.size());
        if (err) *err = "Stored secret could not be decrypted (wrong machine/account or corrupted)";
        return false;
    }

    plain.resize((int)plen);
    *outPlain = QString::fromUtf8(plain);
    sodium_memzero(plain.data(), (size_t)plain.size());
    return true;
}

}
