#pragma once
#include <QString>

// =====================================================
// ProfileCipher
// =====================================================
//
// Purpose
// -------
// Keeps saved profile passwords out of profiles.json in clear text.
//
// What it DOES
// ------------
// - Encrypts a password with XChaCha20-Poly1305 (libsodium) under a key
//   derived with Argon2id from a machine + user specific string.
// - Produces/consumes "sb1:<base64(nonce || ciphertext)>".
//
// What it does NOT do
// -------------------
// - It is not protection against someone running as the same user on the
//   same machine. It stops casual disclosure (backups, screenshots, sharing
//   the JSON file).
//
// Notes
// -----
// - The derived key is computed once per process and cached.
// - Values without the "sb1:" prefix are treated as legacy clear text.

namespace ProfileCipher {

inline constexpr char kPrefix[] = "sb1:";

bool isEncrypted(const QString& stored);

// Empty plain text encrypts to an empty string.
bool encryptSecret(const QString& plain, QString* outStored, QString* err = nullptr);

// Fails (err set, outPlain cleared) on a corrupt value or a value written
// on another machine/account.
bool decryptSecret(const QString& stored, QString* outPlain, QString* err = nullptr);

}
