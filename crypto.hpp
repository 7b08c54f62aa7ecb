#pragma once

#include <cstddef>
#include <string>

namespace pong {

// --------------------
// Encoding helpers
// --------------------
std::string base64Encode(const unsigned char* input, size_t len);
std::string base64Encode(const std::string& input);
bool base64Decode(const std::string& input, std::string& out);
// RFC 4648 section 5 alphabet ('-' and '_'), padded.
std::string base64UrlEncode(const std::string& input);
bool base64UrlDecode(const std::string& input, std::string& out);

bool randomBytes(unsigned char* out, size_t len);

// --------------------
// Password hashing
// --------------------
class PasswordHasher {
public:
    virtual ~PasswordHasher() = default;
    // One-way salted digest, printable so it can be stored in a JSON record.
    virtual std::string hash(const std::string& password) const = 0;
    virtual bool verify(const std::string& digest, const std::string& password) const = 0;
};

// PBKDF2-HMAC-SHA256, stored as base64(salt || derived key).
class Pbkdf2Hasher : public PasswordHasher {
public:
    static constexpr size_t kSaltLen = 16;
    static constexpr size_t kKeyLen = 32;

    explicit Pbkdf2Hasher(int iterations);

    std::string hash(const std::string& password) const override;
    bool verify(const std::string& digest, const std::string& password) const override;

private:
    bool derive(const std::string& password, const unsigned char* salt, unsigned char* out) const;

    int iterations_;
};

// --------------------
// Symmetric envelope
// --------------------
class Cipher {
public:
    virtual ~Cipher() = default;
    virtual std::string encrypt(const std::string& plaintext) const = 0;
    // False when the token is malformed, was produced under another key or was altered.
    virtual bool decrypt(const std::string& token, std::string& plaintext) const = 0;
};

// Fernet tokens: 0x80 | timestamp(8, big endian) | iv(16) | AES-128-CBC ciphertext | HMAC-SHA256(32),
// URL-safe base64 encoded. The 32 byte key is the signing key followed by the encryption key.
class FernetCipher : public Cipher {
public:
    static constexpr size_t kKeyLen = 32;

    explicit FernetCipher(const std::string& rawKey);

    std::string encrypt(const std::string& plaintext) const override;
    bool decrypt(const std::string& token, std::string& plaintext) const override;

    static std::string generateKey();

private:
    unsigned char signingKey_[16];
    unsigned char encryptionKey_[16];
};

// Reads the URL-safe base64 key from `path`, creating the file with a fresh random key
// when it does not exist. Returns the 32 raw key bytes; throws std::runtime_error when the
// file is unreadable or holds something that is not a key.
std::string LoadOrCreateKey(const std::string& path);

}  // namespace pong
