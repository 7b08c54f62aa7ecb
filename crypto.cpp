#include "crypto.hpp"

#include "file_util.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <memory>
#include <stdexcept>
#include <vector>

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace pong {

namespace {

constexpr unsigned char kFernetVersion = 0x80;
constexpr size_t kIvLen = 16;
constexpr size_t kMacLen = 32;
constexpr size_t kHeaderLen = 1 + 8 + kIvLen;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

bool isBase64Text(const std::string& s) {
    if (s.empty() || s.size() % 4 != 0) return false;
    size_t pad = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '=') {
            ++pad;
            continue;
        }
        if (pad > 0) return false;
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/')) return false;
    }
    return pad <= 2;
}

}  // namespace

std::string base64Encode(const unsigned char* input, size_t len) {
    BIO* bmem = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    b64 = BIO_push(b64, bmem);
    BIO_write(b64, input, static_cast<int>(len));
    (void)BIO_flush(b64);
    BUF_MEM* bptr;
    BIO_get_mem_ptr(b64, &bptr);
    std::string out(bptr->data, bptr->length);
    BIO_free_all(b64);
    return out;
}

std::string base64Encode(const std::string& input) {
    return base64Encode(reinterpret_cast<const unsigned char*>(input.data()), input.size());
}

bool base64Decode(const std::string& input, std::string& out) {
    if (!isBase64Text(input)) return false;
    BIO* bmem = BIO_new_mem_buf(input.data(), static_cast<int>(input.size()));
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    b64 = BIO_push(b64, bmem);
    std::vector<char> buf(input.size());
    size_t got = 0;
    while (got < buf.size()) {
        int r = BIO_read(b64, buf.data() + got, static_cast<int>(buf.size() - got));
        if (r <= 0) break;
        got += static_cast<size_t>(r);
    }
    BIO_free_all(b64);
    size_t pad = static_cast<size_t>(std::count(input.end() - 2, input.end(), '='));
    if (got != input.size() / 4 * 3 - pad) return false;
    out.assign(buf.data(), got);
    return true;
}

std::string base64UrlEncode(const std::string& input) {
    std::string out = base64Encode(input);
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

bool base64UrlDecode(const std::string& input, std::string& out) {
    if (input.find_first_of("+/") != std::string::npos) return false;
    std::string std64 = input;
    std::replace(std64.begin(), std64.end(), '-', '+');
    std::replace(std64.begin(), std64.end(), '_', '/');
    return base64Decode(std64, out);
}

bool randomBytes(unsigned char* out, size_t len) {
    return RAND_bytes(out, static_cast<int>(len)) == 1;
}

// --------------------
// Pbkdf2Hasher
// --------------------
Pbkdf2Hasher::Pbkdf2Hasher(int iterations) : iterations_(iterations > 0 ? iterations : 1) {}

bool Pbkdf2Hasher::derive(const std::string& password, const unsigned char* salt, unsigned char* out) const {
    return PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                             salt, static_cast<int>(kSaltLen), iterations_, EVP_sha256(),
                             static_cast<int>(kKeyLen), out) == 1;
}

std::string Pbkdf2Hasher::hash(const std::string& password) const {
    unsigned char buf[kSaltLen + kKeyLen];
    if (!randomBytes(buf, kSaltLen)) throw std::runtime_error("RAND_bytes failed");
    if (!derive(password, buf, buf + kSaltLen)) throw std::runtime_error("PBKDF2 failed");
    return base64Encode(buf, sizeof(buf));
}

bool Pbkdf2Hasher::verify(const std::string& digest, const std::string& password) const {
    std::string raw;
    if (!base64Decode(digest, raw) || raw.size() != kSaltLen + kKeyLen) return false;
    const auto* stored = reinterpret_cast<const unsigned char*>(raw.data());
    unsigned char check[kKeyLen];
    if (!derive(password, stored, check)) return false;
    return CRYPTO_memcmp(check, stored + kSaltLen, kKeyLen) == 0;
}

// --------------------
// FernetCipher
// --------------------
FernetCipher::FernetCipher(const std::string& rawKey) {
    if (rawKey.size() != kKeyLen) throw std::invalid_argument("fernet key must be 32 bytes");
    std::memcpy(signingKey_, rawKey.data(), 16);
    std::memcpy(encryptionKey_, rawKey.data() + 16, 16);
}

std::string FernetCipher::generateKey() {
    unsigned char key[kKeyLen];
    if (!randomBytes(key, sizeof(key))) throw std::runtime_error("RAND_bytes failed");
    return std::string(reinterpret_cast<char*>(key), sizeof(key));
}

std::string FernetCipher::encrypt(const std::string& plaintext) const {
    std::string token;
    token.reserve(kHeaderLen + plaintext.size() + 16 + kMacLen);
    token.push_back(static_cast<char>(kFernetVersion));
    uint64_t ts = static_cast<uint64_t>(std::time(nullptr));
    for (int shift = 56; shift >= 0; shift -= 8) {
        token.push_back(static_cast<char>((ts >> shift) & 0xFF));
    }
    unsigned char iv[kIvLen];
    if (!randomBytes(iv, sizeof(iv))) throw std::runtime_error("RAND_bytes failed");
    token.append(reinterpret_cast<char*>(iv), sizeof(iv));

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, encryptionKey_, iv) != 1) {
        throw std::runtime_error("AES init failed");
    }
    std::vector<unsigned char> ct(plaintext.size() + 16);
    int len = 0;
    int total = 0;
    if (EVP_EncryptUpdate(ctx.get(), ct.data(), &len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("AES encrypt failed");
    }
    total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), ct.data() + total, &len) != 1) {
        throw std::runtime_error("AES finalize failed");
    }
    total += len;
    token.append(reinterpret_cast<char*>(ct.data()), static_cast<size_t>(total));

    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int macLen = 0;
    if (!HMAC(EVP_sha256(), signingKey_, sizeof(signingKey_),
              reinterpret_cast<const unsigned char*>(token.data()), token.size(), mac, &macLen) ||
        macLen != kMacLen) {
        throw std::runtime_error("HMAC failed");
    }
    token.append(reinterpret_cast<char*>(mac), macLen);
    return base64UrlEncode(token);
}

bool FernetCipher::decrypt(const std::string& token, std::string& plaintext) const {
    std::string raw;
    if (!base64UrlDecode(token, raw)) return false;
    if (raw.size() < kHeaderLen + 16 + kMacLen) return false;
    if (static_cast<unsigned char>(raw[0]) != kFernetVersion) return false;
    size_t ctLen = raw.size() - kHeaderLen - kMacLen;
    if (ctLen % 16 != 0) return false;

    const auto* bytes = reinterpret_cast<const unsigned char*>(raw.data());
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int macLen = 0;
    if (!HMAC(EVP_sha256(), signingKey_, sizeof(signingKey_), bytes, raw.size() - kMacLen, mac, &macLen) ||
        macLen != kMacLen || CRYPTO_memcmp(mac, bytes + raw.size() - kMacLen, kMacLen) != 0) {
        return false;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, encryptionKey_, bytes + 9) != 1) {
        return false;
    }
    std::vector<unsigned char> pt(ctLen + 16);
    int len = 0;
    int total = 0;
    if (EVP_DecryptUpdate(ctx.get(), pt.data(), &len, bytes + kHeaderLen, static_cast<int>(ctLen)) != 1) {
        return false;
    }
    total = len;
    if (EVP_DecryptFinal_ex(ctx.get(), pt.data() + total, &len) != 1) return false;
    total += len;
    plaintext.assign(reinterpret_cast<char*>(pt.data()), static_cast<size_t>(total));
    return true;
}

std::string LoadOrCreateKey(const std::string& path) {
    if (fileExists(path)) {
        std::string text = readFile(path);
        text.erase(std::remove_if(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); }),
                   text.end());
        std::string raw;
        if (!base64UrlDecode(text, raw) || raw.size() != FernetCipher::kKeyLen) {
            throw std::runtime_error("key file " + path + " does not hold a 32 byte url-safe base64 key");
        }
        return raw;
    }

    std::string raw = FernetCipher::generateKey();
    std::string encoded = base64UrlEncode(raw) + "\n";
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
    if (fd < 0) throw std::runtime_error("cannot create key file " + path);
    ssize_t n = ::write(fd, encoded.data(), encoded.size());
    ::close(fd);
    if (n != static_cast<ssize_t>(encoded.size())) {
        throw std::runtime_error("cannot write key file " + path);
    }
    return raw;
}

}  // namespace pong
