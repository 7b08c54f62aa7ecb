#include "secure_channel.hpp"

#include <stdexcept>

namespace pong {

SecureChannel::SecureChannel(std::shared_ptr<const Cipher> cipher) : cipher_(std::move(cipher)) {
    if (!cipher_) throw std::invalid_argument("secure channel needs a cipher");
}

std::string SecureChannel::encode(const std::string& plaintext) const {
    return cipher_->encrypt(plaintext);
}

bool SecureChannel::decode(const std::string& envelope, std::string& plaintext) const {
    if (envelope.empty()) return false;
    return cipher_->decrypt(envelope, plaintext);
}

std::shared_ptr<const SecureChannel> OpenSecureChannel(const std::string& keyFile) {
    auto cipher = std::make_shared<FernetCipher>(LoadOrCreateKey(keyFile));
    return std::make_shared<SecureChannel>(std::move(cipher));
}

}  // namespace pong
