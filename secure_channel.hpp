#pragma once

#include "crypto.hpp"

#include <memory>
#include <string>

namespace pong {

// Player-facing gameplay traffic after authentication. One instance per process,
// built from the key loaded at startup and never mutated afterwards.
class SecureChannel {
public:
    explicit SecureChannel(std::shared_ptr<const Cipher> cipher);

    std::string encode(const std::string& plaintext) const;
    // False on a corrupt envelope or one sealed under another key.
    bool decode(const std::string& envelope, std::string& plaintext) const;

private:
    std::shared_ptr<const Cipher> cipher_;
};

// Loads (or creates) the key file and builds the process-wide channel.
std::shared_ptr<const SecureChannel> OpenSecureChannel(const std::string& keyFile);

}  // namespace pong
