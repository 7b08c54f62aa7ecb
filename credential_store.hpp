#pragma once

#include "crypto.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace pong {

enum class CredentialStatus {
    Ok,
    UsernameTaken,
    UnknownUser,
    BadPassword,
    InvalidUsername,
    InvalidPassword,
    StorageError,
};

// Text used after "ERR " on the auth line.
const char* describe(CredentialStatus status);

bool IsValidUsername(const std::string& username);

// Registered users and their salted digests, persisted as one JSON object
// { "<username>": "<digest>" } that is rewritten whole on every registration.
class CredentialStore {
public:
    // Throws std::runtime_error when `path` exists but is not a valid record file.
    CredentialStore(std::string path, std::shared_ptr<const PasswordHasher> hasher);

    CredentialStore(const CredentialStore&) = delete;
    CredentialStore& operator=(const CredentialStore&) = delete;

    // First writer wins: of two concurrent registrations of one name exactly one gets Ok.
    CredentialStatus registerUser(const std::string& username, const std::string& password);
    CredentialStatus verify(const std::string& username, const std::string& password) const;

    bool contains(const std::string& username) const;
    size_t size() const;

private:
    void load();
    bool persistLocked() const;

    std::string path_;
    std::shared_ptr<const PasswordHasher> hasher_;
    std::map<std::string, std::string> digests_;
    mutable std::mutex mutex_;
};

}  // namespace pong
