#include "credential_store.hpp"

#include "file_util.hpp"

#include <cctype>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace pong {

const char* describe(CredentialStatus status) {
    switch (status) {
        case CredentialStatus::Ok: return "ok";
        case CredentialStatus::UsernameTaken: return "username taken";
        case CredentialStatus::UnknownUser: return "unknown user";
        case CredentialStatus::BadPassword: return "bad password";
        case CredentialStatus::InvalidUsername: return "invalid username";
        case CredentialStatus::InvalidPassword: return "invalid password";
        case CredentialStatus::StorageError: return "storage failure";
    }
    return "unknown error";
}

bool IsValidUsername(const std::string& username) {
    if (username.empty() || username.size() > 32) return false;
    for (char c : username) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.')) {
            return false;
        }
    }
    return true;
}

CredentialStore::CredentialStore(std::string path, std::shared_ptr<const PasswordHasher> hasher)
    : path_(std::move(path)), hasher_(std::move(hasher)) {
    if (!hasher_) throw std::invalid_argument("credential store needs a hasher");
    load();
}

void CredentialStore::load() {
    if (!fileExists(path_)) return;
    std::string data = readFile(path_);
    if (data.empty()) return;
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(data);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("user file " + path_ + " is not valid JSON: " + e.what());
    }
    if (!parsed.is_object()) throw std::runtime_error("user file " + path_ + " is not a JSON object");
    for (auto it = parsed.begin(); it != parsed.end(); ++it) {
        if (!it.value().is_string()) {
            throw std::runtime_error("user file " + path_ + " has a non-string digest for " + it.key());
        }
        digests_[it.key()] = it.value().get<std::string>();
    }
}

bool CredentialStore::persistLocked() const {
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& kv : digests_) doc[kv.first] = kv.second;
    return writeFile(path_, doc.dump(2));
}

CredentialStatus CredentialStore::registerUser(const std::string& username, const std::string& password) {
    if (!IsValidUsername(username)) return CredentialStatus::InvalidUsername;
    if (password.empty()) return CredentialStatus::InvalidPassword;
    if (contains(username)) return CredentialStatus::UsernameTaken;

    // The digest is slow to compute; only the check-and-insert is serialized.
    std::string digest = hasher_->hash(password);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!digests_.emplace(username, digest).second) return CredentialStatus::UsernameTaken;
    if (!persistLocked()) {
        digests_.erase(username);
        std::cerr << "[auth] failed to write " << path_ << "\n";
        return CredentialStatus::StorageError;
    }
    return CredentialStatus::Ok;
}

CredentialStatus CredentialStore::verify(const std::string& username, const std::string& password) const {
    std::string digest;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = digests_.find(username);
        if (it == digests_.end()) return CredentialStatus::UnknownUser;
        digest = it->second;
    }
    return hasher_->verify(digest, password) ? CredentialStatus::Ok : CredentialStatus::BadPassword;
}

bool CredentialStore::contains(const std::string& username) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return digests_.count(username) != 0;
}

size_t CredentialStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return digests_.size();
}

}  // namespace pong
