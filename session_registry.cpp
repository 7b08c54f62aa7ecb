#include "session_registry.hpp"

#include <chrono>

namespace pong {

PlayerSlot& SessionRegistry::slotLocked(PeerRole role) {
    return role == PeerRole::Left ? left_ : right_;
}

const PlayerSlot& SessionRegistry::slotLocked(PeerRole role) const {
    return role == PeerRole::Left ? left_ : right_;
}

PeerRole SessionRegistry::assignRole(uint64_t connectionId) {
    std::lock_guard<std::mutex> lock(slotMutex_);
    for (PlayerSlot* s : {&left_, &right_}) {
        if (!s->occupied) {
            s->occupied = true;
            s->connectionId = connectionId;
            s->username.clear();
            return s->role;
        }
    }
    observers_.insert(connectionId);
    return PeerRole::Observer;
}

void SessionRegistry::release(PeerRole role, uint64_t connectionId) {
    std::lock_guard<std::mutex> lock(slotMutex_);
    if (role == PeerRole::Observer) {
        observers_.erase(connectionId);
        return;
    }
    PlayerSlot& s = slotLocked(role);
    if (s.occupied && s.connectionId == connectionId) {
        s = PlayerSlot{role, false, 0, {}};
    }
}

bool SessionRegistry::ownsSlot(PeerRole role, uint64_t connectionId) const {
    if (!isPlayer(role)) return false;
    std::lock_guard<std::mutex> lock(slotMutex_);
    const PlayerSlot& s = slotLocked(role);
    return s.occupied && s.connectionId == connectionId;
}

SessionRegistry::SeatResult SessionRegistry::seatPlayer(PeerRole role, uint64_t connectionId,
                                                        const std::string& username) {
    if (!isPlayer(role)) return SeatResult::NotOwner;
    std::lock_guard<std::mutex> lock(slotMutex_);
    PlayerSlot& s = slotLocked(role);
    if (!s.occupied || s.connectionId != connectionId) return SeatResult::NotOwner;
    const PlayerSlot& other = slotLocked(opponentOf(role));
    if (other.occupied && other.username == username) return SeatResult::AlreadySeated;
    s.username = username;
    return SeatResult::Seated;
}

bool SessionRegistry::bothPlayersSeated() const {
    std::lock_guard<std::mutex> lock(slotMutex_);
    return left_.occupied && !left_.username.empty() && right_.occupied && !right_.username.empty();
}

bool SessionRegistry::anyPlayerConnected() const {
    std::lock_guard<std::mutex> lock(slotMutex_);
    return left_.occupied || right_.occupied;
}

PlayerSlot SessionRegistry::slot(PeerRole role) const {
    std::lock_guard<std::mutex> lock(slotMutex_);
    return slotLocked(role);
}

std::vector<uint64_t> SessionRegistry::evictSeatedPlayers() {
    std::lock_guard<std::mutex> lock(slotMutex_);
    std::vector<uint64_t> evicted;
    for (PlayerSlot* s : {&left_, &right_}) {
        if (!s->occupied || s->username.empty()) continue;
        evicted.push_back(s->connectionId);
        *s = PlayerSlot{s->role, false, 0, {}};
    }
    return evicted;
}

size_t SessionRegistry::observerCount() const {
    std::lock_guard<std::mutex> lock(slotMutex_);
    return observers_.size();
}

void SessionRegistry::broadcastSnapshot(std::shared_ptr<const StateSnapshot> snapshot) {
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        latest_ = std::move(snapshot);
    }
    snapshotCv_.notify_all();
}

std::shared_ptr<const StateSnapshot> SessionRegistry::latestSnapshot() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return latest_;
}

std::shared_ptr<const StateSnapshot> SessionRegistry::waitForSnapshot(uint64_t afterTick, int timeoutMs) const {
    std::unique_lock<std::mutex> lock(snapshotMutex_);
    snapshotCv_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                         [&] { return latest_ && latest_->tick > afterTick; });
    return latest_;
}

void SessionRegistry::wakeAll() {
    snapshotCv_.notify_all();
}

}  // namespace pong
