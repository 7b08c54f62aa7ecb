#pragma once

#include "game_types.hpp"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace pong {

struct PlayerSlot {
    PeerRole role{PeerRole::Left};
    bool occupied{false};
    uint64_t connectionId{0};
    std::string username;  // empty until the player authenticates
};

// Who is connected in which role, plus the latest published snapshot.
//
// Roles are handed out in connection order: the first free player slot (LEFT before
// RIGHT), otherwise OBSERVER. Slot operations are serialized on one mutex, so two
// connects never receive the same player role.
//
// Snapshots are not pushed to peers from here. The tick loop swaps in an immutable
// snapshot and every connection thread picks up the newest one at its own pace, so a
// stalled peer only ever delays itself.
class SessionRegistry {
public:
    SessionRegistry() = default;
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    PeerRole assignRole(uint64_t connectionId);
    // Ignored unless `connectionId` currently holds `role` (slots may have been evicted).
    void release(PeerRole role, uint64_t connectionId);
    bool ownsSlot(PeerRole role, uint64_t connectionId) const;

    enum class SeatResult { Seated, NotOwner, AlreadySeated };
    // Attaches an authenticated username to the caller's slot. A name can sit in one slot only.
    SeatResult seatPlayer(PeerRole role, uint64_t connectionId, const std::string& username);

    bool bothPlayersSeated() const;
    bool anyPlayerConnected() const;
    PlayerSlot slot(PeerRole role) const;
    // Frees every slot whose player has authenticated and returns the connection ids that
    // held them. A connection still authenticating keeps its slot.
    std::vector<uint64_t> evictSeatedPlayers();
    size_t observerCount() const;

    void broadcastSnapshot(std::shared_ptr<const StateSnapshot> snapshot);
    std::shared_ptr<const StateSnapshot> latestSnapshot() const;
    // Waits up to timeoutMs for a snapshot with tick > afterTick. Returns the latest
    // snapshot either way (null before the first publication).
    std::shared_ptr<const StateSnapshot> waitForSnapshot(uint64_t afterTick, int timeoutMs) const;
    // Wakes every waiter; used on shutdown.
    void wakeAll();

private:
    PlayerSlot& slotLocked(PeerRole role);
    const PlayerSlot& slotLocked(PeerRole role) const;

    mutable std::mutex slotMutex_;
    PlayerSlot left_{PeerRole::Left, false, 0, {}};
    PlayerSlot right_{PeerRole::Right, false, 0, {}};
    std::set<uint64_t> observers_;

    mutable std::mutex snapshotMutex_;
    mutable std::condition_variable snapshotCv_;
    std::shared_ptr<const StateSnapshot> latest_;
};

}  // namespace pong
