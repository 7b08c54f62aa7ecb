#include "rematch.hpp"

namespace pong {

void RematchCoordinator::arm() {
    armed_ = true;
    leftReady_ = false;
    rightReady_ = false;
}

RematchCoordinator::Outcome RematchCoordinator::signalReady(PeerRole role) {
    if (!armed_ || !isPlayer(role)) return Outcome::Ignored;
    if (role == PeerRole::Left) leftReady_ = true;
    if (role == PeerRole::Right) rightReady_ = true;
    return (leftReady_ && rightReady_) ? Outcome::BothReady : Outcome::Waiting;
}

void RematchCoordinator::clear() {
    armed_ = false;
    leftReady_ = false;
    rightReady_ = false;
}

bool RematchCoordinator::abort(PeerRole leaver) {
    bool otherWaiting = armed_ && isReady(opponentOf(leaver));
    clear();
    return otherWaiting;
}

bool RematchCoordinator::isReady(PeerRole role) const {
    if (role == PeerRole::Left) return leftReady_;
    if (role == PeerRole::Right) return rightReady_;
    return false;
}

}  // namespace pong
