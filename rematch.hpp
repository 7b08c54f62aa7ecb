#pragma once

#include "game_types.hpp"

namespace pong {

// Ready flags of the two player slots after a game has ended.
// Not synchronized; the game session calls it under its own lock.
class RematchCoordinator {
public:
    enum class Outcome {
        Ignored,    // not armed, or the signal came from an observer
        Waiting,    // flag recorded, the other side has not signalled yet
        BothReady,
    };

    // Entering GAME_OVER: both flags cleared, signals accepted from now on.
    void arm();
    Outcome signalReady(PeerRole role);
    // Rematch started or session over: flags cleared, signals ignored.
    void clear();
    // A player left while the coordinator was armed. Returns true when the other side
    // had already signalled, i.e. a waiting player has to be released.
    bool abort(PeerRole leaver);

    bool armed() const { return armed_; }
    bool isReady(PeerRole role) const;

private:
    bool armed_{false};
    bool leftReady_{false};
    bool rightReady_{false};
};

}  // namespace pong
