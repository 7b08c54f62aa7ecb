#pragma once

#include "game_types.hpp"
#include "line_stream.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace pong {

class CredentialStore;
class GameSession;
class Leaderboard;
class SecureChannel;
class SessionRegistry;

enum class ConnectionState {
    Connected,
    Authenticating,
    Playing,
    GameOverWait,
    Ready,
    Disconnected,
};

const char* connectionStateName(ConnectionState state);

struct HandlerDeps {
    SessionRegistry& registry;
    GameSession& session;
    CredentialStore& credentials;
    Leaderboard* leaderboard;  // may be null
    std::shared_ptr<const SecureChannel> channel;
    const std::atomic<bool>& stop;
    bool debugLogs;
};

// Drives one peer through handshake, authentication (players only) and gameplay.
// run() blocks on the calling thread until the peer is gone or the server stops;
// on the way out the peer's slot is handed back.
class ConnectionHandler {
public:
    ConnectionHandler(uint64_t connectionId, std::unique_ptr<LineStream> stream, const HandlerDeps& deps);

    ConnectionHandler(const ConnectionHandler&) = delete;
    ConnectionHandler& operator=(const ConnectionHandler&) = delete;

    void run();

    uint64_t connectionId() const { return id_; }
    PeerRole role() const { return role_; }
    ConnectionState state() const { return state_.load(); }
    // Snapshots skipped because the peer was not keeping up.
    uint64_t droppedSnapshots() const { return dropped_.load(); }

private:
    bool authenticate();
    void playLoop();
    bool handlePlayerLine(const std::string& line);
    bool drainInput();
    bool deliver(const StateSnapshot& snapshot);
    void trackPhase(GamePhase phase);
    void finish(const std::string& reason);

    const uint64_t id_;
    std::unique_ptr<LineStream> stream_;
    HandlerDeps deps_;
    PeerRole role_{PeerRole::Observer};
    std::string username_;
    std::atomic<ConnectionState> state_{ConnectionState::Connected};
    std::atomic<uint64_t> dropped_{0};
    std::string closeReason_;
};

}  // namespace pong
