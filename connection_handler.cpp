#include "connection_handler.hpp"

#include "credential_store.hpp"
#include "game_session.hpp"
#include "leaderboard.hpp"
#include "secure_channel.hpp"
#include "session_registry.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace pong {

namespace {

// How long a connection thread sleeps waiting for the next snapshot or auth line
// before re-checking the stop flag.
constexpr int kWaitSliceMs = 100;

std::vector<std::string> splitWords(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> words;
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

}  // namespace

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Authenticating: return "authenticating";
        case ConnectionState::Playing: return "playing";
        case ConnectionState::GameOverWait: return "game-over-wait";
        case ConnectionState::Ready: return "ready";
        case ConnectionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

ConnectionHandler::ConnectionHandler(uint64_t connectionId, std::unique_ptr<LineStream> stream,
                                     const HandlerDeps& deps)
    : id_(connectionId), stream_(std::move(stream)), deps_(deps) {
    if (!stream_) throw std::invalid_argument("connection handler needs a stream");
    if (!deps_.channel) throw std::invalid_argument("connection handler needs a secure channel");
}

void ConnectionHandler::run() {
    role_ = deps_.registry.assignRole(id_);
    state_ = ConnectionState::Connected;
    std::cerr << "[accept] #" << id_ << " " << stream_->peerName() << " is " << roleName(role_) << "\n";

    try {
        const CourtConfig& court = deps_.session.court();
        std::ostringstream hello;
        hello << court.width << " " << court.height << " " << roleName(role_);
        if (!stream_->writeLine(hello.str())) {
            finish("handshake write failed");
            return;
        }
        if (isPlayer(role_)) {
            state_ = ConnectionState::Authenticating;
            if (!authenticate()) {
                finish(closeReason_.empty() ? "authentication aborted" : closeReason_);
                return;
            }
        }
        state_ = ConnectionState::Playing;
        playLoop();
    } catch (const std::exception& e) {
        closeReason_ = std::string("error: ") + e.what();
    }
    finish(closeReason_.empty() ? "closed" : closeReason_);
}

bool ConnectionHandler::authenticate() {
    std::string line;
    while (!deps_.stop) {
        ReadStatus rs = stream_->readLine(line, kWaitSliceMs);
        if (rs == ReadStatus::Timeout) continue;
        if (rs == ReadStatus::Closed) {
            closeReason_ = "peer closed during auth";
            return false;
        }
        if (rs == ReadStatus::Oversized) {
            closeReason_ = "oversized auth line";
            return false;
        }

        auto words = splitWords(line);
        if (words.size() != 3 || (words[0] != "register" && words[0] != "login")) {
            closeReason_ = stream_->writeLine("ERR malformed request") ? "malformed auth line"
                                                                       : "auth reply write failed";
            return false;
        }
        const std::string& user = words[1];
        const std::string& pass = words[2];
        const bool registering = words[0] == "register";

        CredentialStatus status = registering ? deps_.credentials.registerUser(user, pass)
                                              : deps_.credentials.verify(user, pass);
        if (status != CredentialStatus::Ok) {
            std::cerr << "[auth] #" << id_ << " " << words[0] << " " << user << " failed: "
                      << describe(status) << "\n";
            if (!stream_->writeLine(std::string("ERR ") + describe(status))) {
                closeReason_ = "auth reply write failed";
                return false;
            }
            continue;
        }
        if (registering && deps_.leaderboard && !deps_.leaderboard->enroll(user)) {
            std::cerr << "[auth] #" << id_ << " could not add " << user << " to the leaderboard\n";
        }

        switch (deps_.registry.seatPlayer(role_, id_, user)) {
            case SessionRegistry::SeatResult::AlreadySeated:
                if (!stream_->writeLine("ERR already playing")) {
                    closeReason_ = "auth reply write failed";
                    return false;
                }
                continue;
            case SessionRegistry::SeatResult::NotOwner:
                closeReason_ = "slot no longer held";
                return false;
            case SessionRegistry::SeatResult::Seated:
                break;
        }
        username_ = user;
        std::cerr << "[auth] #" << id_ << " " << user << " seated as " << roleName(role_) << "\n";
        return stream_->writeLine(registering ? "OK registered" : "OK logged-in");
    }
    closeReason_ = "server stopping";
    return false;
}

bool ConnectionHandler::handlePlayerLine(const std::string& line) {
    std::string payload;
    if (!deps_.channel->decode(line, payload)) {
        closeReason_ = "undecryptable input";
        return false;
    }
    Intent intent;
    if (parseIntent(payload, intent)) {
        deps_.session.setIntent(role_, intent);
        return true;
    }
    if (payload == "ready" || payload == "reset") {
        auto result = deps_.session.signalReady(role_, id_);
        if (result != GameSession::ReadyResult::Ignored) state_ = ConnectionState::Ready;
        if (deps_.debugLogs) {
            std::cerr << "[input] #" << id_ << " ready -> "
                      << (result == GameSession::ReadyResult::Restarted ? "restart"
                          : result == GameSession::ReadyResult::Waiting ? "waiting" : "ignored")
                      << "\n";
        }
        return true;
    }
    closeReason_ = "unknown command";
    return false;
}

bool ConnectionHandler::drainInput() {
    std::string line;
    while (true) {
        ReadStatus rs = stream_->readLine(line, 0);
        switch (rs) {
            case ReadStatus::Timeout:
                return true;
            case ReadStatus::Closed:
                closeReason_ = "peer closed";
                return false;
            case ReadStatus::Oversized:
                closeReason_ = "oversized line";
                return false;
            case ReadStatus::Line:
                // Observers are read-only; whatever they send is discarded.
                if (isPlayer(role_) && !handlePlayerLine(line)) return false;
                break;
        }
    }
}

void ConnectionHandler::trackPhase(GamePhase phase) {
    ConnectionState current = state_.load();
    switch (phase) {
        case GamePhase::AwaitingPlayers:
        case GamePhase::InProgress:
            state_ = ConnectionState::Playing;
            break;
        case GamePhase::GameOver:
        case GamePhase::AwaitingRematch:
            if (current != ConnectionState::Ready) state_ = ConnectionState::GameOverWait;
            break;
    }
}

bool ConnectionHandler::deliver(const StateSnapshot& snapshot) {
    const std::string out = isPlayer(role_) ? deps_.channel->encode(snapshot.line) : snapshot.line;
    switch (stream_->tryWriteLine(out)) {
        case WriteStatus::Sent:
            return true;
        case WriteStatus::Dropped:
            ++dropped_;
            if (deps_.debugLogs) std::cerr << "[tick] #" << id_ << " slow, dropped tick " << snapshot.tick << "\n";
            return true;
        case WriteStatus::Failed:
            break;
    }
    closeReason_ = "write failed";
    return false;
}

void ConnectionHandler::playLoop() {
    uint64_t lastTick = 0;
    auto latest = deps_.registry.latestSnapshot();
    if (latest) lastTick = latest->tick;

    while (!deps_.stop) {
        if (isPlayer(role_) && !deps_.registry.ownsSlot(role_, id_)) {
            closeReason_ = "session closed";
            return;
        }
        auto snap = deps_.registry.waitForSnapshot(lastTick, kWaitSliceMs);
        if (!drainInput()) return;
        if (!snap || snap->tick <= lastTick) continue;
        lastTick = snap->tick;
        trackPhase(snap->phase);
        if (!deliver(*snap)) return;
    }
    closeReason_ = "server stopping";
}

void ConnectionHandler::finish(const std::string& reason) {
    deps_.session.playerLeft(role_, id_);
    stream_->close();
    state_ = ConnectionState::Disconnected;
    std::cerr << "[accept] #" << id_ << " " << roleName(role_)
              << (username_.empty() ? "" : " (" + username_ + ")") << " disconnected: " << reason << "\n";
}

}  // namespace pong
