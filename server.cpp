#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "config.hpp"
#include "connection_handler.hpp"
#include "credential_store.hpp"
#include "crypto.hpp"
#include "game_session.hpp"
#include "leaderboard.hpp"
#include "leaderboard_http.hpp"
#include "line_stream.hpp"
#include "net.hpp"
#include "secure_channel.hpp"
#include "session_registry.hpp"

// Pong game server.
//   TCP  PONG_PORT       -> gameplay: handshake, auth, encrypted input/state lines
//   HTTP PONG_HTTP_PORT  -> read-only leaderboard page
// Storage files (users, leaderboard, key) live in the working directory unless
// overridden, and are created on first run.

static std::atomic<bool> g_stop{false};

extern "C" void __gcov_flush() __attribute__((weak));

void HandleSignal(int) {
    g_stop = true;
}

int main() {
    signal(SIGPIPE, SIG_IGN);
    signal(SIGTERM, HandleSignal);
    signal(SIGINT, HandleSignal);

    const pong::ServerConfig cfg = pong::LoadConfigFromEnv();

    std::shared_ptr<const pong::SecureChannel> channel;
    std::unique_ptr<pong::CredentialStore> credentials;
    std::unique_ptr<pong::Leaderboard> leaderboard;
    try {
        channel = pong::OpenSecureChannel(cfg.keyFile);
        credentials = std::make_unique<pong::CredentialStore>(
            cfg.usersFile, std::make_shared<pong::Pbkdf2Hasher>(cfg.pbkdf2Iterations));
        leaderboard = std::make_unique<pong::Leaderboard>(cfg.leaderboardFile);
    } catch (const std::exception& e) {
        std::cerr << "startup error: " << e.what() << "\n";
        return 1;
    }

    std::string error;
    int serverFd = pong::openTcpListener(cfg.port, error);
    if (serverFd < 0) {
        std::cerr << error << "\n";
        return 1;
    }
    int httpFd = pong::openTcpListener(cfg.httpPort, error);
    if (httpFd < 0) {
        std::cerr << error << "\n";
        close(serverFd);
        return 1;
    }

    pong::CourtConfig court;
    court.winScore = cfg.winScore;
    pong::SessionRegistry registry;
    pong::GameSession session(court, registry, leaderboard.get());

    std::thread tickThread([&session]() { session.run(g_stop); });
    std::thread httpThread(pong::runLeaderboardHttp, httpFd, std::cref(*leaderboard), std::cref(g_stop));

    const pong::HandlerDeps deps{registry, session, *credentials, leaderboard.get(), channel, g_stop, cfg.debugLogs};
    std::atomic<uint64_t> nextId{1};
    std::atomic<int> active{0};

    std::cout << "Pong server listening on 0.0.0.0:" << cfg.port
              << " leaderboard=http://0.0.0.0:" << cfg.httpPort << "/"
              << " users=" << cfg.usersFile << " win=" << cfg.winScore << std::endl;
    while (!g_stop) {
        std::string peer;
        int clientFd = pong::acceptWithTimeout(serverFd, 200, peer);
        if (clientFd < 0) continue;
        const uint64_t id = nextId++;
        ++active;
        std::thread([clientFd, peer, id, &deps, &active]() {
            pong::ConnectionHandler handler(id, std::make_unique<pong::TcpLineStream>(clientFd, peer), deps);
            handler.run();
            --active;
        }).detach();
    }

    close(serverFd);
    registry.wakeAll();
    // Connection threads notice the stop flag within one wait slice.
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (active > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    tickThread.join();
    httpThread.join();
    close(httpFd);
    std::cout << "Pong server stopped" << std::endl;
    if (__gcov_flush) __gcov_flush();
    return 0;
}
