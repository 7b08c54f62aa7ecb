#pragma once

#include <string>

// Runtime settings, read once from the environment at startup.
//   PONG_PORT               -> gameplay TCP listener (6000)
//   PONG_HTTP_PORT          -> leaderboard page listener (8080)
//   PONG_USERS_FILE         -> credential records (users.json)
//   PONG_LEADERBOARD_FILE   -> win counts (leaderboard.json)
//   PONG_KEY_FILE           -> shared channel key (pong.key)
//   PONG_WIN_SCORE          -> points needed to win a game (5)
//   PONG_PBKDF2_ITERATIONS  -> password hashing cost (200000)
//   PONG_DEBUG              -> verbose per-connection logging (0)

namespace pong {

static const int kDefaultPort = 6000;
static const int kDefaultHttpPort = 8080;
static const char* const kDefaultUsersFile = "users.json";
static const char* const kDefaultLeaderboardFile = "leaderboard.json";
static const char* const kDefaultKeyFile = "pong.key";
static const int kDefaultWinScore = 5;
static const int kDefaultPbkdf2Iterations = 200000;

struct ServerConfig {
    int port{kDefaultPort};
    int httpPort{kDefaultHttpPort};
    std::string usersFile{kDefaultUsersFile};
    std::string leaderboardFile{kDefaultLeaderboardFile};
    std::string keyFile{kDefaultKeyFile};
    int winScore{kDefaultWinScore};
    int pbkdf2Iterations{kDefaultPbkdf2Iterations};
    bool debugLogs{false};
};

int GetPort();
int GetHttpPort();
std::string GetEnvString(const char* name, const std::string& fallback);
int GetEnvInt(const char* name, int fallback, int minValue, int maxValue);

ServerConfig LoadConfigFromEnv();

}  // namespace pong
