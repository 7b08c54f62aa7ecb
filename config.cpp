#include "config.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace pong {

int GetEnvInt(const char* name, int fallback, int minValue, int maxValue) {
    const char* env = std::getenv(name);
    if (!env || !*env) return fallback;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(env, &end, 10);
    if (errno != 0 || end == env || *end != '\0') return fallback;
    if (v < minValue || v > maxValue) return fallback;
    return static_cast<int>(v);
}

std::string GetEnvString(const char* name, const std::string& fallback) {
    const char* env = std::getenv(name);
    if (env && *env) return std::string(env);
    return fallback;
}

int GetPort() {
    return GetEnvInt("PONG_PORT", kDefaultPort, 1, 65535);
}

int GetHttpPort() {
    return GetEnvInt("PONG_HTTP_PORT", kDefaultHttpPort, 1, 65535);
}

ServerConfig LoadConfigFromEnv() {
    ServerConfig cfg;
    cfg.port = GetPort();
    cfg.httpPort = GetHttpPort();
    cfg.usersFile = GetEnvString("PONG_USERS_FILE", kDefaultUsersFile);
    cfg.leaderboardFile = GetEnvString("PONG_LEADERBOARD_FILE", kDefaultLeaderboardFile);
    cfg.keyFile = GetEnvString("PONG_KEY_FILE", kDefaultKeyFile);
    cfg.winScore = GetEnvInt("PONG_WIN_SCORE", kDefaultWinScore, 1, 1000);
    cfg.pbkdf2Iterations = GetEnvInt("PONG_PBKDF2_ITERATIONS", kDefaultPbkdf2Iterations, 1, INT_MAX);
    cfg.debugLogs = GetEnvInt("PONG_DEBUG", 0, 0, 1) == 1;
    return cfg;
}

}  // namespace pong
