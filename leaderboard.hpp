#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace pong {

struct LeaderboardEntry {
    std::string user;
    int wins{0};
};

// Win counts persisted as { "entries": [ { "user": ..., "wins": ... } ] }.
// Entry order is insertion order and breaks ties in topN.
class Leaderboard {
public:
    // Throws std::runtime_error when `path` exists but is not a valid leaderboard file.
    explicit Leaderboard(std::string path);

    Leaderboard(const Leaderboard&) = delete;
    Leaderboard& operator=(const Leaderboard&) = delete;

    // Adds `user` with zero wins if it has no entry yet.
    bool enroll(const std::string& user);
    // One call is one win. Returns only after the file has been rewritten.
    bool recordWin(const std::string& user);

    std::vector<LeaderboardEntry> topN(size_t n) const;
    int winsFor(const std::string& user) const;

private:
    void load();
    bool persistLocked() const;
    std::vector<LeaderboardEntry>::iterator findLocked(const std::string& user);

    std::string path_;
    std::vector<LeaderboardEntry> entries_;
    mutable std::mutex mutex_;
};

}  // namespace pong
