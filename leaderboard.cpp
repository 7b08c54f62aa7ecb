#include "leaderboard.hpp"

#include "file_util.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace pong {

Leaderboard::Leaderboard(std::string path) : path_(std::move(path)) {
    load();
}

void Leaderboard::load() {
    if (!fileExists(path_)) return;
    std::string data = readFile(path_);
    if (data.empty()) return;
    try {
        auto parsed = nlohmann::json::parse(data);
        for (const auto& e : parsed.at("entries")) {
            LeaderboardEntry entry;
            entry.user = e.at("user").get<std::string>();
            entry.wins = e.at("wins").get<int>();
            if (entry.wins < 0) throw std::runtime_error("negative win count for " + entry.user);
            if (findLocked(entry.user) == entries_.end()) entries_.push_back(entry);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("leaderboard file " + path_ + " is invalid: " + e.what());
    }
}

bool Leaderboard::persistLocked() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& e : entries_) {
        list.push_back({{"user", e.user}, {"wins", e.wins}});
    }
    nlohmann::json doc = {{"entries", list}};
    return writeFile(path_, doc.dump(2));
}

std::vector<LeaderboardEntry>::iterator Leaderboard::findLocked(const std::string& user) {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&](const LeaderboardEntry& e) { return e.user == user; });
}

bool Leaderboard::enroll(const std::string& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (findLocked(user) != entries_.end()) return true;
    entries_.push_back({user, 0});
    if (!persistLocked()) {
        entries_.pop_back();
        std::cerr << "[leaderboard] failed to write " << path_ << "\n";
        return false;
    }
    return true;
}

bool Leaderboard::recordWin(const std::string& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = findLocked(user);
    bool added = false;
    if (it == entries_.end()) {
        entries_.push_back({user, 0});
        it = entries_.end() - 1;
        added = true;
    }
    ++it->wins;
    if (!persistLocked()) {
        if (added) {
            entries_.pop_back();
        } else {
            --it->wins;
        }
        std::cerr << "[leaderboard] failed to write " << path_ << "\n";
        return false;
    }
    return true;
}

std::vector<LeaderboardEntry> Leaderboard::topN(size_t n) const {
    std::vector<LeaderboardEntry> ranked;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ranked = entries_;
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const LeaderboardEntry& a, const LeaderboardEntry& b) { return a.wins > b.wins; });
    if (ranked.size() > n) ranked.resize(n);
    return ranked;
}

int Leaderboard::winsFor(const std::string& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : entries_) {
        if (e.user == user) return e.wins;
    }
    return 0;
}

}  // namespace pong
