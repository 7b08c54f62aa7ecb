#pragma once

#include "leaderboard.hpp"

#include <atomic>
#include <string>
#include <vector>

// Read-only leaderboard page.
// Endpoints:
//   GET /               -> HTML table of the top 10
//   GET /leaderboard    -> {"entries":[{"rank":1,"user":"...","wins":3},...]}, ?n=<count> (default 10)
// Anything else is 404 (405 for non-GET). Every response closes the connection.

namespace pong {

static const size_t kDefaultLeaderboardRows = 10;
static const size_t kMaxLeaderboardRows = 100;

std::string httpResponse(const std::string& body, const std::string& status = "200 OK",
                         const std::string& contentType = "application/json");

std::string renderLeaderboardJson(const std::vector<LeaderboardEntry>& entries);
std::string renderLeaderboardHtml(const std::vector<LeaderboardEntry>& entries);

// Full HTTP response for one raw request.
std::string handleLeaderboardRequest(const std::string& request, const Leaderboard& board);

// Accepts on `listenFd` until `stop` is set, one short-lived thread per request.
// Returns once every request thread has finished.
void runLeaderboardHttp(int listenFd, const Leaderboard& board, const std::atomic<bool>& stop);

}  // namespace pong
