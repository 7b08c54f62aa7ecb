#include "leaderboard_http.hpp"

#include "net.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>

namespace pong {

namespace {

std::string htmlEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

size_t parseRowCount(const std::string& query) {
    auto pos = query.find("n=");
    if (pos == std::string::npos || (pos > 0 && query[pos - 1] != '&')) return kDefaultLeaderboardRows;
    long n = std::atol(query.c_str() + pos + 2);
    if (n <= 0) return kDefaultLeaderboardRows;
    if (static_cast<size_t>(n) > kMaxLeaderboardRows) return kMaxLeaderboardRows;
    return static_cast<size_t>(n);
}

}  // namespace

std::string httpResponse(const std::string& body, const std::string& status, const std::string& contentType) {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << status << "\r\n";
    ss << "Access-Control-Allow-Origin: *\r\n";
    ss << "Content-Type: " << contentType << "\r\n";
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n\r\n";
    ss << body;
    return ss.str();
}

std::string renderLeaderboardJson(const std::vector<LeaderboardEntry>& entries) {
    nlohmann::json list = nlohmann::json::array();
    int rank = 1;
    for (const auto& e : entries) {
        list.push_back({{"rank", rank++}, {"user", e.user}, {"wins", e.wins}});
    }
    return nlohmann::json{{"entries", list}}.dump();
}

std::string renderLeaderboardHtml(const std::vector<LeaderboardEntry>& entries) {
    std::ostringstream ss;
    ss << "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><title>Pong leaderboard</title></head>\n"
       << "<body><h1>Leaderboard</h1>\n<table>\n<tr><th>#</th><th>Player</th><th>Wins</th></tr>\n";
    int rank = 1;
    for (const auto& e : entries) {
        ss << "<tr><td>" << rank++ << "</td><td>" << htmlEscape(e.user) << "</td><td>" << e.wins
           << "</td></tr>\n";
    }
    if (entries.empty()) ss << "<tr><td colspan=\"3\">No games played yet.</td></tr>\n";
    ss << "</table></body></html>\n";
    return ss.str();
}

std::string handleLeaderboardRequest(const std::string& request, const Leaderboard& board) {
    // Very minimal parsing: request line only.
    auto posMethodEnd = request.find(' ');
    if (posMethodEnd == std::string::npos) {
        return httpResponse(R"({"error":"bad request"})", "400 Bad Request");
    }
    auto posPathEnd = request.find(' ', posMethodEnd + 1);
    if (posPathEnd == std::string::npos) {
        return httpResponse(R"({"error":"bad request"})", "400 Bad Request");
    }
    std::string method = request.substr(0, posMethodEnd);
    std::string target = request.substr(posMethodEnd + 1, posPathEnd - posMethodEnd - 1);
    std::string path = target;
    std::string query;
    auto q = target.find('?');
    if (q != std::string::npos) {
        path = target.substr(0, q);
        query = target.substr(q + 1);
    }

    if (method != "GET") {
        return httpResponse(R"({"error":"method not allowed"})", "405 Method Not Allowed");
    }
    if (path == "/" || path == "/index.html") {
        return httpResponse(renderLeaderboardHtml(board.topN(kDefaultLeaderboardRows)), "200 OK",
                            "text/html; charset=utf-8");
    }
    if (path == "/leaderboard") {
        return httpResponse(renderLeaderboardJson(board.topN(parseRowCount(query))));
    }
    return httpResponse(R"({"error":"not found"})", "404 Not Found");
}

void runLeaderboardHttp(int listenFd, const Leaderboard& board, const std::atomic<bool>& stop) {
    std::atomic<int> inFlight{0};
    while (!stop) {
        std::string peer;
        int clientFd = acceptWithTimeout(listenFd, 200, peer);
        if (clientFd < 0) continue;
        ++inFlight;
        std::thread([clientFd, &board, &inFlight]() {
            timeval tv{};
            tv.tv_sec = 5;
            setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            setsockopt(clientFd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
            char buf[8192];
            ssize_t n = recv(clientFd, buf, sizeof(buf), 0);
            if (n > 0) {
                std::string resp = handleLeaderboardRequest(std::string(buf, static_cast<size_t>(n)), board);
                if (send(clientFd, resp.data(), resp.size(), MSG_NOSIGNAL) < 0) {
                    std::cerr << "[http] send failed\n";
                }
            }
            close(clientFd);
            --inFlight;
        }).detach();
    }
    // Request threads reference `board` and `inFlight`; their socket timeouts bound this wait.
    while (inFlight > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

}  // namespace pong
