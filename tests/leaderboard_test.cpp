#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "file_util.hpp"
#include "leaderboard.hpp"
#include "leaderboard_http.hpp"
#include "net.hpp"

namespace {

class LeaderboardTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = "/tmp/pong_leaderboard_test.json";
    std::filesystem::remove(path_);
  }
  void TearDown() override {
    std::filesystem::remove(path_);
    std::filesystem::remove(path_ + ".tmp");
  }

  std::string path_;
};

std::string Body(const std::string& response) {
  auto pos = response.find("\r\n\r\n");
  return pos == std::string::npos ? std::string() : response.substr(pos + 4);
}

std::string StatusLine(const std::string& response) {
  return response.substr(0, response.find("\r\n"));
}

}  // namespace

TEST_F(LeaderboardTest, RecordWinIncrementsAndPersists) {
  {
    pong::Leaderboard board(path_);
    ASSERT_TRUE(board.recordWin("alice"));
    ASSERT_TRUE(board.recordWin("alice"));
    ASSERT_TRUE(board.recordWin("bob"));
    EXPECT_EQ(2, board.winsFor("alice"));
    EXPECT_EQ(1, board.winsFor("bob"));
  }
  auto doc = nlohmann::json::parse(pong::readFile(path_));
  ASSERT_EQ(2u, doc["entries"].size());
  EXPECT_EQ("alice", doc["entries"][0]["user"].get<std::string>());
  EXPECT_EQ(2, doc["entries"][0]["wins"].get<int>());

  pong::Leaderboard reloaded(path_);
  EXPECT_EQ(2, reloaded.winsFor("alice"));
  EXPECT_EQ(1, reloaded.winsFor("bob"));
  EXPECT_EQ(0, reloaded.winsFor("carol"));
}

TEST_F(LeaderboardTest, TopNOrdersByWinsAndKeepsInsertionOrderForTies) {
  pong::Leaderboard board(path_);
  ASSERT_TRUE(board.enroll("first"));
  ASSERT_TRUE(board.enroll("second"));
  ASSERT_TRUE(board.enroll("third"));
  ASSERT_TRUE(board.recordWin("third"));
  ASSERT_TRUE(board.recordWin("second"));

  auto top = board.topN(10);
  ASSERT_EQ(3u, top.size());
  EXPECT_EQ("second", top[0].user);
  EXPECT_EQ("third", top[1].user);
  EXPECT_EQ("first", top[2].user);
  EXPECT_EQ(0, top[2].wins);

  auto top1 = board.topN(1);
  ASSERT_EQ(1u, top1.size());
  EXPECT_EQ("second", top1[0].user);
  EXPECT_TRUE(board.topN(0).empty());
}

TEST_F(LeaderboardTest, EnrollDoesNotResetExistingWins) {
  pong::Leaderboard board(path_);
  ASSERT_TRUE(board.recordWin("alice"));
  ASSERT_TRUE(board.enroll("alice"));
  EXPECT_EQ(1, board.winsFor("alice"));
  EXPECT_EQ(1u, board.topN(10).size());
}

TEST_F(LeaderboardTest, ConcurrentWinsAreAllCounted) {
  pong::Leaderboard board(path_);
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&board] {
      for (int j = 0; j < 10; ++j) EXPECT_TRUE(board.recordWin("busy"));
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(40, board.winsFor("busy"));
  EXPECT_EQ(40, pong::Leaderboard(path_).winsFor("busy"));
}

TEST_F(LeaderboardTest, CorruptFileIsRejected) {
  {
    std::ofstream out(path_);
    out << R"({"entries":[{"user":"alice"}]})";
  }
  EXPECT_THROW(pong::Leaderboard board(path_), std::runtime_error);
}

TEST_F(LeaderboardTest, HttpServesJsonRanking) {
  pong::Leaderboard board(path_);
  ASSERT_TRUE(board.enroll("alice"));
  ASSERT_TRUE(board.recordWin("bob"));

  auto resp = pong::handleLeaderboardRequest("GET /leaderboard HTTP/1.1\r\nHost: x\r\n\r\n", board);
  EXPECT_EQ("HTTP/1.1 200 OK", StatusLine(resp));
  auto doc = nlohmann::json::parse(Body(resp));
  ASSERT_EQ(2u, doc["entries"].size());
  EXPECT_EQ(1, doc["entries"][0]["rank"].get<int>());
  EXPECT_EQ("bob", doc["entries"][0]["user"].get<std::string>());
  EXPECT_EQ(1, doc["entries"][0]["wins"].get<int>());
  EXPECT_EQ("alice", doc["entries"][1]["user"].get<std::string>());

  auto limited = pong::handleLeaderboardRequest("GET /leaderboard?n=1 HTTP/1.1\r\n\r\n", board);
  EXPECT_EQ(1u, nlohmann::json::parse(Body(limited))["entries"].size());
}

TEST_F(LeaderboardTest, HttpServesEscapedHtmlPage) {
  pong::Leaderboard board(path_);
  ASSERT_TRUE(board.recordWin("a<b"));
  auto resp = pong::handleLeaderboardRequest("GET / HTTP/1.1\r\n\r\n", board);
  EXPECT_EQ("HTTP/1.1 200 OK", StatusLine(resp));
  EXPECT_NE(std::string::npos, resp.find("text/html"));
  EXPECT_NE(std::string::npos, resp.find("a&lt;b"));
  EXPECT_EQ(std::string::npos, resp.find("a<b"));
}

TEST_F(LeaderboardTest, HttpRejectsOtherRequests) {
  pong::Leaderboard board(path_);
  EXPECT_EQ("HTTP/1.1 404 Not Found",
            StatusLine(pong::handleLeaderboardRequest("GET /users HTTP/1.1\r\n\r\n", board)));
  EXPECT_EQ("HTTP/1.1 405 Method Not Allowed",
            StatusLine(pong::handleLeaderboardRequest("POST /leaderboard HTTP/1.1\r\n\r\n", board)));
  EXPECT_EQ("HTTP/1.1 400 Bad Request", StatusLine(pong::handleLeaderboardRequest("garbage", board)));
}

TEST_F(LeaderboardTest, HttpLoopWaitsForRequestsInFlight) {
  pong::Leaderboard board(path_);
  ASSERT_TRUE(board.enroll("alice"));
  std::string error;
  int listenFd = pong::openTcpListener(18651, error);
  ASSERT_GE(listenFd, 0) << error;

  std::atomic<bool> stop{false};
  std::atomic<bool> returned{false};
  std::thread server([&] {
    pong::runLeaderboardHttp(listenFd, board, stop);
    returned = true;
  });

  int fd = socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(fd, 0);
  timeval tv{};
  tv.tv_sec = 5;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(18651);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  ASSERT_EQ(0, connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)));

  // Let the loop accept the connection, then ask it to stop while the request is still unsent.
  std::this_thread::sleep_for(std::chrono::milliseconds(400));
  stop = true;
  std::this_thread::sleep_for(std::chrono::milliseconds(400));
  EXPECT_FALSE(returned);

  std::string req = "GET /leaderboard HTTP/1.1\r\n\r\n";
  ASSERT_EQ(static_cast<ssize_t>(req.size()), send(fd, req.data(), req.size(), 0));
  std::string resp;
  char buf[4096];
  ssize_t n;
  while ((n = recv(fd, buf, sizeof(buf), 0)) > 0) resp.append(buf, buf + n);
  close(fd);

  server.join();
  close(listenFd);
  EXPECT_TRUE(returned);
  EXPECT_EQ("HTTP/1.1 200 OK", StatusLine(resp));
  EXPECT_NE(std::string::npos, Body(resp).find("alice"));
}
