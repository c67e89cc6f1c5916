#include "dal/ConnectionPool.hpp"

#include "common/Logger.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using zonekeeper::dal::ConnectionGuard;
using zonekeeper::dal::ConnectionPool;

namespace {

std::string getDbUrl() {
  const char* pUrl = std::getenv("ZK_DB_URL");
  return pUrl ? std::string(pUrl) : std::string{};
}

}  // namespace

class ConnectionPoolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sDbUrl = getDbUrl();
    if (_sDbUrl.empty()) {
      GTEST_SKIP() << "ZK_DB_URL not set, skipping integration test";
    }
    zonekeeper::common::Logger::init("warn");
  }

  std::string _sDbUrl;
};

TEST_F(ConnectionPoolTest, CreatesPoolOfRequestedSize) {
  const int iPoolSize = 3;
  ConnectionPool cpPool(_sDbUrl, iPoolSize);
  EXPECT_EQ(cpPool.size(), iPoolSize);
}

TEST_F(ConnectionPoolTest, RejectsEmptyPool) {
  EXPECT_THROW(ConnectionPool(_sDbUrl, 0), std::invalid_argument);
}

TEST_F(ConnectionPoolTest, ConnectionGuardRaiiReturnsOnScopeExit) {
  ConnectionPool cpPool(_sDbUrl, 2);

  {
    auto cg1 = cpPool.checkout();
    auto cg2 = cpPool.checkout();
    pqxx::nontransaction ntx(*cg1);
    auto result = ntx.exec("SELECT 1 AS val");
    EXPECT_EQ(result.one_row()[0].as<int>(), 1);
  }
  auto cg3 = cpPool.checkout();
  pqxx::nontransaction ntx(*cg3);
  auto result = ntx.exec("SELECT 1 AS val");
  EXPECT_EQ(result.one_row()[0].as<int>(), 1);
}

TEST_F(ConnectionPoolTest, CheckoutTimesOutWhenExhausted) {
  ConnectionPool cpPool(_sDbUrl, 1, std::chrono::seconds(1));
  auto cgHeld = cpPool.checkout();
  EXPECT_THROW(cpPool.checkout(), std::runtime_error);
}

TEST_F(ConnectionPoolTest, ConcurrentCheckoutsFromMultipleThreads) {
  const int iPoolSize = 4;
  const int iThreadCount = 8;
  ConnectionPool cpPool(_sDbUrl, iPoolSize);

  std::vector<std::thread> vThreads;
  std::atomic<int> iSuccessCount{0};

  for (int i = 0; i < iThreadCount; ++i) {
    vThreads.emplace_back([&cpPool, &iSuccessCount]() {
      try {
        auto cgConn = cpPool.checkout();
        pqxx::nontransaction ntx(*cgConn);
        auto result = ntx.exec("SELECT 1 AS val");
        if (result.one_row()[0].as<int>() == 1) {
          iSuccessCount.fetch_add(1);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      } catch (const std::exception& ex) {
        ADD_FAILURE() << "checkout failed: " << ex.what();
      }
    });
  }

  for (auto& t : vThreads) {
    t.join();
  }

  EXPECT_EQ(iSuccessCount.load(), iThreadCount);
}
