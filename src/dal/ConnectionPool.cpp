#include "dal/ConnectionPool.hpp"

#include "common/Logger.hpp"

#include <chrono>
#include <stdexcept>

namespace zonekeeper::dal {

ConnectionGuard::ConnectionGuard(ConnectionPool& cpPool,
                                 std::shared_ptr<pqxx::connection> spConn)
    : _pPool(&cpPool), _spConn(std::move(spConn)) {}

ConnectionGuard::~ConnectionGuard() {
  if (_spConn && _pPool) {
    _pPool->returnConnection(std::move(_spConn));
  }
}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _pPool(other._pPool), _spConn(std::move(other._spConn)) {
  other._pPool = nullptr;
}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    if (_spConn && _pPool) {
      _pPool->returnConnection(std::move(_spConn));
    }
    _pPool = other._pPool;
    _spConn = std::move(other._spConn);
    other._pPool = nullptr;
  }
  return *this;
}

pqxx::connection& ConnectionGuard::operator*() { return *_spConn; }
pqxx::connection* ConnectionGuard::operator->() { return _spConn.get(); }

ConnectionPool::ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                               std::chrono::seconds durCheckoutTimeout)
    : _sDbUrl(sDbUrl), _iPoolSize(iPoolSize), _durCheckoutTimeout(durCheckoutTimeout) {
  if (_iPoolSize < 1) {
    throw std::invalid_argument("Connection pool size must be >= 1");
  }

  auto spLog = common::Logger::get();
  // Never log the credentials part of the URL.
  const auto uAt = _sDbUrl.find('@');
  spLog->info("Initializing connection pool: size={}, host={}", _iPoolSize,
              uAt == std::string::npos ? std::string("<local>") : _sDbUrl.substr(uAt + 1));

  _vAvailable.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    _vAvailable.push_back(openConnection());
  }

  spLog->info("Connection pool ready: {} connections established", _iPoolSize);
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.clear();
}

ConnectionGuard ConnectionPool::checkout() {
  std::unique_lock<std::mutex> lock(_mtx);

  const auto bAvailable = _cv.wait_for(lock, _durCheckoutTimeout, [this] {
    return !_vAvailable.empty();
  });

  if (!bAvailable) {
    throw std::runtime_error("Connection pool exhausted: timeout waiting for available connection");
  }

  auto spConn = std::move(_vAvailable.back());
  _vAvailable.pop_back();

  lock.unlock();

  if (!validate(*spConn)) {
    common::Logger::get()->warn("Stale connection detected, reconnecting");
    try {
      spConn = openConnection();
    } catch (const std::exception&) {
      // Keep the pool at full size; the next checkout retries the reconnect.
      returnConnection(std::move(spConn));
      throw;
    }
  }

  return ConnectionGuard(*this, std::move(spConn));
}

std::shared_ptr<pqxx::connection> ConnectionPool::openConnection() {
  auto spConn = std::make_shared<pqxx::connection>(_sDbUrl);
  if (!spConn->is_open()) {
    throw std::runtime_error("Failed to open database connection");
  }
  return spConn;
}

void ConnectionPool::returnConnection(std::shared_ptr<pqxx::connection> spConn) {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.push_back(std::move(spConn));
  _cv.notify_one();
}

bool ConnectionPool::validate(pqxx::connection& conn) {
  try {
    pqxx::nontransaction ntx(conn);
    ntx.exec("SELECT 1").one_row();
    return true;
  } catch (const pqxx::failure& ex) {
    common::Logger::get()->debug("Connection validation failed: {}", ex.what());
    return false;
  }
}

}  // namespace zonekeeper::dal
