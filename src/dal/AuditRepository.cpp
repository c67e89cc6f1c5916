#include "dal/AuditRepository.hpp"

#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace zonekeeper::dal {

AuditRepository::AuditRepository(ConnectionPool& cpPool, bool bMirrorToLog)
    : _cpPool(cpPool), _bMirrorToLog(bMirrorToLog) {}

AuditRepository::~AuditRepository() = default;

void AuditRepository::write(const common::AuditEntry& aeEntry) {
  const std::string sEvent = aeEntry.toEventString();

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "INSERT INTO log_zones (event, priority, zone_id) VALUES ($1, $2, $3)",
      pqxx::params{sEvent, kPriorityInfo, aeEntry.iZoneId});
  txn.commit();

  if (_bMirrorToLog) {
    common::Logger::get()->info("audit zone={} {}", aeEntry.iZoneId, sEvent);
  }
}

int64_t AuditRepository::countForZone(int64_t iZoneId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec("SELECT COUNT(*) FROM log_zones WHERE zone_id = $1",
                         pqxx::params{iZoneId});
  txn.commit();
  return result.one_row()[0].as<int64_t>();
}

}  // namespace zonekeeper::dal
