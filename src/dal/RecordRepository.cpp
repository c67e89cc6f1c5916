#include "dal/RecordRepository.hpp"

#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"
#include "dns/NameRules.hpp"

#include <pqxx/pqxx>

#include <stdexcept>

namespace zonekeeper::dal {

namespace {

constexpr const char* kRecordColumns =
    "SELECT id, domain_id, name, type, COALESCE(content, ''), COALESCE(ttl, 0), "
    "COALESCE(prio, 0), disabled FROM records ";

common::RecordRow toRecordRow(const pqxx::row& row) {
  return common::RecordRow{
      row[0].as<int64_t>(),
      row[1].as<int64_t>(),
      row[2].as<std::string>(),
      row[3].as<std::string>(),
      row[4].as<std::string>(),
      static_cast<uint32_t>(row[5].as<int64_t>()),
      row[6].as<int>(),
      row[7].as<bool>(),
  };
}

}  // namespace

RecordRepository::RecordRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
RecordRepository::~RecordRepository() = default;

std::optional<common::ZoneRow> RecordRepository::findZoneById(int64_t iZoneId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT d.id, d.name, d.type, "
      "(SELECT z.owner FROM zones z WHERE z.domain_id = d.id ORDER BY z.id LIMIT 1) "
      "FROM domains d WHERE d.id = $1",
      pqxx::params{iZoneId});
  txn.commit();

  if (result.empty()) return std::nullopt;

  auto row = result[0];
  common::ZoneRow zr;
  zr.iId = row[0].as<int64_t>();
  zr.sName = row[1].as<std::string>();
  zr.kind = common::parseZoneKind(row[2].as<std::string>());
  if (!row[3].is_null()) {
    zr.oOwnerId = row[3].as<int64_t>();
  }
  return zr;
}

std::optional<int64_t> RecordRepository::findBestMatchingZoneId(const std::string& sName) {
  const std::string sCanonical = dns::NameRules::canonical(sName);

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  // Longest zone name that equals the queried name or is a dot-separated suffix of it.
  auto result = txn.exec(
      "SELECT id FROM domains "
      "WHERE lower(name) = $1 "
      "   OR right($1, length(name) + 1) = '.' || lower(name) "
      "ORDER BY length(name) DESC LIMIT 1",
      pqxx::params{sCanonical});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return result[0][0].as<int64_t>();
}

std::optional<int64_t> RecordRepository::findZoneIdByName(const std::string& sZoneName) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT id FROM domains WHERE lower(name) = $1",
      pqxx::params{dns::NameRules::canonical(sZoneName)});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return result[0][0].as<int64_t>();
}

bool RecordRepository::addRecord(const common::RecordRow& rrRecord) {
  try {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    txn.exec(
        "INSERT INTO records (domain_id, name, type, content, ttl, prio, disabled) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7)",
        pqxx::params{rrRecord.iZoneId, rrRecord.sName, rrRecord.sType, rrRecord.sContent,
                     static_cast<int64_t>(rrRecord.uTtl), rrRecord.iPriority,
                     rrRecord.bDisabled});
    txn.commit();
    return true;
  } catch (const std::exception& ex) {
    common::Logger::get()->error("Failed to insert {} record '{}' into zone {}: {}",
                                 rrRecord.sType, rrRecord.sName, rrRecord.iZoneId, ex.what());
    return false;
  }
}

std::optional<common::RecordRow> RecordRepository::findRecordById(int64_t iRecordId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(std::string(kRecordColumns) + "WHERE id = $1",
                         pqxx::params{iRecordId});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return toRecordRow(result[0]);
}

bool RecordRepository::updateRecord(const common::RecordRow& rrRecord) {
  try {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    auto result = txn.exec(
        "UPDATE records SET name = $2, type = $3, content = $4, ttl = $5, prio = $6, "
        "disabled = $7 WHERE id = $1",
        pqxx::params{rrRecord.iId, rrRecord.sName, rrRecord.sType, rrRecord.sContent,
                     static_cast<int64_t>(rrRecord.uTtl), rrRecord.iPriority,
                     rrRecord.bDisabled});
    txn.commit();
    return result.affected_rows() > 0;
  } catch (const std::exception& ex) {
    common::Logger::get()->error("Failed to update record {}: {}", rrRecord.iId, ex.what());
    return false;
  }
}

std::optional<common::RecordRow> RecordRepository::findSoaRecord(int64_t iZoneId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      std::string(kRecordColumns) + "WHERE domain_id = $1 AND type = 'SOA' ORDER BY id LIMIT 1",
      pqxx::params{iZoneId});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return toRecordRow(result[0]);
}

bool RecordRepository::updateRecordContent(int64_t iRecordId, const std::string& sContent) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec("UPDATE records SET content = $2 WHERE id = $1",
                         pqxx::params{iRecordId, sContent});
  txn.commit();
  return result.affected_rows() > 0;
}

}  // namespace zonekeeper::dal
