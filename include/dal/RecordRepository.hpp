#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "dal/IRecordStore.hpp"

namespace zonekeeper::dal {

class ConnectionPool;

/// IRecordStore over the PowerDNS generic SQL schema (domains, records) plus
/// the zones ownership table.
/// Class abbreviation: rr
class RecordRepository : public IRecordStore {
 public:
  explicit RecordRepository(ConnectionPool& cpPool);
  ~RecordRepository() override;

  std::optional<common::ZoneRow> findZoneById(int64_t iZoneId) override;
  std::optional<int64_t> findBestMatchingZoneId(const std::string& sName) override;
  std::optional<int64_t> findZoneIdByName(const std::string& sZoneName) override;

  /// Returns false (and logs) when PostgreSQL rejects the insert.
  bool addRecord(const common::RecordRow& rrRecord) override;

  std::optional<common::RecordRow> findRecordById(int64_t iRecordId) override;
  bool updateRecord(const common::RecordRow& rrRecord) override;
  std::optional<common::RecordRow> findSoaRecord(int64_t iZoneId) override;
  bool updateRecordContent(int64_t iRecordId, const std::string& sContent) override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace zonekeeper::dal
