#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "common/Types.hpp"

namespace zonekeeper::dal {

/// Pure abstract interface over zone and record persistence.
class IRecordStore {
 public:
  virtual ~IRecordStore() = default;

  virtual std::optional<common::ZoneRow> findZoneById(int64_t iZoneId) = 0;

  /// Zone whose name is the longest case-insensitive suffix of sName
  /// (the zone that would be authoritative for it). nullopt if none.
  virtual std::optional<int64_t> findBestMatchingZoneId(const std::string& sName) = 0;

  /// Zone with exactly this name (case-insensitive). nullopt if none.
  virtual std::optional<int64_t> findZoneIdByName(const std::string& sZoneName) = 0;

  /// Insert a record row. Returns false when the store rejects the write.
  virtual bool addRecord(const common::RecordRow& rrRecord) = 0;

  virtual std::optional<common::RecordRow> findRecordById(int64_t iRecordId) = 0;

  /// Overwrite name/type/content/ttl/prio of rrRecord.iId. Returns false when
  /// the store rejects the write or the record no longer exists.
  virtual bool updateRecord(const common::RecordRow& rrRecord) = 0;

  virtual std::optional<common::RecordRow> findSoaRecord(int64_t iZoneId) = 0;

  virtual bool updateRecordContent(int64_t iRecordId, const std::string& sContent) = 0;
};

}  // namespace zonekeeper::dal
