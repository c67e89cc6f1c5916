#pragma once

#include <cstdint>

#include "dal/IAuditSink.hpp"

namespace zonekeeper::dal {

class ConnectionPool;

/// Writes zone audit events to the log_zones table, optionally mirroring them
/// to the application log.
/// Class abbreviation: ar
class AuditRepository : public IAuditSink {
 public:
  /// syslog LOG_INFO, as stored in log_zones.priority.
  static constexpr int kPriorityInfo = 6;

  AuditRepository(ConnectionPool& cpPool, bool bMirrorToLog);
  ~AuditRepository() override;

  void write(const common::AuditEntry& aeEntry) override;

  /// Number of events recorded for a zone.
  int64_t countForZone(int64_t iZoneId);

 private:
  ConnectionPool& _cpPool;
  bool _bMirrorToLog;
};

}  // namespace zonekeeper::dal
