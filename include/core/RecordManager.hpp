#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace zonekeeper::dal {
class IAuditSink;
class IRecordStore;
}  // namespace zonekeeper::dal

namespace zonekeeper::providers {
class IDnssecProvider;
}  // namespace zonekeeper::providers

namespace zonekeeper::validation {
class ValidatorRegistry;
}  // namespace zonekeeper::validation

namespace zonekeeper::core {

class CommentSyncService;

enum class WriteStatus { Saved, Invalid, Failed };

/// Outcome of addRecord / editRecord. vErrors is filled for Invalid only.
struct WriteResult {
  WriteStatus status = WriteStatus::Failed;
  std::vector<std::string> vErrors;
};

/// Orchestrates a record write: persist, audit, DNSSEC rectify, comment sync.
///
/// Only persistence decides the outcome. Audit, rectify and comment sync run
/// after a successful write, are logged on failure and never roll it back.
/// Class abbreviation: rm
class RecordManager {
 public:
  /// pDnssec may be null, which disables zone rectification.
  RecordManager(dal::IRecordStore& rsStore, CommentSyncService& cssSync,
                dal::IAuditSink& asAudit, providers::IDnssecProvider* pDnssec,
                const validation::ValidatorRegistry& vregRegistry, uint32_t uDefaultTtl);
  ~RecordManager();

  /// Persist an already validated record. sName may be relative to the zone.
  /// Returns false when the zone is missing or the store rejects the row.
  bool createRecord(int64_t iZoneId, const std::string& sName, const std::string& sType,
                    const std::string& sContent, uint32_t uTtl, int iPriority,
                    const std::string& sComment, const common::RequestContext& rcCtx);

  /// Validate and create a record from user input.
  /// @throws common::NotFoundError zone_not_found
  /// @throws common::AuthorizationError zone_read_only for SLAVE zones
  WriteResult addRecord(int64_t iZoneId, const common::RecordDraft& rdDraft,
                        const common::RequestContext& rcCtx);

  /// Validate and overwrite an existing record from user input.
  /// @throws common::NotFoundError record_not_found or zone_not_found
  /// @throws common::AuthorizationError zone_read_only for SLAVE zones
  WriteResult editRecord(int64_t iRecordId, const common::RecordDraft& rdDraft,
                         const common::RequestContext& rcCtx);

 private:
  common::ZoneRow writableZone(int64_t iZoneId);
  void writeAudit(const common::AuditEntry& aeEntry);
  void rectify(const std::string& sZoneName);
  void bumpSerial(int64_t iZoneId);

  dal::IRecordStore& _rsStore;
  CommentSyncService& _cssSync;
  dal::IAuditSink& _asAudit;
  providers::IDnssecProvider* _pDnssec;
  const validation::ValidatorRegistry& _vregRegistry;
  uint32_t _uDefaultTtl;
};

}  // namespace zonekeeper::core
