#include "core/RecordManager.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/CommentSyncService.hpp"
#include "dal/IAuditSink.hpp"
#include "dal/IRecordStore.hpp"
#include "dns/NameRules.hpp"
#include "dns/SoaSerial.hpp"
#include "providers/IDnssecProvider.hpp"
#include "validation/ValidatorRegistry.hpp"

#include <optional>
#include <stdexcept>

namespace zonekeeper::core {

namespace {

std::chrono::year_month_day today() {
  return std::chrono::year_month_day{
      std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}

/// Upper-case type token for a type that already passed validation.
std::string canonicalType(const std::string& sType) {
  const auto oType = common::parseRecordType(sType);
  if (!oType) return sType;
  return std::string(common::toString(*oType));
}

}  // namespace

RecordManager::RecordManager(dal::IRecordStore& rsStore, CommentSyncService& cssSync,
                             dal::IAuditSink& asAudit, providers::IDnssecProvider* pDnssec,
                             const validation::ValidatorRegistry& vregRegistry,
                             uint32_t uDefaultTtl)
    : _rsStore(rsStore),
      _cssSync(cssSync),
      _asAudit(asAudit),
      _pDnssec(pDnssec),
      _vregRegistry(vregRegistry),
      _uDefaultTtl(uDefaultTtl) {}

RecordManager::~RecordManager() = default;

bool RecordManager::createRecord(int64_t iZoneId, const std::string& sName,
                                 const std::string& sType, const std::string& sContent,
                                 uint32_t uTtl, int iPriority, const std::string& sComment,
                                 const common::RequestContext& rcCtx) {
  auto spLog = common::Logger::get();

  std::optional<common::ZoneRow> oZone;
  try {
    oZone = _rsStore.findZoneById(iZoneId);
  } catch (const std::exception& e) {
    spLog->error("Cannot add record: zone {} lookup failed: {}", iZoneId, e.what());
    return false;
  }
  if (!oZone) {
    spLog->error("Cannot add record: zone {} does not exist", iZoneId);
    return false;
  }

  common::RecordRow rrRecord;
  rrRecord.iZoneId = iZoneId;
  rrRecord.sName = dns::NameRules::restoreZoneSuffix(sName, oZone->sName);
  rrRecord.sType = sType;
  rrRecord.sContent = sContent;
  rrRecord.uTtl = uTtl;
  rrRecord.iPriority = iPriority;

  bool bStored = false;
  try {
    bStored = _rsStore.addRecord(rrRecord);
  } catch (const std::exception& e) {
    spLog->error("Store error while adding {} record '{}': {}", sType, rrRecord.sName,
                 e.what());
  }
  if (!bStored) {
    spLog->error("Failed to add {} record '{}' to zone {}", sType, rrRecord.sName,
                 oZone->sName);
    return false;
  }

  common::AuditEntry aeEntry;
  aeEntry.iZoneId = iZoneId;
  aeEntry.sOperation = "add_record";
  aeEntry.sClientAddress = rcCtx.sClientAddress;
  aeEntry.sUsername = rcCtx.sUsername;
  aeEntry.vDetails = {
      {"record_type", sType},
      {"record", rrRecord.sName},
      {"content", sContent},
      {"ttl", std::to_string(uTtl)},
      {"priority", std::to_string(iPriority)},
  };
  writeAudit(aeEntry);

  rectify(oZone->sName);

  try {
    _cssSync.createComments(iZoneId, rrRecord.sName, sType, sContent, sComment,
                            rcCtx.sUsername);
  } catch (const std::exception& e) {
    spLog->error("Record '{}' saved but its comments were not synchronized: {}",
                 rrRecord.sName, e.what());
  }

  spLog->info("Added {} record '{}' to zone {}", sType, rrRecord.sName, oZone->sName);
  return true;
}

WriteResult RecordManager::addRecord(int64_t iZoneId, const common::RecordDraft& rdDraft,
                                     const common::RequestContext& rcCtx) {
  const auto zr = writableZone(iZoneId);
  const std::string sFqdn = dns::NameRules::restoreZoneSuffix(rdDraft.sName, zr.sName);

  const auto vr = _vregRegistry.validate(rdDraft.sType, rdDraft.sContent, sFqdn,
                                         rdDraft.sPriority, rdDraft.sTtl, _uDefaultTtl);
  if (!vr.isValid()) {
    common::Logger::get()->debug("Rejected {} record '{}': {} problem(s)", rdDraft.sType,
                                 sFqdn, vr.errors().size());
    return WriteResult{WriteStatus::Invalid, vr.errors()};
  }

  const auto& vrData = vr.data();
  const bool bSaved =
      createRecord(iZoneId, vrData.sName, canonicalType(rdDraft.sType), vrData.sContent,
                   vrData.uTtl, vrData.iPriority, rdDraft.sComment, rcCtx);
  return WriteResult{bSaved ? WriteStatus::Saved : WriteStatus::Failed, {}};
}

WriteResult RecordManager::editRecord(int64_t iRecordId, const common::RecordDraft& rdDraft,
                                      const common::RequestContext& rcCtx) {
  auto spLog = common::Logger::get();

  const auto oOld = _rsStore.findRecordById(iRecordId);
  if (!oOld) {
    throw common::NotFoundError("record_not_found",
                                "Record " + std::to_string(iRecordId) + " does not exist");
  }
  const common::RecordRow& rrOld = *oOld;
  const auto zr = writableZone(rrOld.iZoneId);
  const std::string sFqdn = dns::NameRules::restoreZoneSuffix(rdDraft.sName, zr.sName);

  const auto vr = _vregRegistry.validate(rdDraft.sType, rdDraft.sContent, sFqdn,
                                         rdDraft.sPriority, rdDraft.sTtl, _uDefaultTtl);
  if (!vr.isValid()) {
    spLog->debug("Rejected edit of record {}: {} problem(s)", iRecordId, vr.errors().size());
    return WriteResult{WriteStatus::Invalid, vr.errors()};
  }

  const auto& vrData = vr.data();
  common::RecordRow rrNew = rrOld;
  rrNew.sName = vrData.sName;
  rrNew.sType = canonicalType(rdDraft.sType);
  rrNew.sContent = vrData.sContent;
  rrNew.uTtl = vrData.uTtl;
  rrNew.iPriority = vrData.iPriority;

  bool bStored = false;
  try {
    bStored = _rsStore.updateRecord(rrNew);
  } catch (const std::exception& e) {
    spLog->error("Store error while updating record {}: {}", iRecordId, e.what());
  }
  if (!bStored) {
    spLog->error("Failed to update record {} in zone {}", iRecordId, zr.sName);
    return WriteResult{WriteStatus::Failed, {}};
  }

  if (rrNew.sType != "SOA") {
    bumpSerial(zr.iId);
  }

  common::AuditEntry aeEntry;
  aeEntry.iZoneId = zr.iId;
  aeEntry.sOperation = "edit_record";
  aeEntry.sClientAddress = rcCtx.sClientAddress;
  aeEntry.sUsername = rcCtx.sUsername;
  aeEntry.vDetails = {
      {"old_record_type", rrOld.sType},
      {"old_record", rrOld.sName},
      {"old_content", rrOld.sContent},
      {"old_ttl", std::to_string(rrOld.uTtl)},
      {"old_priority", std::to_string(rrOld.iPriority)},
      {"record_type", rrNew.sType},
      {"record", rrNew.sName},
      {"content", rrNew.sContent},
      {"ttl", std::to_string(rrNew.uTtl)},
      {"priority", std::to_string(rrNew.iPriority)},
  };
  writeAudit(aeEntry);

  rectify(zr.sName);

  try {
    _cssSync.updateComments(rrOld, rrNew, rdDraft.sComment, rcCtx.sUsername);
  } catch (const std::exception& e) {
    spLog->error("Record {} saved but its comments were not synchronized: {}", iRecordId,
                 e.what());
  }

  spLog->info("Updated record {} ('{}' {}) in zone {}", iRecordId, rrNew.sName, rrNew.sType,
              zr.sName);
  return WriteResult{WriteStatus::Saved, {}};
}

common::ZoneRow RecordManager::writableZone(int64_t iZoneId) {
  auto oZone = _rsStore.findZoneById(iZoneId);
  if (!oZone) {
    throw common::NotFoundError("zone_not_found",
                                "Zone " + std::to_string(iZoneId) + " does not exist");
  }
  if (oZone->kind == common::ZoneKind::Slave) {
    throw common::AuthorizationError("zone_read_only",
                                     "Zone '" + oZone->sName + "' is a secondary zone");
  }
  return *oZone;
}

void RecordManager::writeAudit(const common::AuditEntry& aeEntry) {
  try {
    _asAudit.write(aeEntry);
  } catch (const std::exception& e) {
    common::Logger::get()->warn("Audit entry '{}' for zone {} not written: {}",
                                aeEntry.sOperation, aeEntry.iZoneId, e.what());
  }
}

void RecordManager::rectify(const std::string& sZoneName) {
  if (_pDnssec == nullptr) return;

  auto spLog = common::Logger::get();
  try {
    if (!_pDnssec->rectifyZone(sZoneName)) {
      spLog->warn("DNSSEC rectify of zone {} failed", sZoneName);
    }
  } catch (const std::exception& e) {
    spLog->warn("DNSSEC rectify of zone {} failed: {}", sZoneName, e.what());
  }
}

void RecordManager::bumpSerial(int64_t iZoneId) {
  auto spLog = common::Logger::get();
  try {
    const auto oSoa = _rsStore.findSoaRecord(iZoneId);
    if (!oSoa) {
      spLog->debug("Zone {} has no SOA record; serial not updated", iZoneId);
      return;
    }
    const auto oContent = dns::SoaSerial::bumpContent(oSoa->sContent, today());
    if (!oContent) {
      spLog->warn("Zone {} SOA content '{}' not understood; serial not updated", iZoneId,
                  oSoa->sContent);
      return;
    }
    if (*oContent == oSoa->sContent) return;
    if (!_rsStore.updateRecordContent(oSoa->iId, *oContent)) {
      spLog->warn("Zone {} SOA serial update rejected", iZoneId);
    }
  } catch (const std::exception& e) {
    spLog->warn("Zone {} SOA serial not updated: {}", iZoneId, e.what());
  }
}

}  // namespace zonekeeper::core
