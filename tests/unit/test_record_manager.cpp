#include "core/RecordManager.hpp"

#include "FakeStores.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/CommentSyncService.hpp"
#include "validation/ValidatorRegistry.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

using zonekeeper::common::RecordDraft;
using zonekeeper::common::RecordRow;
using zonekeeper::common::RequestContext;
using zonekeeper::common::ZoneKind;
using zonekeeper::core::CommentSyncService;
using zonekeeper::core::RecordManager;
using zonekeeper::core::WriteStatus;
using zonekeeper::fakes::FakeAuditSink;
using zonekeeper::fakes::FakeCommentStore;
using zonekeeper::fakes::FakeDnssecProvider;
using zonekeeper::fakes::FakeRecordStore;
using zonekeeper::validation::ValidatorRegistry;

namespace {

constexpr uint32_t kDefaultTtl = 86400;

const RequestContext kCtx{"alice", "192.0.2.200"};

RecordDraft draft(const std::string& sName, const std::string& sType,
                  const std::string& sContent, const std::string& sTtl = "",
                  const std::string& sPriority = "", const std::string& sComment = "") {
  return RecordDraft{sName, sType, sContent, sTtl, sPriority, sComment};
}

std::string detail(const zonekeeper::common::AuditEntry& ae, const std::string& sKey) {
  for (const auto& [sK, sV] : ae.vDetails) {
    if (sK == sKey) return sV;
  }
  return {};
}

}  // namespace

class RecordManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    zonekeeper::common::Logger::init("warn");
    _iZone = _frs.addZone("example.com");
    _iReverse = _frs.addZone("2.0.192.in-addr.arpa");
  }

  RecordManager manager(bool bSync = true, bool bDnssec = true) {
    _upSync = std::make_unique<CommentSyncService>(_fcs, _frs, bSync);
    return RecordManager(_frs, *_upSync, _fas, bDnssec ? &_fdp : nullptr, _vreg, kDefaultTtl);
  }

  FakeRecordStore _frs;
  FakeCommentStore _fcs;
  FakeAuditSink _fas;
  FakeDnssecProvider _fdp;
  ValidatorRegistry _vreg;
  std::unique_ptr<CommentSyncService> _upSync;
  int64_t _iZone = 0;
  int64_t _iReverse = 0;
};

// ── createRecord ────────────────────────────────────────────────────────────

TEST_F(RecordManagerTest, CreateRunsAllStepsOnSuccess) {
  auto rm = manager();
  ASSERT_TRUE(rm.createRecord(_iZone, "www", "A", "192.0.2.1", 3600, 0, "web", kCtx));

  const auto vRecords = _frs.recordsOfZone(_iZone);
  ASSERT_EQ(vRecords.size(), 1u);
  EXPECT_EQ(vRecords[0].sName, "www.example.com");
  EXPECT_EQ(vRecords[0].uTtl, 3600u);

  ASSERT_EQ(_fas.vEntries.size(), 1u);
  const auto& ae = _fas.vEntries[0];
  EXPECT_EQ(ae.iZoneId, _iZone);
  EXPECT_EQ(ae.sOperation, "add_record");
  EXPECT_EQ(ae.sUsername, "alice");
  EXPECT_EQ(ae.sClientAddress, "192.0.2.200");
  EXPECT_EQ(detail(ae, "record"), "www.example.com");
  EXPECT_EQ(detail(ae, "content"), "192.0.2.1");

  ASSERT_EQ(_fdp.vRectified.size(), 1u);
  EXPECT_EQ(_fdp.vRectified[0], "example.com");

  EXPECT_EQ(_fcs.vComments.size(), 2u);
}

TEST_F(RecordManagerTest, QualifiedNameIsNotQualifiedTwice) {
  auto rm = manager();
  ASSERT_TRUE(rm.createRecord(_iZone, "www.example.com.", "A", "192.0.2.1", 3600, 0, "", kCtx));
  EXPECT_EQ(_frs.recordsOfZone(_iZone)[0].sName, "www.example.com");

  ASSERT_TRUE(rm.createRecord(_iZone, "@", "MX", "mail.example.com", 3600, 10, "", kCtx));
  const auto vRecords = _frs.recordsOfZone(_iZone);
  EXPECT_TRUE(std::any_of(vRecords.begin(), vRecords.end(), [](const RecordRow& rr) {
    return rr.sType == "MX" && rr.sName == "example.com" && rr.iPriority == 10;
  }));
}

TEST_F(RecordManagerTest, PersistenceFailureHasNoSideEffects) {
  _frs.bRejectWrites = true;
  auto rm = manager();

  EXPECT_FALSE(rm.createRecord(_iZone, "www", "A", "192.0.2.1", 3600, 0, "web", kCtx));
  EXPECT_TRUE(_fas.vEntries.empty());
  EXPECT_TRUE(_fdp.vRectified.empty());
  EXPECT_TRUE(_fcs.vComments.empty());
}

TEST_F(RecordManagerTest, StoreExceptionOnInsertReturnsFalse) {
  _frs.bThrowOnWrite = true;
  auto rm = manager();

  bool bSaved = true;
  EXPECT_NO_THROW(
      bSaved = rm.createRecord(_iZone, "www", "A", "192.0.2.1", 3600, 0, "web", kCtx));
  EXPECT_FALSE(bSaved);
  EXPECT_TRUE(_fas.vEntries.empty());
  EXPECT_TRUE(_fdp.vRectified.empty());
  EXPECT_TRUE(_fcs.vComments.empty());
}

TEST_F(RecordManagerTest, StoreExceptionOnZoneLookupReturnsFalse) {
  _frs.bThrowOnLookup = true;
  auto rm = manager();

  bool bSaved = true;
  EXPECT_NO_THROW(
      bSaved = rm.createRecord(_iZone, "www", "A", "192.0.2.1", 3600, 0, "web", kCtx));
  EXPECT_FALSE(bSaved);
  EXPECT_TRUE(_frs.mRecords.empty());
  EXPECT_TRUE(_fas.vEntries.empty());
}

TEST_F(RecordManagerTest, AddReportsStoreExceptionAsFailed) {
  _frs.bThrowOnWrite = true;
  auto rm = manager();

  EXPECT_EQ(rm.addRecord(_iZone, draft("www", "A", "192.0.2.1"), kCtx).status,
            WriteStatus::Failed);
  EXPECT_TRUE(_fcs.vComments.empty());
}

TEST_F(RecordManagerTest, MissingZoneReturnsFalse) {
  auto rm = manager();
  EXPECT_FALSE(rm.createRecord(999, "www", "A", "192.0.2.1", 3600, 0, "", kCtx));
  EXPECT_TRUE(_frs.mRecords.empty());
}

TEST_F(RecordManagerTest, BestEffortFailuresDoNotChangeResult) {
  _fas.bFail = true;
  _fdp.bThrow = true;
  _fcs.bFail = true;
  auto rm = manager();

  EXPECT_TRUE(rm.createRecord(_iZone, "www", "A", "192.0.2.1", 3600, 0, "web", kCtx));
  EXPECT_EQ(_frs.recordsOfZone(_iZone).size(), 1u);
  EXPECT_EQ(_fdp.vRectified.size(), 1u);
}

TEST_F(RecordManagerTest, RectifyReportingFailureDoesNotChangeResult) {
  _fdp.bResult = false;
  auto rm = manager();
  EXPECT_TRUE(rm.createRecord(_iZone, "www", "A", "192.0.2.1", 3600, 0, "", kCtx));
}

TEST_F(RecordManagerTest, DnssecDisabledSkipsRectify) {
  auto rm = manager(true, false);
  ASSERT_TRUE(rm.createRecord(_iZone, "www", "A", "192.0.2.1", 3600, 0, "", kCtx));
  EXPECT_TRUE(_fdp.vRectified.empty());
}

TEST_F(RecordManagerTest, SyncDisabledWritesSingleComment) {
  auto rm = manager(false);
  ASSERT_TRUE(rm.createRecord(_iZone, "www", "A", "192.0.2.1", 3600, 0, "web", kCtx));
  EXPECT_EQ(_fcs.vComments.size(), 1u);
}

// ── addRecord ───────────────────────────────────────────────────────────────

TEST_F(RecordManagerTest, AddValidatesAndApplies) {
  auto rm = manager();
  auto wr = rm.addRecord(_iZone, draft("_sip._tcp", "srv", "20 5060 sip.example.com"), kCtx);
  ASSERT_EQ(wr.status, WriteStatus::Saved);
  EXPECT_TRUE(wr.vErrors.empty());

  const auto vRecords = _frs.recordsOfZone(_iZone);
  ASSERT_EQ(vRecords.size(), 1u);
  EXPECT_EQ(vRecords[0].sName, "_sip._tcp.example.com");
  EXPECT_EQ(vRecords[0].sType, "SRV");
  EXPECT_EQ(vRecords[0].iPriority, 10);
  EXPECT_EQ(vRecords[0].uTtl, kDefaultTtl);
}

TEST_F(RecordManagerTest, AddReturnsValidationErrors) {
  auto rm = manager();
  auto wr = rm.addRecord(_iZone, draft("www", "A", "999.0.0.1", "-1"), kCtx);
  ASSERT_EQ(wr.status, WriteStatus::Invalid);
  EXPECT_EQ(wr.vErrors.size(), 2u);
  EXPECT_TRUE(_frs.mRecords.empty());
  EXPECT_TRUE(_fas.vEntries.empty());
}

TEST_F(RecordManagerTest, AddRejectsUnsupportedType) {
  auto rm = manager();
  auto wr = rm.addRecord(_iZone, draft("www", "NAPTR", "x"), kCtx);
  EXPECT_EQ(wr.status, WriteStatus::Invalid);
}

TEST_F(RecordManagerTest, AddReportsPersistenceFailure) {
  _frs.bRejectWrites = true;
  auto rm = manager();
  auto wr = rm.addRecord(_iZone, draft("www", "A", "192.0.2.1"), kCtx);
  EXPECT_EQ(wr.status, WriteStatus::Failed);
}

TEST_F(RecordManagerTest, AddToMissingZoneThrowsNotFound) {
  auto rm = manager();
  try {
    rm.addRecord(999, draft("www", "A", "192.0.2.1"), kCtx);
    FAIL() << "expected NotFoundError";
  } catch (const zonekeeper::common::NotFoundError& e) {
    EXPECT_EQ(e._sErrorCode, "zone_not_found");
  }
}

TEST_F(RecordManagerTest, AddToSecondaryZoneIsForbidden) {
  const int64_t iSlave = _frs.addZone("example.net", ZoneKind::Slave);
  auto rm = manager();
  try {
    rm.addRecord(iSlave, draft("www", "A", "192.0.2.1"), kCtx);
    FAIL() << "expected AuthorizationError";
  } catch (const zonekeeper::common::AuthorizationError& e) {
    EXPECT_EQ(e._sErrorCode, "zone_read_only");
  }
  EXPECT_TRUE(_frs.mRecords.empty());
}

// ── editRecord ──────────────────────────────────────────────────────────────

TEST_F(RecordManagerTest, EditRenamesRecordAndPairedPtrComment) {
  auto rm = manager();
  ASSERT_EQ(rm.addRecord(_iZone, draft("www", "A", "192.0.2.1", "", "", "web"), kCtx).status,
            WriteStatus::Saved);
  const int64_t iRecordId = _frs.recordsOfZone(_iZone)[0].iId;
  ASSERT_NE(_fcs.find(_iReverse, "1.2.0.192.in-addr.arpa", "PTR"), nullptr);

  auto wr = rm.editRecord(iRecordId, draft("web", "A", "192.0.2.7", "600", "", "web v2"), kCtx);
  ASSERT_EQ(wr.status, WriteStatus::Saved);

  const auto oRecord = _frs.findRecordById(iRecordId);
  ASSERT_TRUE(oRecord.has_value());
  EXPECT_EQ(oRecord->sName, "web.example.com");
  EXPECT_EQ(oRecord->sContent, "192.0.2.7");
  EXPECT_EQ(oRecord->uTtl, 600u);

  EXPECT_EQ(_fcs.find(_iReverse, "1.2.0.192.in-addr.arpa", "PTR"), nullptr);
  const auto* pPtr = _fcs.find(_iReverse, "7.2.0.192.in-addr.arpa", "PTR");
  ASSERT_NE(pPtr, nullptr);
  EXPECT_EQ(pPtr->sComment, "web v2");
  EXPECT_NE(_fcs.find(_iZone, "web.example.com", "A"), nullptr);
}

TEST_F(RecordManagerTest, EditWritesAuditWithOldAndNewValues) {
  const int64_t iRecordId =
      _frs.seedRecord(RecordRow{0, _iZone, "www.example.com", "A", "192.0.2.1", 3600, 0, false});
  auto rm = manager();

  ASSERT_EQ(rm.editRecord(iRecordId, draft("www", "A", "192.0.2.2"), kCtx).status,
            WriteStatus::Saved);

  ASSERT_EQ(_fas.vEntries.size(), 1u);
  const auto& ae = _fas.vEntries[0];
  EXPECT_EQ(ae.sOperation, "edit_record");
  EXPECT_EQ(detail(ae, "old_content"), "192.0.2.1");
  EXPECT_EQ(detail(ae, "content"), "192.0.2.2");
  EXPECT_EQ(detail(ae, "old_ttl"), "3600");
  EXPECT_EQ(detail(ae, "ttl"), std::to_string(kDefaultTtl));
  EXPECT_EQ(_fdp.vRectified.size(), 1u);
}

TEST_F(RecordManagerTest, EditBumpsSoaSerial) {
  const std::string sSoa = "ns1.example.com hostmaster.example.com 2000010100 10800 3600 604800 3600";
  const int64_t iSoaId =
      _frs.seedRecord(RecordRow{0, _iZone, "example.com", "SOA", sSoa, 3600, 0, false});
  const int64_t iRecordId =
      _frs.seedRecord(RecordRow{0, _iZone, "www.example.com", "A", "192.0.2.1", 3600, 0, false});
  auto rm = manager();

  ASSERT_EQ(rm.editRecord(iRecordId, draft("www", "A", "192.0.2.2"), kCtx).status,
            WriteStatus::Saved);

  const auto oSoa = _frs.findRecordById(iSoaId);
  ASSERT_TRUE(oSoa.has_value());
  EXPECT_NE(oSoa->sContent, sSoa);
  EXPECT_EQ(oSoa->sContent.rfind("ns1.example.com hostmaster.example.com ", 0), 0u);
  EXPECT_EQ(oSoa->sContent.find(" 2000010100 "), std::string::npos);
}

TEST_F(RecordManagerTest, EditingSoaDoesNotBumpItAgain) {
  const std::string sSoa = "ns1.example.com hostmaster.example.com 2000010100 10800 3600 604800 3600";
  const int64_t iSoaId =
      _frs.seedRecord(RecordRow{0, _iZone, "example.com", "SOA", sSoa, 3600, 0, false});
  const std::string sEdited = "ns2.example.com hostmaster.example.com 2000010105 10800 3600 604800 3600";
  auto rm = manager();

  ASSERT_EQ(rm.editRecord(iSoaId, draft("@", "SOA", sEdited), kCtx).status, WriteStatus::Saved);
  EXPECT_EQ(_frs.findRecordById(iSoaId)->sContent, sEdited);
}

TEST_F(RecordManagerTest, EditInvalidLeavesRecordUntouched) {
  const int64_t iRecordId =
      _frs.seedRecord(RecordRow{0, _iZone, "www.example.com", "A", "192.0.2.1", 3600, 0, false});
  auto rm = manager();

  auto wr = rm.editRecord(iRecordId, draft("www", "A", "not-an-ip"), kCtx);
  ASSERT_EQ(wr.status, WriteStatus::Invalid);
  EXPECT_EQ(_frs.findRecordById(iRecordId)->sContent, "192.0.2.1");
  EXPECT_TRUE(_fas.vEntries.empty());
}

TEST_F(RecordManagerTest, EditPersistenceFailureHasNoSideEffects) {
  const int64_t iRecordId =
      _frs.seedRecord(RecordRow{0, _iZone, "www.example.com", "A", "192.0.2.1", 3600, 0, false});
  _frs.bRejectWrites = true;
  auto rm = manager();

  EXPECT_EQ(rm.editRecord(iRecordId, draft("www", "A", "192.0.2.2"), kCtx).status,
            WriteStatus::Failed);
  EXPECT_TRUE(_fas.vEntries.empty());
  EXPECT_TRUE(_fdp.vRectified.empty());
  EXPECT_TRUE(_fcs.vComments.empty());
}

TEST_F(RecordManagerTest, EditStoreExceptionReportsFailed) {
  const int64_t iRecordId =
      _frs.seedRecord(RecordRow{0, _iZone, "www.example.com", "A", "192.0.2.1", 3600, 0, false});
  _frs.bThrowOnWrite = true;
  auto rm = manager();

  EXPECT_EQ(rm.editRecord(iRecordId, draft("www", "A", "192.0.2.2"), kCtx).status,
            WriteStatus::Failed);
  EXPECT_EQ(_frs.findRecordById(iRecordId)->sContent, "192.0.2.1");
  EXPECT_TRUE(_fas.vEntries.empty());
  EXPECT_TRUE(_fdp.vRectified.empty());
}

TEST_F(RecordManagerTest, EditMissingRecordThrowsNotFound) {
  auto rm = manager();
  try {
    rm.editRecord(12345, draft("www", "A", "192.0.2.2"), kCtx);
    FAIL() << "expected NotFoundError";
  } catch (const zonekeeper::common::NotFoundError& e) {
    EXPECT_EQ(e._sErrorCode, "record_not_found");
  }
}

TEST_F(RecordManagerTest, EditInSecondaryZoneIsForbidden) {
  const int64_t iSlave = _frs.addZone("example.net", ZoneKind::Slave);
  const int64_t iRecordId =
      _frs.seedRecord(RecordRow{0, iSlave, "www.example.net", "A", "192.0.2.1", 3600, 0, false});
  auto rm = manager();
  EXPECT_THROW(rm.editRecord(iRecordId, draft("www", "A", "192.0.2.2"), kCtx),
               zonekeeper::common::AuthorizationError);
}
