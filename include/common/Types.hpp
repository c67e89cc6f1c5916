#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace zonekeeper::common {

/// Resource record types the engine knows how to validate.
enum class RecordType {
  A,
  AAAA,
  ALIAS,
  CAA,
  CNAME,
  DNAME,
  DS,
  HINFO,
  MX,
  NS,
  PTR,
  SOA,
  SPF,
  SRV,
  SSHFP,
  TLSA,
  TXT,
};

/// Canonical upper-case token for a record type ("AAAA", "SRV", ...).
std::string_view toString(RecordType rt);

/// Parse a type token case-insensitively. Returns nullopt for unsupported types.
std::optional<RecordType> parseRecordType(std::string_view svToken);

/// True for A and AAAA.
bool isForwardType(RecordType rt);

/// Zone kinds as stored in the PowerDNS domains table.
enum class ZoneKind { Master, Slave, Native };

/// Parse the domains.type column ("MASTER", "PRIMARY", "SLAVE", "SECONDARY",
/// "NATIVE"). Unknown values are treated as Native.
ZoneKind parseZoneKind(std::string_view svKind);

/// Row of the domains table.
/// Class abbreviation: zr
struct ZoneRow {
  int64_t iId = 0;
  std::string sName;
  ZoneKind kind = ZoneKind::Native;
  std::optional<int64_t> oOwnerId;
};

/// Row of the records table.
/// Class abbreviation: rr
struct RecordRow {
  int64_t iId = 0;
  int64_t iZoneId = 0;
  std::string sName;
  std::string sType;
  std::string sContent;
  uint32_t uTtl = 0;
  int iPriority = 0;
  bool bDisabled = false;
};

/// Row of the comments table.
/// Class abbreviation: cr
struct CommentRow {
  int64_t iZoneId = 0;
  std::string sName;
  std::string sType;
  std::string sComment;
  std::string sAccount;
};

/// Raw user input for a record write, before validation.
/// Ttl and priority stay strings so blank form fields can take defaults.
/// Class abbreviation: rd
struct RecordDraft {
  std::string sName;
  std::string sType;
  std::string sContent;
  std::string sTtl;
  std::string sPriority;
  std::string sComment;
};

/// Identity of the caller performing a mutation.
/// Class abbreviation: rc
struct RequestContext {
  std::string sUsername;
  std::string sClientAddress;
};

/// One audit log event. Details keep their insertion order.
/// Class abbreviation: ae
struct AuditEntry {
  int64_t iZoneId = 0;
  std::string sOperation;
  std::string sClientAddress;
  std::string sUsername;
  std::vector<std::pair<std::string, std::string>> vDetails;

  /// Single-line event text: "client_ip:<ip> user:<user> operation:<op> k:v ...".
  std::string toEventString() const;
};

}  // namespace zonekeeper::common
