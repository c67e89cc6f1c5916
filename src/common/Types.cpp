#include "common/Types.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace zonekeeper::common {

namespace {

constexpr std::array<std::pair<RecordType, std::string_view>, 17> kTypeNames{{
    {RecordType::A, "A"},
    {RecordType::AAAA, "AAAA"},
    {RecordType::ALIAS, "ALIAS"},
    {RecordType::CAA, "CAA"},
    {RecordType::CNAME, "CNAME"},
    {RecordType::DNAME, "DNAME"},
    {RecordType::DS, "DS"},
    {RecordType::HINFO, "HINFO"},
    {RecordType::MX, "MX"},
    {RecordType::NS, "NS"},
    {RecordType::PTR, "PTR"},
    {RecordType::SOA, "SOA"},
    {RecordType::SPF, "SPF"},
    {RecordType::SRV, "SRV"},
    {RecordType::SSHFP, "SSHFP"},
    {RecordType::TLSA, "TLSA"},
    {RecordType::TXT, "TXT"},
}};

std::string toUpper(std::string_view sv) {
  std::string sOut(sv);
  std::transform(sOut.begin(), sOut.end(), sOut.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return sOut;
}

}  // namespace

std::string_view toString(RecordType rt) {
  for (const auto& [rtKnown, svName] : kTypeNames) {
    if (rtKnown == rt) return svName;
  }
  return "";
}

std::optional<RecordType> parseRecordType(std::string_view svToken) {
  const std::string sUpper = toUpper(svToken);
  for (const auto& [rtKnown, svName] : kTypeNames) {
    if (svName == sUpper) return rtKnown;
  }
  return std::nullopt;
}

bool isForwardType(RecordType rt) { return rt == RecordType::A || rt == RecordType::AAAA; }

ZoneKind parseZoneKind(std::string_view svKind) {
  const std::string sUpper = toUpper(svKind);
  if (sUpper == "MASTER" || sUpper == "PRIMARY") return ZoneKind::Master;
  if (sUpper == "SLAVE" || sUpper == "SECONDARY") return ZoneKind::Slave;
  return ZoneKind::Native;
}

std::string AuditEntry::toEventString() const {
  std::string sOut = "client_ip:" + sClientAddress + " user:" + sUsername +
                     " operation:" + sOperation;
  for (const auto& [sKey, sValue] : vDetails) {
    sOut += " " + sKey + ":" + sValue;
  }
  return sOut;
}

}  // namespace zonekeeper::common
