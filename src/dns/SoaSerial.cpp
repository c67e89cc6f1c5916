#include "dns/SoaSerial.hpp"

#include <charconv>
#include <limits>
#include <sstream>
#include <vector>

namespace zonekeeper::dns {

uint32_t SoaSerial::next(uint32_t uCurrent, std::chrono::year_month_day ymdToday) {
  if (uCurrent == 0) {
    return 0;
  }

  const uint64_t uDayBase = static_cast<uint64_t>(static_cast<int>(ymdToday.year())) * 1000000 +
                            static_cast<unsigned>(ymdToday.month()) * 10000 +
                            static_cast<unsigned>(ymdToday.day()) * 100;

  if (uDayBase <= std::numeric_limits<uint32_t>::max() && uCurrent < uDayBase) {
    return static_cast<uint32_t>(uDayBase);
  }
  if (uCurrent == std::numeric_limits<uint32_t>::max()) {
    return 1;
  }
  return uCurrent + 1;
}

std::optional<std::string> SoaSerial::bumpContent(const std::string& sSoaContent,
                                                  std::chrono::year_month_day ymdToday) {
  std::istringstream iss(sSoaContent);
  std::vector<std::string> vFields;
  std::string sField;
  while (iss >> sField) {
    vFields.push_back(sField);
  }
  if (vFields.size() != 7) {
    return std::nullopt;
  }

  const std::string& sSerial = vFields[2];
  uint32_t uSerial = 0;
  const auto [pEnd, ec] = std::from_chars(sSerial.data(), sSerial.data() + sSerial.size(), uSerial);
  if (ec != std::errc{} || pEnd != sSerial.data() + sSerial.size()) {
    return std::nullopt;
  }

  vFields[2] = std::to_string(next(uSerial, ymdToday));

  std::string sOut;
  for (const auto& s : vFields) {
    if (!sOut.empty()) sOut += ' ';
    sOut += s;
  }
  return sOut;
}

}  // namespace zonekeeper::dns
