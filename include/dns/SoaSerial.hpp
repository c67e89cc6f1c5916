#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace zonekeeper::dns {

/// Date-based (YYYYMMDDnn) SOA serial arithmetic.
class SoaSerial {
 public:
  /// Serial after a zone change made on ymdToday.
  /// 0 stays 0 (PowerDNS computes the serial itself).
  static uint32_t next(uint32_t uCurrent, std::chrono::year_month_day ymdToday);

  /// SOA content with its serial field replaced by next(serial).
  /// nullopt if the content does not have seven fields or the serial is not numeric.
  static std::optional<std::string> bumpContent(const std::string& sSoaContent,
                                                std::chrono::year_month_day ymdToday);
};

}  // namespace zonekeeper::dns
