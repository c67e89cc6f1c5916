#pragma once

#include <string>

namespace zonekeeper::providers {

/// Pure abstract interface for PowerDNS DNSSEC maintenance.
class IDnssecProvider {
 public:
  virtual ~IDnssecProvider() = default;

  virtual std::string name() const = 0;

  /// Recompute ordering and auth fields of a zone after a change.
  /// Returns false when PowerDNS reports a failure.
  virtual bool rectifyZone(const std::string& sZoneName) = 0;
};

}  // namespace zonekeeper::providers
