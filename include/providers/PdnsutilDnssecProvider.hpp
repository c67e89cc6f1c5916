#pragma once

#include <optional>
#include <string>
#include <vector>

#include "providers/IDnssecProvider.hpp"

namespace zonekeeper::providers {

/// Runs `pdnsutil rectify-zone` as a child process (no shell involved).
class PdnsutilDnssecProvider : public IDnssecProvider {
 public:
  PdnsutilDnssecProvider(std::string sBinaryPath, std::optional<std::string> oConfigDir);
  ~PdnsutilDnssecProvider() override;

  std::string name() const override;

  /// Throws ProviderError when the binary cannot be started.
  bool rectifyZone(const std::string& sZoneName) override;

  /// argv used for a rectify call, binary first.
  std::vector<std::string> buildRectifyCommand(const std::string& sZoneName) const;

 private:
  std::string _sBinaryPath;
  std::optional<std::string> _oConfigDir;
};

}  // namespace zonekeeper::providers
