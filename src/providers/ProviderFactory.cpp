#include "providers/ProviderFactory.hpp"

#include "providers/PdnsutilDnssecProvider.hpp"

namespace zonekeeper::providers {

std::unique_ptr<IDnssecProvider> ProviderFactory::createDnssecProvider(
    const common::Config& cfg) {
  if (!cfg.bDnssecEnabled) {
    return nullptr;
  }
  return std::make_unique<PdnsutilDnssecProvider>(cfg.sPdnsutilPath, cfg.oPdnsConfigDir);
}

}  // namespace zonekeeper::providers
