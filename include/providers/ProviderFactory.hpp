#pragma once

#include <memory>

#include "common/Config.hpp"
#include "providers/IDnssecProvider.hpp"

namespace zonekeeper::providers {

/// Creates the DNSSEC provider selected by configuration.
class ProviderFactory {
 public:
  /// nullptr when DNSSEC support is disabled.
  static std::unique_ptr<IDnssecProvider> createDnssecProvider(const common::Config& cfg);
};

}  // namespace zonekeeper::providers
