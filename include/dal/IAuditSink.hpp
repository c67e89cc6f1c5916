#pragma once

#include "common/Types.hpp"

namespace zonekeeper::dal {

/// Destination for zone audit events.
class IAuditSink {
 public:
  virtual ~IAuditSink() = default;

  virtual void write(const common::AuditEntry& aeEntry) = 0;
};

}  // namespace zonekeeper::dal
