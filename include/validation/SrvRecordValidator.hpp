#pragma once

#include "validation/RecordValidatorBase.hpp"

namespace zonekeeper::validation {

/// SRV (RFC 2782).
///
/// Name:    _<service>._<protocol>.<domain>, service and protocol restricted to
///          letters, digits and hyphens, domain at least one valid label.
/// Content: exactly "<weight> <port> <target>"; weight and port in [0, 65535],
///          target "." or a hostname. The priority travels in its own field
///          and defaults to 10.
class SrvRecordValidator : public RecordValidatorBase {
 protected:
  void checkName(const std::string& sName, std::vector<std::string>& vErrors) const override;
  void checkContent(const std::string& sContent, const std::string& sName,
                    std::vector<std::string>& vErrors) const override;
  int defaultPriority() const override { return 10; }
};

}  // namespace zonekeeper::validation
