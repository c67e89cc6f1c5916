#pragma once

#include "validation/RecordValidatorBase.hpp"

namespace zonekeeper::validation {

/// MX: content is the mail exchanger hostname; priority defaults to 10.
class MxRecordValidator : public RecordValidatorBase {
 protected:
  void checkContent(const std::string& sContent, const std::string& sName,
                    std::vector<std::string>& vErrors) const override;
  int defaultPriority() const override { return 10; }
};

}  // namespace zonekeeper::validation
