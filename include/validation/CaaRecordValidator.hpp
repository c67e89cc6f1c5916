#pragma once

#include "validation/RecordValidatorBase.hpp"

namespace zonekeeper::validation {

/// CAA (RFC 8659): <flags> <tag> "<value>", flags 0-255, tag issue/issuewild/iodef.
class CaaRecordValidator : public RecordValidatorBase {
 protected:
  void checkContent(const std::string& sContent, const std::string& sName,
                    std::vector<std::string>& vErrors) const override;
};

}  // namespace zonekeeper::validation
