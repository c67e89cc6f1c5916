#pragma once

#include "validation/RecordValidatorBase.hpp"

namespace zonekeeper::validation {

/// HINFO: <cpu> <os>, each a bare token or a double-quoted string.
class HinfoRecordValidator : public RecordValidatorBase {
 protected:
  void checkContent(const std::string& sContent, const std::string& sName,
                    std::vector<std::string>& vErrors) const override;
};

}  // namespace zonekeeper::validation
