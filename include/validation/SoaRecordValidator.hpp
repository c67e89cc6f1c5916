#pragma once

#include "validation/RecordValidatorBase.hpp"

namespace zonekeeper::validation {

/// SOA: <mname> <rname> <serial> <refresh> <retry> <expire> <minimum>.
class SoaRecordValidator : public RecordValidatorBase {
 protected:
  void checkContent(const std::string& sContent, const std::string& sName,
                    std::vector<std::string>& vErrors) const override;
};

}  // namespace zonekeeper::validation
