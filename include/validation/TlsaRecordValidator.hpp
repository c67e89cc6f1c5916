#pragma once

#include "validation/RecordValidatorBase.hpp"

namespace zonekeeper::validation {

/// TLSA (RFC 6698): <usage 0-3> <selector 0-1> <matching-type 0-2> <hex data>.
class TlsaRecordValidator : public RecordValidatorBase {
 protected:
  void checkContent(const std::string& sContent, const std::string& sName,
                    std::vector<std::string>& vErrors) const override;
};

}  // namespace zonekeeper::validation
