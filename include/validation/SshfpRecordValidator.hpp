#pragma once

#include "validation/RecordValidatorBase.hpp"

namespace zonekeeper::validation {

/// SSHFP (RFC 4255, 6594, 7479): <algorithm 1-4> <fp-type 1-2> <hex fingerprint>.
class SshfpRecordValidator : public RecordValidatorBase {
 protected:
  void checkContent(const std::string& sContent, const std::string& sName,
                    std::vector<std::string>& vErrors) const override;
};

}  // namespace zonekeeper::validation
