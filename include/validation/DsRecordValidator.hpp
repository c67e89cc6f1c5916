#pragma once

#include "validation/RecordValidatorBase.hpp"

namespace zonekeeper::validation {

/// DS (RFC 4034): <key-tag> <algorithm> <digest-type> <digest>.
/// Digest types 1 (SHA-1), 2 (SHA-256) and 4 (SHA-384).
class DsRecordValidator : public RecordValidatorBase {
 protected:
  void checkContent(const std::string& sContent, const std::string& sName,
                    std::vector<std::string>& vErrors) const override;
};

}  // namespace zonekeeper::validation
