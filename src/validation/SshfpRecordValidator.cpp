#include "validation/SshfpRecordValidator.hpp"

#include "validation/FieldRules.hpp"

namespace zonekeeper::validation {

void SshfpRecordValidator::checkContent(const std::string& sContent,
                                        const std::string& /*sName*/,
                                        std::vector<std::string>& vErrors) const {
  const auto vFields = FieldRules::splitFields(sContent);
  if (vFields.size() != 3) {
    vErrors.push_back("SSHFP content must have the form <algorithm> <fp-type> <fingerprint>.");
    return;
  }

  if (!FieldRules::isUnsignedInRange(vFields[0], 1, 4)) {
    vErrors.push_back("Invalid SSHFP algorithm '" + vFields[0] + "': expected 1 to 4.");
  }

  const auto oFpType = FieldRules::parseUnsigned(vFields[1]);
  if (!oFpType || *oFpType < 1 || *oFpType > 2) {
    vErrors.push_back("Invalid SSHFP fingerprint type '" + vFields[1] + "': expected 1 or 2.");
    return;
  }

  // SHA-1 gives 20 bytes, SHA-256 gives 32.
  const size_t uExpectedLength = *oFpType == 1 ? 40 : 64;
  if (!FieldRules::isHex(vFields[2]) || vFields[2].size() != uExpectedLength) {
    vErrors.push_back("Invalid SSHFP fingerprint: expected " + std::to_string(uExpectedLength) +
                      " hexadecimal characters.");
  }
}

}  // namespace zonekeeper::validation
