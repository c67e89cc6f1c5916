#include "validation/DsRecordValidator.hpp"

#include "validation/FieldRules.hpp"

namespace zonekeeper::validation {

void DsRecordValidator::checkContent(const std::string& sContent, const std::string& /*sName*/,
                                     std::vector<std::string>& vErrors) const {
  const auto vFields = FieldRules::splitFields(sContent);
  if (vFields.size() != 4) {
    vErrors.push_back("DS content must have the form <key-tag> <algorithm> <digest-type> <digest>.");
    return;
  }

  if (!FieldRules::isUnsignedInRange(vFields[0], 0, 65535)) {
    vErrors.push_back("Invalid DS key tag '" + vFields[0] +
                      "': it must be an integer between 0 and 65535.");
  }
  if (!FieldRules::isUnsignedInRange(vFields[1], 1, 255)) {
    vErrors.push_back("Invalid DS algorithm '" + vFields[1] +
                      "': it must be an integer between 1 and 255.");
  }

  const auto oDigestType = FieldRules::parseUnsigned(vFields[2]);
  size_t uExpectedLength = 0;
  if (oDigestType) {
    switch (*oDigestType) {
      case 1: uExpectedLength = 40; break;
      case 2: uExpectedLength = 64; break;
      case 4: uExpectedLength = 96; break;
      default: break;
    }
  }
  if (uExpectedLength == 0) {
    vErrors.push_back("Unsupported DS digest type '" + vFields[2] + "': expected 1, 2 or 4.");
    return;
  }

  if (!FieldRules::isHex(vFields[3]) || vFields[3].size() != uExpectedLength) {
    vErrors.push_back("Invalid DS digest: expected " + std::to_string(uExpectedLength) +
                      " hexadecimal characters.");
  }
}

}  // namespace zonekeeper::validation
