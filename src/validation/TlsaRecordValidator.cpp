#include "validation/TlsaRecordValidator.hpp"

#include "validation/FieldRules.hpp"

namespace zonekeeper::validation {

void TlsaRecordValidator::checkContent(const std::string& sContent, const std::string& /*sName*/,
                                       std::vector<std::string>& vErrors) const {
  const auto vFields = FieldRules::splitFields(sContent);
  if (vFields.size() != 4) {
    vErrors.push_back(
        "TLSA content must have the form <usage> <selector> <matching-type> <data>.");
    return;
  }

  if (!FieldRules::isUnsignedInRange(vFields[0], 0, 3)) {
    vErrors.push_back("Invalid TLSA certificate usage '" + vFields[0] + "': expected 0 to 3.");
  }
  if (!FieldRules::isUnsignedInRange(vFields[1], 0, 1)) {
    vErrors.push_back("Invalid TLSA selector '" + vFields[1] + "': expected 0 or 1.");
  }

  const auto oMatchingType = FieldRules::parseUnsigned(vFields[2]);
  if (!oMatchingType || *oMatchingType > 2) {
    vErrors.push_back("Invalid TLSA matching type '" + vFields[2] + "': expected 0 to 2.");
    return;
  }

  const std::string& sData = vFields[3];
  if (!FieldRules::isHex(sData)) {
    vErrors.push_back("Invalid TLSA data: expected hexadecimal characters.");
    return;
  }
  if (*oMatchingType == 1 && sData.size() != 64) {
    vErrors.push_back("Invalid TLSA data: a SHA-256 digest has 64 hexadecimal characters.");
  } else if (*oMatchingType == 2 && sData.size() != 128) {
    vErrors.push_back("Invalid TLSA data: a SHA-512 digest has 128 hexadecimal characters.");
  } else if (*oMatchingType == 0 && sData.size() % 2 != 0) {
    vErrors.push_back("Invalid TLSA data: full certificate data must have an even length.");
  }
}

}  // namespace zonekeeper::validation
