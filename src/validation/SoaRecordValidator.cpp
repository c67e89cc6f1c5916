#include "validation/SoaRecordValidator.hpp"

#include "validation/FieldRules.hpp"

#include <array>
#include <limits>

namespace zonekeeper::validation {

void SoaRecordValidator::checkContent(const std::string& sContent, const std::string& /*sName*/,
                                      std::vector<std::string>& vErrors) const {
  const auto vFields = FieldRules::splitFields(sContent);
  if (vFields.size() != 7) {
    vErrors.push_back(
        "SOA content must have the form <mname> <rname> <serial> <refresh> <retry> "
        "<expire> <minimum>.");
    return;
  }

  if (!FieldRules::isValidHostname(vFields[0])) {
    vErrors.push_back("Invalid SOA primary name server '" + vFields[0] + "'.");
  }
  if (!FieldRules::isValidHostname(vFields[1])) {
    vErrors.push_back("Invalid SOA responsible mailbox '" + vFields[1] + "'.");
  }

  static constexpr std::array<const char*, 5> kNumericFields{
      "serial", "refresh", "retry", "expire", "minimum"};
  for (size_t i = 0; i < kNumericFields.size(); ++i) {
    if (!FieldRules::isUnsignedInRange(vFields[i + 2], 0, std::numeric_limits<uint32_t>::max())) {
      vErrors.push_back(std::string("Invalid SOA ") + kNumericFields[i] + " '" + vFields[i + 2] +
                        "': it must be an unsigned 32-bit integer.");
    }
  }
}

}  // namespace zonekeeper::validation
