#include "validation/MxRecordValidator.hpp"

#include "validation/FieldRules.hpp"

namespace zonekeeper::validation {

void MxRecordValidator::checkContent(const std::string& sContent, const std::string& /*sName*/,
                                     std::vector<std::string>& vErrors) const {
  if (!FieldRules::isValidHostname(sContent)) {
    vErrors.push_back("Invalid MX mail exchanger hostname '" + sContent + "'.");
  }
}

}  // namespace zonekeeper::validation
