#include "validation/RecordValidatorBase.hpp"

#include "validation/FieldRules.hpp"

namespace zonekeeper::validation {

ValidationResult RecordValidatorBase::validate(const std::string& sContent,
                                               const std::string& sName,
                                               const std::string& sPriority,
                                               const std::string& sTtl,
                                               uint32_t uDefaultTtl) const {
  std::vector<std::string> vErrors;

  checkName(sName, vErrors);
  checkContent(sContent, sName, vErrors);
  const auto oPriority = FieldRules::parsePriority(sPriority, defaultPriority(), vErrors);
  const auto oTtl = FieldRules::parseTtl(sTtl, uDefaultTtl, vErrors);

  if (!vErrors.empty()) {
    return ValidationResult::failure(std::move(vErrors));
  }

  return ValidationResult::success(ValidatedRecord{sName, sContent, *oTtl, *oPriority});
}

void RecordValidatorBase::checkName(const std::string& sName,
                                    std::vector<std::string>& vErrors) const {
  if (sName.size() > FieldRules::kMaxNameLength) {
    vErrors.push_back("Invalid hostname: the name is longer than 255 characters.");
    return;
  }
  if (!FieldRules::isValidHostname(sName, true)) {
    vErrors.push_back("Invalid hostname '" + sName + "'.");
  }
}

}  // namespace zonekeeper::validation
