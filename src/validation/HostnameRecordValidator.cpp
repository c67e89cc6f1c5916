#include "validation/HostnameRecordValidator.hpp"

#include "dns/NameRules.hpp"
#include "validation/FieldRules.hpp"

#include <stdexcept>

namespace zonekeeper::validation {

HostnameRecordValidator::HostnameRecordValidator(common::RecordType rtType) : _rtType(rtType) {
  switch (rtType) {
    case common::RecordType::CNAME:
    case common::RecordType::DNAME:
    case common::RecordType::NS:
    case common::RecordType::PTR:
    case common::RecordType::ALIAS:
      break;
    default:
      throw std::invalid_argument("HostnameRecordValidator does not handle type " +
                                  std::string(common::toString(rtType)));
  }
}

void HostnameRecordValidator::checkName(const std::string& sName,
                                        std::vector<std::string>& vErrors) const {
  if (_rtType == common::RecordType::PTR && sName.size() <= FieldRules::kMaxNameLength &&
      dns::NameRules::isReverseZone(sName)) {
    return;
  }
  RecordValidatorBase::checkName(sName, vErrors);
}

void HostnameRecordValidator::checkContent(const std::string& sContent, const std::string& sName,
                                           std::vector<std::string>& vErrors) const {
  const std::string sType(common::toString(_rtType));
  if (!FieldRules::isValidHostname(sContent)) {
    vErrors.push_back("Invalid " + sType + " target hostname '" + sContent + "'.");
    return;
  }
  if (_rtType == common::RecordType::CNAME && dns::NameRules::equals(sContent, sName)) {
    vErrors.push_back("A CNAME record cannot point to its own name.");
  }
}

}  // namespace zonekeeper::validation
