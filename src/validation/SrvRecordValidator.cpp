#include "validation/SrvRecordValidator.hpp"

#include "validation/FieldRules.hpp"

#include <algorithm>
#include <cctype>

namespace zonekeeper::validation {

namespace {

constexpr uint64_t kMaxSrvField = 65535;

// "_sip", "_xmpp-server": underscore followed by letters, digits and hyphens.
bool isServiceLabel(std::string_view svLabel) {
  if (svLabel.size() < 2 || svLabel.front() != '_') return false;
  return std::all_of(svLabel.begin() + 1, svLabel.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '-';
  });
}

}  // namespace

void SrvRecordValidator::checkName(const std::string& sName,
                                   std::vector<std::string>& vErrors) const {
  if (sName.size() > FieldRules::kMaxNameLength) {
    vErrors.push_back("Invalid SRV name: the name is longer than 255 characters.");
    return;
  }

  std::string_view svName(sName);
  if (!svName.empty() && svName.back() == '.') {
    svName.remove_suffix(1);
  }

  const size_t uFirstDot = svName.find('.');
  const size_t uSecondDot =
      uFirstDot == std::string_view::npos ? std::string_view::npos : svName.find('.', uFirstDot + 1);
  if (uSecondDot == std::string_view::npos) {
    vErrors.push_back("Invalid SRV name '" + sName +
                      "': expected _<service>._<protocol>.<domain>.");
    return;
  }

  const std::string_view svService = svName.substr(0, uFirstDot);
  const std::string_view svProtocol = svName.substr(uFirstDot + 1, uSecondDot - uFirstDot - 1);
  const std::string_view svDomain = svName.substr(uSecondDot + 1);

  if (!isServiceLabel(svService)) {
    vErrors.push_back("Invalid SRV service label '" + std::string(svService) +
                      "': it must start with an underscore and contain only letters, "
                      "digits and hyphens.");
  }
  if (!isServiceLabel(svProtocol)) {
    vErrors.push_back("Invalid SRV protocol label '" + std::string(svProtocol) +
                      "': it must start with an underscore and contain only letters, "
                      "digits and hyphens.");
  }
  if (!FieldRules::isValidHostname(svDomain)) {
    vErrors.push_back("Invalid SRV name '" + sName + "': the domain part is missing or invalid.");
  }
}

void SrvRecordValidator::checkContent(const std::string& sContent, const std::string& /*sName*/,
                                      std::vector<std::string>& vErrors) const {
  const auto vFields = FieldRules::splitFields(sContent);
  if (vFields.size() != 3) {
    vErrors.push_back(
        "SRV content must consist of exactly three fields: <weight> <port> <target>.");
    return;
  }

  if (!FieldRules::isUnsignedInRange(vFields[0], 0, kMaxSrvField)) {
    vErrors.push_back("Invalid SRV weight '" + vFields[0] +
                      "': it must be an integer between 0 and 65535.");
  }
  if (!FieldRules::isUnsignedInRange(vFields[1], 0, kMaxSrvField)) {
    vErrors.push_back("Invalid SRV port '" + vFields[1] +
                      "': it must be an integer between 0 and 65535.");
  }
  if (vFields[2] != "." && !FieldRules::isValidHostname(vFields[2])) {
    vErrors.push_back("Invalid SRV target '" + vFields[2] + "': expected a hostname or '.'.");
  }
}

}  // namespace zonekeeper::validation
