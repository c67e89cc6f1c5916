#include "validation/CaaRecordValidator.hpp"

#include "validation/FieldRules.hpp"

#include <algorithm>
#include <cctype>

namespace zonekeeper::validation {

namespace {

// Splits off the next whitespace-delimited token, advancing svRest past it.
std::string_view nextToken(std::string_view& svRest) {
  const size_t uStart = svRest.find_first_not_of(" \t");
  if (uStart == std::string_view::npos) {
    svRest = {};
    return {};
  }
  svRest.remove_prefix(uStart);
  const size_t uEnd = svRest.find_first_of(" \t");
  const std::string_view svToken = svRest.substr(0, uEnd);
  svRest.remove_prefix(uEnd == std::string_view::npos ? svRest.size() : uEnd);
  return svToken;
}

}  // namespace

void CaaRecordValidator::checkContent(const std::string& sContent, const std::string& /*sName*/,
                                      std::vector<std::string>& vErrors) const {
  std::string_view svRest(sContent);
  const std::string_view svFlags = nextToken(svRest);
  const std::string_view svTag = nextToken(svRest);

  const size_t uValueStart = svRest.find_first_not_of(" \t");
  std::string_view svValue =
      uValueStart == std::string_view::npos ? std::string_view{} : svRest.substr(uValueStart);
  while (!svValue.empty() && (svValue.back() == ' ' || svValue.back() == '\t')) {
    svValue.remove_suffix(1);
  }

  if (svFlags.empty() || svTag.empty() || svValue.empty()) {
    vErrors.push_back("CAA content must have the form <flags> <tag> \"<value>\".");
    return;
  }

  if (!FieldRules::isUnsignedInRange(svFlags, 0, 255)) {
    vErrors.push_back("Invalid CAA flags '" + std::string(svFlags) +
                      "': it must be an integer between 0 and 255.");
  }

  std::string sTag(svTag);
  std::transform(sTag.begin(), sTag.end(), sTag.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (sTag != "issue" && sTag != "issuewild" && sTag != "iodef") {
    vErrors.push_back("Invalid CAA tag '" + std::string(svTag) +
                      "': expected issue, issuewild or iodef.");
  }

  if (svValue.size() < 2 || svValue.front() != '"' || svValue.back() != '"') {
    vErrors.push_back("The CAA value must be enclosed in double quotes.");
  }
}

}  // namespace zonekeeper::validation
