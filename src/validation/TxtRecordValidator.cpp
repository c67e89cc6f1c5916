#include "validation/TxtRecordValidator.hpp"

#include "validation/FieldRules.hpp"

namespace zonekeeper::validation {

void TxtRecordValidator::checkContent(const std::string& sContent, const std::string& /*sName*/,
                                      std::vector<std::string>& vErrors) const {
  const std::string sType(common::toString(_rtType));

  if (FieldRules::isBlank(sContent)) {
    vErrors.push_back(sType + " content must not be empty.");
    return;
  }
  if (sContent.size() > kMaxContentLength) {
    vErrors.push_back(sType + " content is longer than 65535 characters.");
    return;
  }

  bool bInQuotes = false;
  for (size_t i = 0; i < sContent.size(); ++i) {
    const char c = sContent[i];
    if (c == '\\') {
      if (i + 1 == sContent.size()) {
        vErrors.push_back(sType + " content ends with an incomplete escape sequence.");
        return;
      }
      ++i;
    } else if (c == '"') {
      bInQuotes = !bInQuotes;
    }
  }

  if (bInQuotes) {
    vErrors.push_back(sType + " content has unbalanced double quotes.");
  }
}

}  // namespace zonekeeper::validation
