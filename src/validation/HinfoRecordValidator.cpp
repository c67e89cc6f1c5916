#include "validation/HinfoRecordValidator.hpp"

#include <cctype>

namespace zonekeeper::validation {

void HinfoRecordValidator::checkContent(const std::string& sContent,
                                        const std::string& /*sName*/,
                                        std::vector<std::string>& vErrors) const {
  size_t uFieldCount = 0;
  size_t i = 0;
  while (i < sContent.size()) {
    if (std::isspace(static_cast<unsigned char>(sContent[i]))) {
      ++i;
      continue;
    }

    if (sContent[i] == '"') {
      size_t uClose = i + 1;
      while (uClose < sContent.size() && sContent[uClose] != '"') {
        // A backslash escapes the next character, including a quote.
        uClose += sContent[uClose] == '\\' ? 2 : 1;
      }
      if (uClose >= sContent.size()) {
        vErrors.push_back("HINFO content has an unterminated quoted string.");
        return;
      }
      i = uClose + 1;
      if (i < sContent.size() && !std::isspace(static_cast<unsigned char>(sContent[i]))) {
        vErrors.push_back("HINFO fields must be separated by whitespace.");
        return;
      }
    } else {
      while (i < sContent.size() && !std::isspace(static_cast<unsigned char>(sContent[i]))) {
        if (sContent[i] == '"') {
          vErrors.push_back("HINFO content has a stray double quote.");
          return;
        }
        ++i;
      }
    }
    ++uFieldCount;
  }

  if (uFieldCount != 2) {
    vErrors.push_back("HINFO content must consist of exactly two fields: <cpu> <os>.");
  }
}

}  // namespace zonekeeper::validation
