#include "validation/FieldRules.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace zonekeeper::validation {

namespace {

bool isLabelChar(unsigned char c) { return std::isalnum(c) || c == '-' || c == '_'; }

}  // namespace

bool FieldRules::isValidHostname(std::string_view svName, bool bAllowWildcard) {
  if (svName.size() > kMaxNameLength) return false;
  if (!svName.empty() && svName.back() == '.') {
    svName.remove_suffix(1);
  }
  if (svName.empty()) return false;

  size_t uStart = 0;
  bool bFirst = true;
  while (true) {
    const size_t uDot = svName.find('.', uStart);
    const std::string_view svLabel =
        svName.substr(uStart, uDot == std::string_view::npos ? std::string_view::npos
                                                             : uDot - uStart);

    if (svLabel.empty() || svLabel.size() > kMaxLabelLength) return false;

    const bool bWildcard = bFirst && bAllowWildcard && svLabel == "*";
    if (!bWildcard) {
      if (!std::all_of(svLabel.begin(), svLabel.end(),
                       [](unsigned char c) { return isLabelChar(c); })) {
        return false;
      }
      if (svLabel.front() == '-' || svLabel.back() == '-') return false;
    }

    if (uDot == std::string_view::npos) break;
    uStart = uDot + 1;
    bFirst = false;
  }
  return true;
}

std::vector<std::string> FieldRules::splitFields(std::string_view svContent) {
  std::vector<std::string> vFields;
  size_t i = 0;
  while (i < svContent.size()) {
    while (i < svContent.size() && std::isspace(static_cast<unsigned char>(svContent[i]))) ++i;
    const size_t uStart = i;
    while (i < svContent.size() && !std::isspace(static_cast<unsigned char>(svContent[i]))) ++i;
    if (i > uStart) {
      vFields.emplace_back(svContent.substr(uStart, i - uStart));
    }
  }
  return vFields;
}

std::optional<uint64_t> FieldRules::parseUnsigned(std::string_view svValue) {
  if (svValue.empty()) return std::nullopt;
  if (!std::all_of(svValue.begin(), svValue.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  uint64_t uValue = 0;
  const auto [pEnd, ec] = std::from_chars(svValue.data(), svValue.data() + svValue.size(), uValue);
  if (ec != std::errc{} || pEnd != svValue.data() + svValue.size()) {
    return std::nullopt;
  }
  return uValue;
}

bool FieldRules::isUnsignedInRange(std::string_view svValue, uint64_t uMin, uint64_t uMax) {
  const auto oValue = parseUnsigned(svValue);
  return oValue && *oValue >= uMin && *oValue <= uMax;
}

bool FieldRules::isHex(std::string_view svValue) {
  return !svValue.empty() && std::all_of(svValue.begin(), svValue.end(), [](unsigned char c) {
    return std::isxdigit(c);
  });
}

bool FieldRules::isBlank(std::string_view svValue) {
  return std::all_of(svValue.begin(), svValue.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

std::optional<uint32_t> FieldRules::parseTtl(std::string_view svTtl, uint32_t uDefaultTtl,
                                             std::vector<std::string>& vErrors) {
  if (isBlank(svTtl)) {
    return uDefaultTtl;
  }
  const auto oValue = parseUnsigned(svTtl);
  if (!oValue || *oValue > kMaxTtl) {
    vErrors.push_back("Invalid value for TTL field. It should be an integer between 0 and " +
                      std::to_string(kMaxTtl) + ".");
    return std::nullopt;
  }
  return static_cast<uint32_t>(*oValue);
}

std::optional<int> FieldRules::parsePriority(std::string_view svPriority, int iDefault,
                                             std::vector<std::string>& vErrors) {
  if (isBlank(svPriority)) {
    return iDefault;
  }
  const auto oValue = parseUnsigned(svPriority);
  if (!oValue || *oValue > static_cast<uint64_t>(kMaxPriority)) {
    vErrors.push_back("Invalid value for the priority field. It should be an integer between 0 and " +
                      std::to_string(kMaxPriority) + ".");
    return std::nullopt;
  }
  return static_cast<int>(*oValue);
}

}  // namespace zonekeeper::validation
