#include "dns/NameRules.hpp"

#include "common/Errors.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <set>
#include <vector>

namespace zonekeeper::dns {

namespace {

constexpr std::string_view kIpv4ReverseSuffix = ".in-addr.arpa";
constexpr std::string_view kIpv6ReverseSuffix = ".ip6.arpa";

// Second-level labels under which registrations happen one level deeper.
const std::set<std::string, std::less<>> kCountryCodeSlds = {
    "co.uk", "org.uk", "ac.uk", "gov.uk", "me.uk", "ltd.uk", "plc.uk", "net.uk",
    "com.au", "net.au", "org.au", "edu.au", "gov.au",
    "co.nz", "org.nz", "net.nz",
    "co.jp", "ne.jp", "or.jp",
    "com.br", "net.br", "org.br",
    "co.za", "org.za",
    "com.cn", "net.cn", "org.cn",
    "co.in", "net.in", "org.in",
    "com.mx", "com.ar", "com.tr", "co.kr", "com.sg", "co.il",
};

std::string_view stripTrailingDot(std::string_view sv) {
  if (!sv.empty() && sv.back() == '.') {
    sv.remove_suffix(1);
  }
  return sv;
}

std::string toLower(std::string_view sv) {
  std::string sOut(sv);
  std::transform(sOut.begin(), sOut.end(), sOut.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sOut;
}

bool endsWith(std::string_view svValue, std::string_view svSuffix) {
  return svValue.size() >= svSuffix.size() &&
         svValue.compare(svValue.size() - svSuffix.size(), svSuffix.size(), svSuffix) == 0;
}

std::vector<std::string> splitLabels(std::string_view svName) {
  std::vector<std::string> vLabels;
  size_t uStart = 0;
  while (uStart <= svName.size()) {
    const size_t uDot = svName.find('.', uStart);
    if (uDot == std::string_view::npos) {
      vLabels.emplace_back(svName.substr(uStart));
      break;
    }
    vLabels.emplace_back(svName.substr(uStart, uDot - uStart));
    uStart = uDot + 1;
  }
  return vLabels;
}

std::string joinLabels(const std::vector<std::string>& vLabels, size_t uFirst, size_t uLast) {
  std::string sOut;
  for (size_t i = uFirst; i < uLast; ++i) {
    if (!sOut.empty()) sOut += '.';
    sOut += vLabels[i];
  }
  return sOut;
}

bool isReverseLabel(std::string_view svLabel) {
  if (svLabel.empty()) return false;
  return std::all_of(svLabel.begin(), svLabel.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '/';
  });
}

}  // namespace

std::string NameRules::trimTrailingDot(std::string_view svName) {
  return std::string(stripTrailingDot(svName));
}

std::string NameRules::canonical(std::string_view svName) {
  return toLower(stripTrailingDot(svName));
}

bool NameRules::equals(std::string_view svLhs, std::string_view svRhs) {
  return canonical(svLhs) == canonical(svRhs);
}

bool NameRules::isReverseZone(std::string_view svName) {
  if (svName.empty() || std::isspace(static_cast<unsigned char>(svName.front())) ||
      std::isspace(static_cast<unsigned char>(svName.back()))) {
    return false;
  }

  const std::string sName = canonical(svName);
  std::string_view svPrefix;
  if (endsWith(sName, kIpv4ReverseSuffix)) {
    svPrefix = std::string_view(sName).substr(0, sName.size() - kIpv4ReverseSuffix.size());
  } else if (endsWith(sName, kIpv6ReverseSuffix)) {
    svPrefix = std::string_view(sName).substr(0, sName.size() - kIpv6ReverseSuffix.size());
  } else {
    return false;
  }

  if (svPrefix.empty()) return false;

  const auto vLabels = splitLabels(svPrefix);
  return std::all_of(vLabels.begin(), vLabels.end(),
                     [](const std::string& sLabel) { return isReverseLabel(sLabel); });
}

std::string NameRules::getRegisteredDomain(std::string_view svFqdn) {
  const auto vLabels = splitLabels(stripTrailingDot(svFqdn));
  if (vLabels.size() < 2) {
    throw common::ValidationError(
        "single_label_name",
        "Cannot determine the registered domain of single-label name '" +
            std::string(svFqdn) + "'");
  }

  const size_t uCount = vLabels.size();
  if (uCount >= 3) {
    const std::string sLastTwo = toLower(vLabels[uCount - 2] + "." + vLabels[uCount - 1]);
    if (kCountryCodeSlds.contains(sLastTwo)) {
      return joinLabels(vLabels, uCount - 3, uCount);
    }
  }
  return joinLabels(vLabels, uCount - 2, uCount);
}

std::string NameRules::getSubDomainName(std::string_view svFqdn) {
  const std::string_view svName = stripTrailingDot(svFqdn);
  const auto vLabels = splitLabels(svName);
  if (vLabels.size() <= 2) {
    return std::string(svFqdn);
  }

  const size_t uRegisteredLabels = splitLabels(getRegisteredDomain(svName)).size();
  const size_t uPrefixLabels = vLabels.size() - uRegisteredLabels;
  if (uPrefixLabels == 0) {
    return vLabels.front();
  }
  return joinLabels(vLabels, 0, uPrefixLabels);
}

std::string NameRules::stripZoneSuffix(std::string_view svName, std::string_view svZone) {
  const std::string_view svBareName = stripTrailingDot(svName);
  const std::string sLowerName = toLower(svBareName);
  const std::string sLowerZone = canonical(svZone);

  if (sLowerName == sLowerZone) {
    return "@";
  }

  if (!sLowerZone.empty() && endsWith(sLowerName, "." + sLowerZone)) {
    return std::string(svBareName.substr(0, svBareName.size() - sLowerZone.size() - 1));
  }

  return std::string(svName);
}

std::string NameRules::restoreZoneSuffix(std::string_view svRelative, std::string_view svZone) {
  const std::string_view svRel = stripTrailingDot(svRelative);
  const std::string_view svBareZone = stripTrailingDot(svZone);

  if (svRel.empty() || svRel == "@") {
    return std::string(svBareZone);
  }

  const std::string sLowerRel = toLower(svRel);
  const std::string sLowerZone = toLower(svBareZone);
  if (sLowerRel == sLowerZone || endsWith(sLowerRel, "." + sLowerZone)) {
    return std::string(svRel);
  }

  return std::string(svRel) + "." + std::string(svBareZone);
}

std::optional<std::string> NameRules::ipv4ToPtrName(const std::string& sAddress) {
  std::array<unsigned char, 4> aBytes{};
  if (inet_pton(AF_INET, sAddress.c_str(), aBytes.data()) != 1) {
    return std::nullopt;
  }
  return std::to_string(aBytes[3]) + "." + std::to_string(aBytes[2]) + "." +
         std::to_string(aBytes[1]) + "." + std::to_string(aBytes[0]) + ".in-addr.arpa";
}

std::optional<std::string> NameRules::ipv6ToPtrName(const std::string& sAddress) {
  std::array<unsigned char, 16> aBytes{};
  if (inet_pton(AF_INET6, sAddress.c_str(), aBytes.data()) != 1) {
    return std::nullopt;
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string sOut;
  sOut.reserve(72);
  for (auto it = aBytes.rbegin(); it != aBytes.rend(); ++it) {
    sOut += kHex[*it & 0x0f];
    sOut += '.';
    sOut += kHex[(*it >> 4) & 0x0f];
    sOut += '.';
  }
  sOut += "ip6.arpa";
  return sOut;
}

}  // namespace zonekeeper::dns
