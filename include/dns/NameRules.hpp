#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace zonekeeper::dns {

/// Zone-relative name arithmetic over domain-name strings.
/// All functions are pure and tolerate one trailing dot on their inputs.
/// Class abbreviation: N/A (static interface)
class NameRules {
 public:
  /// True for names under in-addr.arpa or ip6.arpa with at least one label in
  /// front of the suffix. Labels may carry a "/<prefix>" CIDR marker
  /// (e.g. "160/27.236.20.172.in-addr.arpa"). Leading or trailing
  /// whitespace makes the name invalid.
  static bool isReverseZone(std::string_view svName);

  /// Last two labels of the name, or last three when the last two form a
  /// known second-level country-code suffix such as "co.uk".
  /// Throws ValidationError("single_label_name") for names with one label.
  static std::string getRegisteredDomain(std::string_view svFqdn);

  /// Labels in front of the registered domain. Names with two or fewer labels
  /// are returned exactly as given, trailing dot included; "example.co.uk"
  /// yields "example".
  static std::string getSubDomainName(std::string_view svFqdn);

  /// "@" at the zone apex, the relative part when svName lies under svZone,
  /// svName unchanged otherwise. Comparison is case-insensitive and the
  /// relative part keeps its original casing.
  static std::string stripZoneSuffix(std::string_view svName, std::string_view svZone);

  /// Inverse of stripZoneSuffix. Empty input and "@" give the zone; names
  /// already ending in the zone are not qualified twice.
  static std::string restoreZoneSuffix(std::string_view svRelative, std::string_view svZone);

  /// "192.0.2.1" -> "1.2.0.192.in-addr.arpa". nullopt if not an IPv4 address.
  static std::optional<std::string> ipv4ToPtrName(const std::string& sAddress);

  /// Nibble-reversed ip6.arpa name. nullopt if not an IPv6 address.
  static std::optional<std::string> ipv6ToPtrName(const std::string& sAddress);

  /// Copy with one trailing dot removed, casing kept.
  static std::string trimTrailingDot(std::string_view svName);

  /// Lower-case copy with one trailing dot removed.
  static std::string canonical(std::string_view svName);

  /// Case-insensitive equality of two names, ignoring one trailing dot each.
  static bool equals(std::string_view svLhs, std::string_view svRhs);
};

}  // namespace zonekeeper::dns
