#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zonekeeper::validation {

/// Field-level checks shared by the record validators.
class FieldRules {
 public:
  static constexpr size_t kMaxNameLength = 255;
  static constexpr size_t kMaxLabelLength = 63;
  static constexpr uint32_t kMaxTtl = 2147483647;
  static constexpr int kMaxPriority = 65535;

  /// Hostname of at most 255 characters (one trailing dot tolerated), labels of
  /// 1-63 letters/digits/hyphens/underscores without a leading or trailing
  /// hyphen. When bAllowWildcard is set, the first label may be "*".
  static bool isValidHostname(std::string_view svName, bool bAllowWildcard = false);

  /// Whitespace-separated fields.
  static std::vector<std::string> splitFields(std::string_view svContent);

  /// Decimal digits only, no sign. nullopt on empty, non-digit or overflow.
  static std::optional<uint64_t> parseUnsigned(std::string_view svValue);

  /// Unsigned integer within [uMin, uMax].
  static bool isUnsignedInRange(std::string_view svValue, uint64_t uMin, uint64_t uMax);

  static bool isHex(std::string_view svValue);

  /// True for an empty or all-whitespace string.
  static bool isBlank(std::string_view svValue);

  /// Blank gives uDefaultTtl; otherwise an integer in [0, kMaxTtl].
  /// Appends a message to vErrors and returns nullopt on failure.
  static std::optional<uint32_t> parseTtl(std::string_view svTtl, uint32_t uDefaultTtl,
                                          std::vector<std::string>& vErrors);

  /// Blank gives iDefault; otherwise an integer in [0, kMaxPriority].
  static std::optional<int> parsePriority(std::string_view svPriority, int iDefault,
                                          std::vector<std::string>& vErrors);
};

}  // namespace zonekeeper::validation
