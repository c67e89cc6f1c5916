#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace zonekeeper::validation {

/// Normalized record fields produced by a successful validation.
/// Class abbreviation: vr
struct ValidatedRecord {
  std::string sName;
  std::string sContent;
  uint32_t uTtl = 0;
  int iPriority = 0;

  /// {"name": ..., "content": ..., "ttl": <int>, "prio": <int>}
  nlohmann::json toJson() const;
};

/// Outcome of validating one record: normalized data, or the ordered list of
/// problems found. isValid() == errors().empty() always holds.
class ValidationResult {
 public:
  static ValidationResult success(ValidatedRecord vrData);

  /// Throws std::invalid_argument if vErrors is empty.
  static ValidationResult failure(std::vector<std::string> vErrors);
  static ValidationResult failure(std::string sError);

  bool isValid() const { return _oData.has_value(); }
  const std::vector<std::string>& errors() const { return _vErrors; }

  /// Throws std::logic_error on an invalid result.
  const ValidatedRecord& data() const;

 private:
  ValidationResult() = default;

  std::optional<ValidatedRecord> _oData;
  std::vector<std::string> _vErrors;
};

}  // namespace zonekeeper::validation
