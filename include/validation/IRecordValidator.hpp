#pragma once

#include <cstdint>
#include <string>

#include "validation/ValidationResult.hpp"

namespace zonekeeper::validation {

/// Pure abstract interface for per-type record validation.
/// Implementations are stateless and safe to call concurrently.
class IRecordValidator {
 public:
  virtual ~IRecordValidator() = default;

  /// Check a proposed record. sPriority and sTtl are raw form values; blank
  /// values take the type default priority and uDefaultTtl respectively.
  virtual ValidationResult validate(const std::string& sContent, const std::string& sName,
                                    const std::string& sPriority, const std::string& sTtl,
                                    uint32_t uDefaultTtl) const = 0;
};

}  // namespace zonekeeper::validation
