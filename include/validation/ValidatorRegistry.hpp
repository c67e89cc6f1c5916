#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "common/Types.hpp"
#include "validation/IRecordValidator.hpp"

namespace zonekeeper::validation {

/// Maps each supported record type to its validator.
/// Immutable after construction; safe to share across threads.
/// Class abbreviation: vreg
class ValidatorRegistry {
 public:
  /// Registers a validator for every common::RecordType.
  ValidatorRegistry();
  ~ValidatorRegistry();

  ValidatorRegistry(const ValidatorRegistry&) = delete;
  ValidatorRegistry& operator=(const ValidatorRegistry&) = delete;

  /// Returns nullptr when no validator is registered for the type.
  const IRecordValidator* find(common::RecordType rtType) const;

  /// Returns nullptr for unsupported type tokens.
  const IRecordValidator* find(std::string_view svType) const;

  /// Validate with the validator registered for svType. An unsupported type
  /// yields an invalid result naming the token.
  ValidationResult validate(std::string_view svType, const std::string& sContent,
                            const std::string& sName, const std::string& sPriority,
                            const std::string& sTtl, uint32_t uDefaultTtl) const;

 private:
  std::map<common::RecordType, std::unique_ptr<IRecordValidator>> _mValidators;
};

}  // namespace zonekeeper::validation
