#pragma once

#include <string>
#include <vector>

#include "validation/IRecordValidator.hpp"

namespace zonekeeper::validation {

/// Common validation sequence: name, content, priority, ttl. Errors from every
/// step are collected in that order before the result is built.
/// Subclasses supply the content grammar and may override the name grammar
/// and default priority.
class RecordValidatorBase : public IRecordValidator {
 public:
  ValidationResult validate(const std::string& sContent, const std::string& sName,
                            const std::string& sPriority, const std::string& sTtl,
                            uint32_t uDefaultTtl) const final;

 protected:
  /// Default: hostname with optional leading wildcard label.
  virtual void checkName(const std::string& sName, std::vector<std::string>& vErrors) const;

  virtual void checkContent(const std::string& sContent, const std::string& sName,
                            std::vector<std::string>& vErrors) const = 0;

  virtual int defaultPriority() const { return 0; }
};

}  // namespace zonekeeper::validation
