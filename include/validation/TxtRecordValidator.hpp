#pragma once

#include "common/Types.hpp"
#include "validation/RecordValidatorBase.hpp"

namespace zonekeeper::validation {

/// TXT and SPF: free text with balanced double quotes and complete escapes.
class TxtRecordValidator : public RecordValidatorBase {
 public:
  static constexpr size_t kMaxContentLength = 65535;

  explicit TxtRecordValidator(common::RecordType rtType) : _rtType(rtType) {}

 protected:
  void checkContent(const std::string& sContent, const std::string& sName,
                    std::vector<std::string>& vErrors) const override;

 private:
  common::RecordType _rtType;
};

}  // namespace zonekeeper::validation
