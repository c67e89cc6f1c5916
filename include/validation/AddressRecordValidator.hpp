#pragma once

#include "common/Types.hpp"
#include "validation/RecordValidatorBase.hpp"

namespace zonekeeper::validation {

/// A and AAAA: content must be an address of the matching family.
class AddressRecordValidator : public RecordValidatorBase {
 public:
  /// rtType must be RecordType::A or RecordType::AAAA.
  explicit AddressRecordValidator(common::RecordType rtType);

 protected:
  void checkContent(const std::string& sContent, const std::string& sName,
                    std::vector<std::string>& vErrors) const override;

 private:
  common::RecordType _rtType;
};

}  // namespace zonekeeper::validation
