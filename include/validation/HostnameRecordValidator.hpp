#pragma once

#include "common/Types.hpp"
#include "validation/RecordValidatorBase.hpp"

namespace zonekeeper::validation {

/// Types whose content is a single target hostname: CNAME, DNAME, NS, PTR, ALIAS.
/// PTR names may be classless reverse names ("1.160/27.236.20.172.in-addr.arpa").
/// A CNAME may not point at its own name.
/// Class abbreviation: hrv
class HostnameRecordValidator : public RecordValidatorBase {
 public:
  explicit HostnameRecordValidator(common::RecordType rtType);

 protected:
  void checkName(const std::string& sName, std::vector<std::string>& vErrors) const override;
  void checkContent(const std::string& sContent, const std::string& sName,
                    std::vector<std::string>& vErrors) const override;

 private:
  common::RecordType _rtType;
};

}  // namespace zonekeeper::validation
