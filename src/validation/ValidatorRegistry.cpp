#include "validation/ValidatorRegistry.hpp"

#include "validation/AddressRecordValidator.hpp"
#include "validation/CaaRecordValidator.hpp"
#include "validation/DsRecordValidator.hpp"
#include "validation/HinfoRecordValidator.hpp"
#include "validation/HostnameRecordValidator.hpp"
#include "validation/MxRecordValidator.hpp"
#include "validation/SoaRecordValidator.hpp"
#include "validation/SrvRecordValidator.hpp"
#include "validation/SshfpRecordValidator.hpp"
#include "validation/TlsaRecordValidator.hpp"
#include "validation/TxtRecordValidator.hpp"

namespace zonekeeper::validation {

using common::RecordType;

ValidatorRegistry::ValidatorRegistry() {
  _mValidators[RecordType::A] = std::make_unique<AddressRecordValidator>(RecordType::A);
  _mValidators[RecordType::AAAA] = std::make_unique<AddressRecordValidator>(RecordType::AAAA);

  for (auto rt : {RecordType::CNAME, RecordType::DNAME, RecordType::NS, RecordType::PTR,
                  RecordType::ALIAS}) {
    _mValidators[rt] = std::make_unique<HostnameRecordValidator>(rt);
  }

  _mValidators[RecordType::MX] = std::make_unique<MxRecordValidator>();
  _mValidators[RecordType::SRV] = std::make_unique<SrvRecordValidator>();
  _mValidators[RecordType::TXT] = std::make_unique<TxtRecordValidator>(RecordType::TXT);
  _mValidators[RecordType::SPF] = std::make_unique<TxtRecordValidator>(RecordType::SPF);
  _mValidators[RecordType::CAA] = std::make_unique<CaaRecordValidator>();
  _mValidators[RecordType::SSHFP] = std::make_unique<SshfpRecordValidator>();
  _mValidators[RecordType::TLSA] = std::make_unique<TlsaRecordValidator>();
  _mValidators[RecordType::DS] = std::make_unique<DsRecordValidator>();
  _mValidators[RecordType::HINFO] = std::make_unique<HinfoRecordValidator>();
  _mValidators[RecordType::SOA] = std::make_unique<SoaRecordValidator>();
}

ValidatorRegistry::~ValidatorRegistry() = default;

const IRecordValidator* ValidatorRegistry::find(RecordType rtType) const {
  auto it = _mValidators.find(rtType);
  return it == _mValidators.end() ? nullptr : it->second.get();
}

const IRecordValidator* ValidatorRegistry::find(std::string_view svType) const {
  const auto oType = common::parseRecordType(svType);
  return oType ? find(*oType) : nullptr;
}

ValidationResult ValidatorRegistry::validate(std::string_view svType, const std::string& sContent,
                                             const std::string& sName,
                                             const std::string& sPriority,
                                             const std::string& sTtl,
                                             uint32_t uDefaultTtl) const {
  const IRecordValidator* pValidator = find(svType);
  if (pValidator == nullptr) {
    return ValidationResult::failure("Unsupported record type '" + std::string(svType) + "'.");
  }
  return pValidator->validate(sContent, sName, sPriority, sTtl, uDefaultTtl);
}

}  // namespace zonekeeper::validation
