#include "validation/AddressRecordValidator.hpp"

#include <arpa/inet.h>

#include <array>
#include <stdexcept>

namespace zonekeeper::validation {

AddressRecordValidator::AddressRecordValidator(common::RecordType rtType) : _rtType(rtType) {
  if (rtType != common::RecordType::A && rtType != common::RecordType::AAAA) {
    throw std::invalid_argument("AddressRecordValidator handles only A and AAAA records");
  }
}

void AddressRecordValidator::checkContent(const std::string& sContent,
                                          const std::string& /*sName*/,
                                          std::vector<std::string>& vErrors) const {
  std::array<unsigned char, 16> aBuffer{};
  if (_rtType == common::RecordType::A) {
    if (inet_pton(AF_INET, sContent.c_str(), aBuffer.data()) != 1) {
      vErrors.push_back("Invalid IPv4 address '" + sContent + "'.");
    }
    return;
  }
  if (inet_pton(AF_INET6, sContent.c_str(), aBuffer.data()) != 1) {
    vErrors.push_back("Invalid IPv6 address '" + sContent + "'.");
  }
}

}  // namespace zonekeeper::validation
