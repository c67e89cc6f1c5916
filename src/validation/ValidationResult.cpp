#include "validation/ValidationResult.hpp"

#include <stdexcept>
#include <utility>

namespace zonekeeper::validation {

nlohmann::json ValidatedRecord::toJson() const {
  return nlohmann::json{
      {"name", sName},
      {"content", sContent},
      {"ttl", uTtl},
      {"prio", iPriority},
  };
}

ValidationResult ValidationResult::success(ValidatedRecord vrData) {
  ValidationResult vrResult;
  vrResult._oData = std::move(vrData);
  return vrResult;
}

ValidationResult ValidationResult::failure(std::vector<std::string> vErrors) {
  if (vErrors.empty()) {
    throw std::invalid_argument("ValidationResult::failure requires at least one error");
  }
  ValidationResult vrResult;
  vrResult._vErrors = std::move(vErrors);
  return vrResult;
}

ValidationResult ValidationResult::failure(std::string sError) {
  return failure(std::vector<std::string>{std::move(sError)});
}

const ValidatedRecord& ValidationResult::data() const {
  if (!_oData) {
    throw std::logic_error("ValidationResult::data() called on an invalid result");
  }
  return *_oData;
}

}  // namespace zonekeeper::validation
