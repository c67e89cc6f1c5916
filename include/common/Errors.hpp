#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace zonekeeper::common {

/// Base error for all application-level exceptions.
/// Carries a status class (400 caller input, 403 refused, 404 missing,
/// 502 external tool) and a machine-readable error code slug. The CLI prints
/// the slug; library callers branch on the subclass.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// Input the caller must correct (e.g. single-label name). Status 400.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// Write refused because the zone is read-only (secondary). Status 403.
struct AuthorizationError : AppError {
  explicit AuthorizationError(std::string sCode, std::string sMsg)
      : AppError(403, std::move(sCode), std::move(sMsg)) {}
};

/// Zone or record id does not exist. Status 404.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(404, std::move(sCode), std::move(sMsg)) {}
};

/// The local pdnsutil binary could not be started. Status 502.
struct ProviderError : AppError {
  explicit ProviderError(std::string sCode, std::string sMsg)
      : AppError(502, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace zonekeeper::common
