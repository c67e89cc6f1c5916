#include "common/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace zonekeeper::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  size_t uPos = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sValue, &uPos);
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  if (uPos != sValue.size()) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  return sValue == "true" || sValue == "1" || sValue == "yes";
}

std::optional<std::string> Config::loadSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return std::nullopt;
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Database ───────────────────────────────────────────────────────────
  cfg.oDbUrl = loadSecret("ZK_DB_URL");
  cfg.iDbPoolSize = getEnvInt("ZK_DB_POOL_SIZE", 4);

  // ── Logging ────────────────────────────────────────────────────────────
  const std::string sLogLevel = getEnv("ZK_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Records ────────────────────────────────────────────────────────────
  const int iDefaultTtl = getEnvInt("ZK_DNS_TTL", 86400);
  cfg.bRecordCommentsSync = getEnvBool("ZK_RECORD_COMMENTS_SYNC", false);

  // ── DNSSEC ─────────────────────────────────────────────────────────────
  cfg.bDnssecEnabled = getEnvBool("ZK_DNSSEC_ENABLED", false);
  const std::string sPdnsutil = getEnv("ZK_PDNSUTIL_PATH");
  if (!sPdnsutil.empty()) {
    cfg.sPdnsutilPath = sPdnsutil;
  }
  const std::string sConfigDir = getEnv("ZK_PDNS_CONFIG_DIR");
  if (!sConfigDir.empty()) {
    cfg.oPdnsConfigDir = sConfigDir;
  }

  // ── Audit ──────────────────────────────────────────────────────────────
  cfg.bAuditStdout = getEnvBool("ZK_AUDIT_STDOUT", false);

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.iDbPoolSize < 1) {
    throw std::runtime_error(
        "ZK_DB_POOL_SIZE must be >= 1 (got " + std::to_string(cfg.iDbPoolSize) + ")");
  }

  if (iDefaultTtl < 0) {
    throw std::runtime_error(
        "ZK_DNS_TTL must be >= 0 (got " + std::to_string(iDefaultTtl) + ")");
  }
  cfg.uDefaultTtl = static_cast<uint32_t>(iDefaultTtl);

  return cfg;
}

}  // namespace zonekeeper::common
