#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace zonekeeper::common {

/// Environment variable loader. Loads all ZK_* variables into a typed struct
/// with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Database ──────────────────────────────────────────────────────────
  std::optional<std::string> oDbUrl;  // secret (wiped after handoff to ConnectionPool)
  int iDbPoolSize = 4;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── Records ───────────────────────────────────────────────────────────
  uint32_t uDefaultTtl = 86400;
  bool bRecordCommentsSync = false;

  // ── DNSSEC ────────────────────────────────────────────────────────────
  bool bDnssecEnabled = false;
  std::string sPdnsutilPath = "/usr/bin/pdnsutil";
  std::optional<std::string> oPdnsConfigDir;

  // ── Audit ─────────────────────────────────────────────────────────────
  bool bAuditStdout = false;

  /// Load and validate all config from environment variables.
  /// ZK_DB_URL supports a ZK_DB_URL_FILE fallback.
  /// Throws std::runtime_error on invalid values or violated constraints.
  static Config load();

 private:
  /// Read a secret env var, falling back to the file named by varName + "_FILE".
  /// Trims trailing whitespace/newlines from file contents.
  /// Returns nullopt when neither variable is set.
  static std::optional<std::string> loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as bool (true/1/yes), default when unset.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace zonekeeper::common
