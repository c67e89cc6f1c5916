#include "providers/PdnsutilDnssecProvider.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <spawn.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstring>

extern char** environ;

namespace zonekeeper::providers {

PdnsutilDnssecProvider::PdnsutilDnssecProvider(std::string sBinaryPath,
                                               std::optional<std::string> oConfigDir)
    : _sBinaryPath(std::move(sBinaryPath)), _oConfigDir(std::move(oConfigDir)) {}

PdnsutilDnssecProvider::~PdnsutilDnssecProvider() = default;

std::string PdnsutilDnssecProvider::name() const { return "pdnsutil"; }

std::vector<std::string> PdnsutilDnssecProvider::buildRectifyCommand(
    const std::string& sZoneName) const {
  std::vector<std::string> vArgs{_sBinaryPath};
  if (_oConfigDir) {
    vArgs.push_back("--config-dir=" + *_oConfigDir);
  }
  vArgs.push_back("rectify-zone");
  vArgs.push_back(sZoneName);
  return vArgs;
}

bool PdnsutilDnssecProvider::rectifyZone(const std::string& sZoneName) {
  auto vArgs = buildRectifyCommand(sZoneName);
  std::vector<char*> vArgv;
  vArgv.reserve(vArgs.size() + 1);
  for (auto& sArg : vArgs) {
    vArgv.push_back(sArg.data());
  }
  vArgv.push_back(nullptr);

  pid_t pid = 0;
  const int iSpawnRc =
      posix_spawn(&pid, _sBinaryPath.c_str(), nullptr, nullptr, vArgv.data(), environ);
  if (iSpawnRc != 0) {
    throw common::ProviderError("pdnsutil_unavailable",
                                "Cannot start " + _sBinaryPath + ": " + std::strerror(iSpawnRc));
  }

  int iStatus = 0;
  while (waitpid(pid, &iStatus, 0) < 0) {
    if (errno != EINTR) {
      throw common::ProviderError("pdnsutil_wait_failed",
                                  std::string("waitpid failed: ") + std::strerror(errno));
    }
  }

  const bool bOk = WIFEXITED(iStatus) && WEXITSTATUS(iStatus) == 0;
  if (!bOk) {
    common::Logger::get()->warn("pdnsutil rectify-zone {} exited abnormally (status {})",
                                sZoneName, iStatus);
  }
  return bOk;
}

}  // namespace zonekeeper::providers
