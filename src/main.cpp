#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/Types.hpp"
#include "core/CommentSyncService.hpp"
#include "core/RecordManager.hpp"
#include "dal/AuditRepository.hpp"
#include "dal/CommentRepository.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/RecordRepository.hpp"
#include "providers/IDnssecProvider.hpp"
#include "providers/ProviderFactory.hpp"
#include "validation/ValidatorRegistry.hpp"

#include <openssl/crypto.h>

namespace {

constexpr int kExitUsage = 2;

void printUsage() {
  std::cerr << "usage:\n"
               "  zonekeeper validate <type> <name> <content> [ttl] [prio]\n"
               "  zonekeeper add <zone-id> <name> <type> <content> [ttl] [prio] [comment]\n"
               "  zonekeeper edit <record-id> <name> <type> <content> [ttl] [prio] [comment]\n";
}

std::string argOr(const std::vector<std::string>& vArgs, size_t uIndex) {
  return uIndex < vArgs.size() ? vArgs[uIndex] : std::string{};
}

int64_t parseId(const std::string& sValue, const char* pWhat) {
  size_t uPos = 0;
  int64_t iId = 0;
  try {
    iId = std::stoll(sValue, &uPos);
  } catch (const std::exception&) {
    throw std::runtime_error(std::string(pWhat) + " must be an integer, got '" + sValue + "'");
  }
  if (uPos != sValue.size() || iId <= 0) {
    throw std::runtime_error(std::string(pWhat) + " must be a positive integer, got '" +
                             sValue + "'");
  }
  return iId;
}

int runValidate(const std::vector<std::string>& vArgs, const zonekeeper::common::Config& cfg) {
  zonekeeper::validation::ValidatorRegistry vregRegistry;
  const auto vr = vregRegistry.validate(vArgs[1], vArgs[3], vArgs[2], argOr(vArgs, 5),
                                        argOr(vArgs, 4), cfg.uDefaultTtl);
  if (!vr.isValid()) {
    for (const auto& sError : vr.errors()) {
      std::cout << sError << "\n";
    }
    return EXIT_FAILURE;
  }
  std::cout << vr.data().toJson().dump() << "\n";
  return EXIT_SUCCESS;
}

int runWrite(const std::vector<std::string>& vArgs, zonekeeper::common::Config& cfg) {
  auto spLog = zonekeeper::common::Logger::get();

  if (!cfg.oDbUrl) {
    throw std::runtime_error("ZK_DB_URL (or ZK_DB_URL_FILE) is required for '" + vArgs[0] +
                             "'");
  }

  // ── Step 2: Initialize ConnectionPool ────────────────────────────────
  auto cpPool = std::make_unique<zonekeeper::dal::ConnectionPool>(*cfg.oDbUrl,
                                                                  cfg.iDbPoolSize);

  // Zero database URL from Config after handoff
  OPENSSL_cleanse(cfg.oDbUrl->data(), cfg.oDbUrl->size());
  cfg.oDbUrl.reset();

  spLog->debug("Step 2: ConnectionPool initialized (size={})", cfg.iDbPoolSize);

  // ── Step 3: Repositories and providers ───────────────────────────────
  zonekeeper::dal::RecordRepository rrRepo(*cpPool);
  zonekeeper::dal::CommentRepository cmrRepo(*cpPool);
  zonekeeper::dal::AuditRepository arRepo(*cpPool, cfg.bAuditStdout);
  auto upDnssec = zonekeeper::providers::ProviderFactory::createDnssecProvider(cfg);
  spLog->debug("Step 3: repositories ready (dnssec={})",
               upDnssec ? upDnssec->name() : std::string("disabled"));

  // ── Step 4: Record manager ───────────────────────────────────────────
  zonekeeper::validation::ValidatorRegistry vregRegistry;
  zonekeeper::core::CommentSyncService cssSync(cmrRepo, rrRepo, cfg.bRecordCommentsSync);
  zonekeeper::core::RecordManager rmManager(rrRepo, cssSync, arRepo, upDnssec.get(),
                                            vregRegistry, cfg.uDefaultTtl);

  const char* pUser = std::getenv("ZK_USER");
  const zonekeeper::common::RequestContext rcCtx{
      (pUser != nullptr && *pUser != '\0') ? pUser : "cli", "127.0.0.1"};

  zonekeeper::common::RecordDraft rdDraft;
  rdDraft.sName = vArgs[2];
  rdDraft.sType = vArgs[3];
  rdDraft.sContent = vArgs[4];
  rdDraft.sTtl = argOr(vArgs, 5);
  rdDraft.sPriority = argOr(vArgs, 6);
  rdDraft.sComment = argOr(vArgs, 7);

  // ── Step 5: Write ────────────────────────────────────────────────────
  zonekeeper::core::WriteResult wr;
  if (vArgs[0] == "add") {
    wr = rmManager.addRecord(parseId(vArgs[1], "zone-id"), rdDraft, rcCtx);
  } else {
    wr = rmManager.editRecord(parseId(vArgs[1], "record-id"), rdDraft, rcCtx);
  }

  switch (wr.status) {
    case zonekeeper::core::WriteStatus::Saved:
      std::cout << "saved\n";
      return EXIT_SUCCESS;
    case zonekeeper::core::WriteStatus::Invalid:
      for (const auto& sError : wr.vErrors) {
        std::cout << sError << "\n";
      }
      return EXIT_FAILURE;
    case zonekeeper::core::WriteStatus::Failed:
      std::cerr << "record could not be saved\n";
      return EXIT_FAILURE;
  }
  return EXIT_FAILURE;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::vector<std::string> vArgs(argv + 1, argv + argc);
  if (vArgs.empty()) {
    printUsage();
    return kExitUsage;
  }

  const std::string& sCommand = vArgs[0];
  const bool bValidate = sCommand == "validate" && vArgs.size() >= 4 && vArgs.size() <= 6;
  const bool bWrite =
      (sCommand == "add" || sCommand == "edit") && vArgs.size() >= 5 && vArgs.size() <= 8;
  if (!bValidate && !bWrite) {
    printUsage();
    return kExitUsage;
  }

  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = zonekeeper::common::Config::load();
    zonekeeper::common::Logger::init(cfgApp.sLogLevel);
    zonekeeper::common::Logger::get()->debug("Step 1: Configuration loaded successfully");

    if (bValidate) {
      return runValidate(vArgs, cfgApp);
    }
    return runWrite(vArgs, cfgApp);
  } catch (const zonekeeper::common::AppError& e) {
    std::cerr << "[" << e._sErrorCode << "] " << e.what() << "\n";
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
