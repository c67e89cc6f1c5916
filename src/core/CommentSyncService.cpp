#include "core/CommentSyncService.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "dal/ICommentStore.hpp"
#include "dal/IRecordStore.hpp"
#include "dns/NameRules.hpp"

namespace zonekeeper::core {

namespace {

constexpr const char* kPtrType = "PTR";
constexpr const char* kForwardType = "A";

}  // namespace

CommentSyncService::CommentSyncService(dal::ICommentStore& csStore,
                                       dal::IRecordStore& rsStore, bool bSyncEnabled)
    : _csStore(csStore), _rsStore(rsStore), _bSyncEnabled(bSyncEnabled) {}

CommentSyncService::~CommentSyncService() = default;

std::optional<std::string> CommentSyncService::ptrNameFor(common::RecordType rtType,
                                                          const std::string& sAddress) {
  if (rtType == common::RecordType::A) {
    return dns::NameRules::ipv4ToPtrName(sAddress);
  }
  if (rtType == common::RecordType::AAAA) {
    return dns::NameRules::ipv6ToPtrName(sAddress);
  }
  return std::nullopt;
}

std::optional<int64_t> CommentSyncService::forwardZoneFor(const std::string& sTarget) {
  std::string sDomain;
  try {
    sDomain = dns::NameRules::getRegisteredDomain(sTarget);
  } catch (const common::ValidationError& e) {
    common::Logger::get()->debug("No forward zone for PTR target '{}': {}", sTarget,
                                 e.what());
    return std::nullopt;
  }
  return _rsStore.findZoneIdByName(sDomain);
}

void CommentSyncService::createComments(int64_t iZoneId, const std::string& sName,
                                        const std::string& sType,
                                        const std::string& sContent,
                                        const std::string& sComment,
                                        const std::string& sAuthor) {
  auto spLog = common::Logger::get();
  const auto oType = common::parseRecordType(sType);

  if (!_bSyncEnabled || !oType) {
    _csStore.createComment(iZoneId, sName, sType, sComment, sAuthor);
    return;
  }

  if (common::isForwardType(*oType)) {
    const auto oPtrName = ptrNameFor(*oType, sContent);
    const auto oPtrZoneId = oPtrName ? _rsStore.findBestMatchingZoneId(*oPtrName)
                                     : std::nullopt;
    _csStore.createComment(iZoneId, sName, sType, sComment, sAuthor);
    if (!oPtrZoneId) {
      spLog->debug("No reverse zone for {} {}; comment kept on the forward record",
                   sType, sContent);
      return;
    }
    _csStore.createComment(*oPtrZoneId, *oPtrName, kPtrType, sComment, sAuthor);
    return;
  }

  if (*oType == common::RecordType::PTR) {
    const auto oDomainId = forwardZoneFor(sContent);
    _csStore.createComment(iZoneId, sName, sType, sComment, sAuthor);
    if (!oDomainId) {
      spLog->debug("No forward zone for PTR target '{}'; comment kept on the PTR record",
                   sContent);
      return;
    }
    _csStore.createComment(*oDomainId, dns::NameRules::trimTrailingDot(sContent),
                           kForwardType, sComment, sAuthor);
    return;
  }

  _csStore.createComment(iZoneId, sName, sType, sComment, sAuthor);
}

void CommentSyncService::updateComments(const common::RecordRow& rrOld,
                                        const common::RecordRow& rrNew,
                                        const std::string& sComment,
                                        const std::string& sAuthor) {
  _csStore.updateComment(rrNew.iZoneId, rrOld.sName, rrOld.sType, rrNew.sName, rrNew.sType,
                         sComment, sAuthor);

  if (!_bSyncEnabled) return;

  auto spLog = common::Logger::get();
  const auto oNewType = common::parseRecordType(rrNew.sType);
  const auto oOldType = common::parseRecordType(rrOld.sType);
  if (!oNewType) return;

  if (common::isForwardType(*oNewType)) {
    const auto oNewPtr = ptrNameFor(*oNewType, rrNew.sContent);
    if (!oNewPtr) return;

    std::optional<std::string> oOldPtr;
    if (oOldType && common::isForwardType(*oOldType)) {
      oOldPtr = ptrNameFor(*oOldType, rrOld.sContent);
    }
    if (!oOldPtr) oOldPtr = oNewPtr;

    const auto oPtrZoneId = _rsStore.findBestMatchingZoneId(*oNewPtr);
    if (!oPtrZoneId) {
      spLog->debug("No reverse zone for {}; PTR comment not moved", *oNewPtr);
      return;
    }
    _csStore.updateComment(*oPtrZoneId, *oOldPtr, kPtrType, *oNewPtr, kPtrType, sComment,
                           sAuthor);
    return;
  }

  if (*oNewType == common::RecordType::PTR) {
    const auto oDomainId = forwardZoneFor(rrNew.sContent);
    if (!oDomainId) {
      spLog->debug("No forward zone for PTR target '{}'; A comment not moved",
                   rrNew.sContent);
      return;
    }
    const bool bOldWasPtr = oOldType && *oOldType == common::RecordType::PTR;
    const std::string sOldTarget =
        dns::NameRules::trimTrailingDot(bOldWasPtr ? rrOld.sContent : rrNew.sContent);
    _csStore.updateComment(*oDomainId, sOldTarget, kForwardType,
                           dns::NameRules::trimTrailingDot(rrNew.sContent), kForwardType,
                           sComment, sAuthor);
  }
}

}  // namespace zonekeeper::core
