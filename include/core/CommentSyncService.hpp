#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "common/Types.hpp"

namespace zonekeeper::dal {
class ICommentStore;
class IRecordStore;
}  // namespace zonekeeper::dal

namespace zonekeeper::core {

/// Keeps the comment of a forward record (A/AAAA) and its PTR record in step.
///
/// With synchronization disabled only the edited record gets a comment. When
/// enabled, the paired record's comment is written too, provided the zone
/// that would hold the pair exists. A missing zone is not an error: the
/// service falls back to the single comment.
///
/// The two comment writes are separate store calls. A failure between them
/// leaves the pair unsynchronized; the exception propagates to the caller.
/// Class abbreviation: css
class CommentSyncService {
 public:
  CommentSyncService(dal::ICommentStore& csStore, dal::IRecordStore& rsStore,
                     bool bSyncEnabled);
  ~CommentSyncService();

  /// Comment(s) for a newly created record. sName is the record FQDN.
  void createComments(int64_t iZoneId, const std::string& sName, const std::string& sType,
                      const std::string& sContent, const std::string& sComment,
                      const std::string& sAuthor);

  /// Comment(s) after rrOld was edited into rrNew (same record id and zone).
  /// Moves the edited record's comment to its new name/type, and the paired
  /// PTR or A comment to the name derived from the new content.
  void updateComments(const common::RecordRow& rrOld, const common::RecordRow& rrNew,
                      const std::string& sComment, const std::string& sAuthor);

 private:
  /// ip6.arpa / in-addr.arpa name for a forward record's content.
  static std::optional<std::string> ptrNameFor(common::RecordType rtType,
                                               const std::string& sAddress);

  /// Zone owning the registered domain of a PTR target.
  std::optional<int64_t> forwardZoneFor(const std::string& sTarget);

  dal::ICommentStore& _csStore;
  dal::IRecordStore& _rsStore;
  bool _bSyncEnabled;
};

}  // namespace zonekeeper::core
