#pragma once

#include <cstdint>
#include <string>

namespace zonekeeper::dal {

/// Pure abstract interface over the PowerDNS comments table.
/// At most one comment exists per (zone, name, type).
class ICommentStore {
 public:
  virtual ~ICommentStore() = default;

  /// Create the comment for (iZoneId, sName, sType), overwriting an existing one.
  virtual void createComment(int64_t iZoneId, const std::string& sName, const std::string& sType,
                             const std::string& sComment, const std::string& sAccount) = 0;

  /// Move the comment at (iZoneId, sOldName, sOldType) to (sNewName, sNewType)
  /// with the new text. Creates the comment when none exists at the old key.
  virtual void updateComment(int64_t iZoneId, const std::string& sOldName,
                             const std::string& sOldType, const std::string& sNewName,
                             const std::string& sNewType, const std::string& sComment,
                             const std::string& sAccount) = 0;
};

}  // namespace zonekeeper::dal
