#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "dal/ICommentStore.hpp"

namespace zonekeeper::dal {

class ConnectionPool;

/// Manages the PowerDNS comments table.
/// Names are matched case-insensitively.
/// Class abbreviation: cmr
class CommentRepository : public ICommentStore {
 public:
  explicit CommentRepository(ConnectionPool& cpPool);
  ~CommentRepository() override;

  void createComment(int64_t iZoneId, const std::string& sName, const std::string& sType,
                     const std::string& sComment, const std::string& sAccount) override;

  void updateComment(int64_t iZoneId, const std::string& sOldName, const std::string& sOldType,
                     const std::string& sNewName, const std::string& sNewType,
                     const std::string& sComment, const std::string& sAccount) override;

  /// Comment stored for (iZoneId, sName, sType), if any.
  std::optional<common::CommentRow> find(int64_t iZoneId, const std::string& sName,
                                         const std::string& sType);

  /// All comments of a zone, ordered by name then type.
  std::vector<common::CommentRow> listByZone(int64_t iZoneId);

 private:
  ConnectionPool& _cpPool;
};

}  // namespace zonekeeper::dal
