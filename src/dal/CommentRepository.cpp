#include "dal/CommentRepository.hpp"

#include "dal/ConnectionPool.hpp"
#include "dns/NameRules.hpp"

#include <pqxx/pqxx>

namespace zonekeeper::dal {

namespace {

void insertComment(pqxx::work& txn, int64_t iZoneId, const std::string& sName,
                   const std::string& sType, const std::string& sComment,
                   const std::string& sAccount) {
  txn.exec(
      "INSERT INTO comments (domain_id, name, type, modified_at, account, comment) "
      "VALUES ($1, $2, $3, EXTRACT(EPOCH FROM NOW())::integer, $4, $5)",
      pqxx::params{iZoneId, sName, sType, sAccount, sComment});
}

void deleteComment(pqxx::work& txn, int64_t iZoneId, const std::string& sName,
                   const std::string& sType) {
  txn.exec(
      "DELETE FROM comments WHERE domain_id = $1 AND lower(name) = lower($2) AND type = $3",
      pqxx::params{iZoneId, sName, sType});
}

}  // namespace

CommentRepository::CommentRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
CommentRepository::~CommentRepository() = default;

void CommentRepository::createComment(int64_t iZoneId, const std::string& sName,
                                      const std::string& sType, const std::string& sComment,
                                      const std::string& sAccount) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  deleteComment(txn, iZoneId, sName, sType);
  insertComment(txn, iZoneId, sName, sType, sComment, sAccount);
  txn.commit();
}

void CommentRepository::updateComment(int64_t iZoneId, const std::string& sOldName,
                                      const std::string& sOldType, const std::string& sNewName,
                                      const std::string& sNewType, const std::string& sComment,
                                      const std::string& sAccount) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);

  const bool bKeyChanged = !dns::NameRules::equals(sOldName, sNewName) || sOldType != sNewType;
  if (bKeyChanged) {
    deleteComment(txn, iZoneId, sNewName, sNewType);
  }

  auto result = txn.exec(
      "UPDATE comments SET name = $4, type = $5, comment = $6, account = $7, "
      "modified_at = EXTRACT(EPOCH FROM NOW())::integer "
      "WHERE domain_id = $1 AND lower(name) = lower($2) AND type = $3",
      pqxx::params{iZoneId, sOldName, sOldType, sNewName, sNewType, sComment, sAccount});

  if (result.affected_rows() == 0) {
    insertComment(txn, iZoneId, sNewName, sNewType, sComment, sAccount);
  }
  txn.commit();
}

std::optional<common::CommentRow> CommentRepository::find(int64_t iZoneId,
                                                          const std::string& sName,
                                                          const std::string& sType) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT domain_id, name, type, COALESCE(comment, ''), COALESCE(account, '') "
      "FROM comments WHERE domain_id = $1 AND lower(name) = lower($2) AND type = $3 "
      "ORDER BY id LIMIT 1",
      pqxx::params{iZoneId, sName, sType});
  txn.commit();

  if (result.empty()) return std::nullopt;

  auto row = result[0];
  return common::CommentRow{
      row[0].as<int64_t>(),
      row[1].as<std::string>(),
      row[2].as<std::string>(),
      row[3].as<std::string>(),
      row[4].as<std::string>(),
  };
}

std::vector<common::CommentRow> CommentRepository::listByZone(int64_t iZoneId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT domain_id, name, type, COALESCE(comment, ''), COALESCE(account, '') "
      "FROM comments WHERE domain_id = $1 ORDER BY name, type",
      pqxx::params{iZoneId});
  txn.commit();

  std::vector<common::CommentRow> vRows;
  vRows.reserve(result.size());
  for (const auto& row : result) {
    vRows.push_back(common::CommentRow{
        row[0].as<int64_t>(),
        row[1].as<std::string>(),
        row[2].as<std::string>(),
        row[3].as<std::string>(),
        row[4].as<std::string>(),
    });
  }
  return vRows;
}

}  // namespace zonekeeper::dal
