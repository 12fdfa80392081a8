#pragma once

#include <folio/schema/account.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace folio::chart {

/// In-memory chart of accounts.
///
/// Owns the only account cache in the posting path. Lookup by id is O(1);
/// children are indexed once at load time.
class registry final {
 public:
  registry() = default;
  explicit registry(std::vector<folio::schema::account_t> accounts);

  /// Insert or replace an account and refresh the parent index.
  void upsert(folio::schema::account_t account);

  /// Pointer into the registry, or nullptr when the id is unknown.
  const folio::schema::account_t* find(std::string_view account_id) const;

  std::optional<folio::schema::account_t> resolve(
      std::string_view account_id) const;

  /// Direct children ordered by account code.
  std::vector<folio::schema::account_t> children_of(
      std::string_view account_id) const;

  /// Root-to-leaf list of account codes. Empty when the id is unknown.
  /// Stops at a missing parent or a cycle.
  std::vector<std::string> path_of(std::string_view account_id) const;

  std::size_t size() const;

 private:
  std::unordered_map<std::string, folio::schema::account_t> accounts_;
  std::unordered_map<std::string, std::vector<std::string>> children_;
};

}  // namespace folio::chart
