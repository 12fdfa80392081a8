#include <folio/chart/registry.hpp>

#include <algorithm>
#include <iterator>
#include <unordered_set>
#include <utility>

namespace folio::chart {

registry::registry(std::vector<folio::schema::account_t> accounts) {
  accounts_.reserve(accounts.size());
  for (auto& account : accounts) {
    upsert(std::move(account));
  }
}

void registry::upsert(folio::schema::account_t account) {
  auto existing = accounts_.find(account.id);
  if (existing != std::end(accounts_) && existing->second.parent_id) {
    auto& siblings = children_[*existing->second.parent_id];
    std::erase(siblings, account.id);
  }
  if (account.parent_id) {
    children_[*account.parent_id].push_back(account.id);
  }
  auto id = account.id;
  accounts_.insert_or_assign(std::move(id), std::move(account));
}

const folio::schema::account_t* registry::find(
    const std::string_view account_id) const {
  auto it = accounts_.find(std::string{account_id});
  if (it == std::end(accounts_)) {
    return nullptr;
  }
  return &it->second;
}

std::optional<folio::schema::account_t> registry::resolve(
    const std::string_view account_id) const {
  const auto* account = find(account_id);
  if (account == nullptr) {
    return std::nullopt;
  }
  return *account;
}

std::vector<folio::schema::account_t> registry::children_of(
    const std::string_view account_id) const {
  auto out = std::vector<folio::schema::account_t>{};
  auto it = children_.find(std::string{account_id});
  if (it == std::end(children_)) {
    return out;
  }
  for (const auto& child_id : it->second) {
    if (const auto* child = find(child_id); child != nullptr) {
      out.push_back(*child);
    }
  }
  std::ranges::sort(out, {}, &folio::schema::account_t::code);
  return out;
}

std::vector<std::string> registry::path_of(
    const std::string_view account_id) const {
  auto path = std::vector<std::string>{};
  auto seen = std::unordered_set<std::string>{};
  const auto* current = find(account_id);
  while (current != nullptr && seen.insert(current->id).second) {
    path.push_back(current->code);
    if (!current->parent_id) {
      break;
    }
    current = find(*current->parent_id);
  }
  std::ranges::reverse(path);
  return path;
}

std::size_t registry::size() const {
  return accounts_.size();
}

}  // namespace folio::chart
