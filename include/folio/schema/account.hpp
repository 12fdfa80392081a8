#pragma once
#include <folio/schema/account_type.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: account.
// Chart-of-accounts node. Accounts form a tree through parent_id.
namespace folio::schema {

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  uint16_t version{1};
  std::string id;
  std::string code;
  std::string name;
  account_type_t type{account_type_t::asset};
  std::optional<std::string> parent_id;
  std::string currency;
  bool is_active{true};
};

using account_t = account<1>;

}  // namespace folio::schema
