#pragma once
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace folio::schema {

template <uint16_t Version>
struct journal_line;

template <>
struct journal_line<1> final {
  uint16_t version{1};
  std::string account_id;
  amount_t debit{};
  amount_t credit{};
  std::optional<std::string> description;
  std::optional<std::string> reference;
};

using journal_line_t = journal_line<1>;

}  // namespace folio::schema
