#pragma once
#include <folio/schema/account_type.hpp>
#include <folio/schema/posting_side.hpp>
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: chart-of-accounts warning.
// Advisory only. Attached to an otherwise successful validation.
namespace folio::schema {

template <uint16_t Version>
struct coa_warning;

template <>
struct coa_warning<1> final {
  uint16_t version{1};
  std::string account_id;
  std::string warning;
  account_type_t account_type{account_type_t::asset};
  amount_t amount{};
  posting_side_t side{posting_side_t::debit};
};

using coa_warning_t = coa_warning<1>;

}  // namespace folio::schema
