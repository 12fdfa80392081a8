#pragma once
#include <folio/schema/lock_type.hpp>
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: period lock.
// Only active locks gate new postings. Inactive rows are kept as history.
namespace folio::schema {

template <uint16_t Version>
struct period_lock;

template <>
struct period_lock<1> final {
  uint16_t version{1};
  std::string id;
  std::string tenant_id;
  std::string company_id;
  std::string fiscal_period_id;
  lock_type_t lock_type{lock_type_t::posting};
  std::string locked_by;
  date_t locked_at{};
  std::string reason;
  bool is_active{true};
};

using period_lock_t = period_lock<1>;

}  // namespace folio::schema
