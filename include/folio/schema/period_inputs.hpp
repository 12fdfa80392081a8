#pragma once
#include <folio/schema/lock_type.hpp>
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: period lifecycle inputs.
namespace folio::schema {

template <uint16_t Version>
struct period_close_input;

template <>
struct period_close_input<1> final {
  uint16_t version{1};
  std::string tenant_id;
  std::string company_id;
  std::string fiscal_period_id;
  std::optional<date_t> close_date;
  std::string closed_by;
  std::string user_role;
  std::optional<std::string> close_reason;
  /// Proceed even when pre-close validation reports errors.
  bool force_close{};
  bool generate_reversing_entries{};
};

using period_close_input_t = period_close_input<1>;

template <uint16_t Version>
struct period_open_input;

template <>
struct period_open_input<1> final {
  uint16_t version{1};
  std::string tenant_id;
  std::string company_id;
  std::string fiscal_period_id;
  std::string opened_by;
  std::string user_role;
  std::string open_reason;
  bool approval_required{};
};

using period_open_input_t = period_open_input<1>;

template <uint16_t Version>
struct period_lock_input;

template <>
struct period_lock_input<1> final {
  uint16_t version{1};
  std::string tenant_id;
  std::string company_id;
  std::string fiscal_period_id;
  lock_type_t lock_type{lock_type_t::posting};
  std::string locked_by;
  std::string user_role;
  std::string reason;
};

using period_lock_input_t = period_lock_input<1>;

}  // namespace folio::schema
