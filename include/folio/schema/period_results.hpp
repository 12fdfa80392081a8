#pragma once
#include <folio/schema/period_close_validation.hpp>
#include <folio/schema/period_error_code.hpp>
#include <folio/schema/period_lock.hpp>
#include <folio/schema/period_status.hpp>
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: period lifecycle results.
namespace folio::schema {

template <uint16_t Version>
struct period_close_result;

template <>
struct period_close_result<1> final {
  uint16_t version{1};
  bool success{};
  std::string fiscal_period_id;
  std::optional<period_status_t> status;
  std::optional<date_t> closed_at;
  std::optional<std::string> closed_by;
  uint64_t reversing_entries_created{};
  std::optional<std::string> next_period_id;
  std::optional<std::string> lock_id;
  std::optional<period_close_validation_t> validation;
  std::optional<period_error_code_t> code;
  std::string error;
};

using period_close_result_t = period_close_result<1>;

template <uint16_t Version>
struct period_open_result;

template <>
struct period_open_result<1> final {
  uint16_t version{1};
  bool success{};
  std::string fiscal_period_id;
  std::optional<period_status_t> status;
  std::optional<std::string> opened_by;
  uint64_t locks_deactivated{};
  bool requires_approval{};
  std::optional<period_error_code_t> code;
  std::string error;
};

using period_open_result_t = period_open_result<1>;

template <uint16_t Version>
struct period_lock_result;

template <>
struct period_lock_result<1> final {
  uint16_t version{1};
  bool success{};
  std::optional<period_lock_t> lock;
  std::optional<period_status_t> status;
  std::optional<period_error_code_t> code;
  std::string error;
};

using period_lock_result_t = period_lock_result<1>;

template <uint16_t Version>
struct posting_check_result;

/// Whether new journals may be posted on a given date.
template <>
struct posting_check_result<1> final {
  uint16_t version{1};
  bool allowed{};
  std::optional<std::string> fiscal_period_id;
  std::optional<period_error_code_t> code;
  std::string error;
};

using posting_check_result_t = posting_check_result<1>;

}  // namespace folio::schema
