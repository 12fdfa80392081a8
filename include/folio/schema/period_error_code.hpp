#pragma once

#include <folio/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: period error code.
namespace folio::schema {

enum class period_error_code_t : uint16_t {
  invalid_input = 1,
  period_not_found = 2,
  period_already_closed = 3,
  period_already_open = 4,
  sod_violation = 5,
  period_close_validation_failed = 6,
  approval_required = 7,
  period_locked = 8,
  period_close_error = 9,
  period_open_error = 10,
  period_lock_error = 11
};

inline constexpr auto kPeriodErrorCodeMappings = std::array{
    std::pair<std::string_view, period_error_code_t>{"INVALID_INPUT", period_error_code_t::invalid_input},
    std::pair<std::string_view, period_error_code_t>{"PERIOD_NOT_FOUND", period_error_code_t::period_not_found},
    std::pair<std::string_view, period_error_code_t>{"PERIOD_ALREADY_CLOSED", period_error_code_t::period_already_closed},
    std::pair<std::string_view, period_error_code_t>{"PERIOD_ALREADY_OPEN", period_error_code_t::period_already_open},
    std::pair<std::string_view, period_error_code_t>{"SOD_VIOLATION", period_error_code_t::sod_violation},
    std::pair<std::string_view, period_error_code_t>{"PERIOD_CLOSE_VALIDATION_FAILED", period_error_code_t::period_close_validation_failed},
    std::pair<std::string_view, period_error_code_t>{"APPROVAL_REQUIRED", period_error_code_t::approval_required},
    std::pair<std::string_view, period_error_code_t>{"PERIOD_LOCKED", period_error_code_t::period_locked},
    std::pair<std::string_view, period_error_code_t>{"PERIOD_CLOSE_ERROR", period_error_code_t::period_close_error},
    std::pair<std::string_view, period_error_code_t>{"PERIOD_OPEN_ERROR", period_error_code_t::period_open_error},
    std::pair<std::string_view, period_error_code_t>{"PERIOD_LOCK_ERROR", period_error_code_t::period_lock_error}};

template <>
inline std::optional<period_error_code_t> try_from_string<period_error_code_t>(
    const std::string_view value) {
  return from_string(value, kPeriodErrorCodeMappings);
}

inline constexpr std::string_view to_string(const period_error_code_t value) {
  return to_string(value, kPeriodErrorCodeMappings).value_or("UNKNOWN");
}

}  // namespace folio::schema
