#pragma once

#include <folio/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: posting error code.
// Machine readable failure codes for journal validation and sub-ledger
// posting adapters.
namespace folio::schema {

enum class posting_error_code_t : uint16_t {
  invalid_accounts = 1,
  invalid_amount = 2,
  invalid_amounts = 3,
  journal_unbalanced = 4,
  invalid_currency = 5,
  sod_violation = 6,
  business_rule_violation = 7,
  payment_validation_failed = 8,
  journal_validation_failed = 9,
  period_not_open = 10
};

inline constexpr auto kPostingErrorCodeMappings = std::array{
    std::pair<std::string_view, posting_error_code_t>{"INVALID_ACCOUNTS", posting_error_code_t::invalid_accounts},
    std::pair<std::string_view, posting_error_code_t>{"INVALID_AMOUNT", posting_error_code_t::invalid_amount},
    std::pair<std::string_view, posting_error_code_t>{"INVALID_AMOUNTS", posting_error_code_t::invalid_amounts},
    std::pair<std::string_view, posting_error_code_t>{"JOURNAL_UNBALANCED", posting_error_code_t::journal_unbalanced},
    std::pair<std::string_view, posting_error_code_t>{"INVALID_CURRENCY", posting_error_code_t::invalid_currency},
    std::pair<std::string_view, posting_error_code_t>{"SOD_VIOLATION", posting_error_code_t::sod_violation},
    std::pair<std::string_view, posting_error_code_t>{"BUSINESS_RULE_VIOLATION", posting_error_code_t::business_rule_violation},
    std::pair<std::string_view, posting_error_code_t>{"PAYMENT_VALIDATION_FAILED", posting_error_code_t::payment_validation_failed},
    std::pair<std::string_view, posting_error_code_t>{"JOURNAL_VALIDATION_FAILED", posting_error_code_t::journal_validation_failed},
    std::pair<std::string_view, posting_error_code_t>{"PERIOD_NOT_OPEN", posting_error_code_t::period_not_open}};

template <>
inline std::optional<posting_error_code_t> try_from_string<posting_error_code_t>(
    const std::string_view value) {
  return from_string(value, kPostingErrorCodeMappings);
}

inline constexpr std::string_view to_string(const posting_error_code_t value) {
  return to_string(value, kPostingErrorCodeMappings).value_or("UNKNOWN");
}

}  // namespace folio::schema
