#pragma once
#include <folio/schema/account.hpp>
#include <folio/schema/coa_warning.hpp>
#include <folio/schema/posting_error_code.hpp>
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace folio::schema {

template <uint16_t Version>
struct journal_validation_result;

template <>
struct journal_validation_result<1> final {
  uint16_t version{1};
  bool validated{};
  bool requires_approval{};
  std::vector<std::string> approver_roles;
  std::vector<coa_warning_t> coa_warnings;
  std::vector<account_t> account_details;
  amount_t total_debit{};
  amount_t total_credit{};
  std::optional<posting_error_code_t> code;
  std::string error;
  /// Signed debit minus credit, set for JOURNAL_UNBALANCED.
  std::optional<amount_t> difference;
  /// Authorizer reason, set for SOD_VIOLATION.
  std::optional<std::string> sod_reason;
};

using journal_validation_result_t = journal_validation_result<1>;

}  // namespace folio::schema
