#pragma once
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: period close validation.
// Pre-close report. Errors block a close unless it is forced, warnings never
// do.
namespace folio::schema {

template <uint16_t Version>
struct period_close_checks;

template <>
struct period_close_checks<1> final {
  uint16_t version{1};
  bool all_journals_posted{true};
  bool trial_balance_balanced{true};
  bool no_unreconciled_transactions{true};
  bool all_required_adjustments{true};
  bool approval_required{};
  bool sod_compliance{true};
};

using period_close_checks_t = period_close_checks<1>;

template <uint16_t Version>
struct period_close_validation;

template <>
struct period_close_validation<1> final {
  uint16_t version{1};
  bool can_close{true};
  std::vector<std::string> warnings;
  std::vector<std::string> errors;
  period_close_checks_t checks;
  uint64_t unposted_journal_count{};
  uint64_t unreconciled_transaction_count{};
  amount_t trial_balance_difference{};
};

using period_close_validation_t = period_close_validation<1>;

}  // namespace folio::schema
