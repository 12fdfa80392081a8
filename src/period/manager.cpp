#include <folio/period/manager.hpp>
#include <folio/schema/key/ledger_keys.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace folio::schema;
using folio::storage::storage_error;

namespace {

std::string lowercase(std::string_view value) {
  auto out = std::string{value};
  std::ranges::transform(out, std::begin(out), [](const unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

period_close_result_t close_failure(const std::string& fiscal_period_id,
                                    const period_error_code_t code,
                                    std::string error) {
  spdlog::warn("Close of period '{}' rejected: {} {}", fiscal_period_id,
               to_string(code), error);
  auto result = period_close_result_t{};
  result.success = false;
  result.fiscal_period_id = fiscal_period_id;
  result.code = code;
  result.error = std::move(error);
  return result;
}

period_open_result_t open_failure(const std::string& fiscal_period_id,
                                  const period_error_code_t code,
                                  std::string error) {
  spdlog::warn("Open of period '{}' rejected: {} {}", fiscal_period_id,
               to_string(code), error);
  auto result = period_open_result_t{};
  result.success = false;
  result.fiscal_period_id = fiscal_period_id;
  result.code = code;
  result.error = std::move(error);
  return result;
}

period_lock_result_t lock_failure(const std::string& fiscal_period_id,
                                  const period_error_code_t code,
                                  std::string error) {
  spdlog::warn("Lock of period '{}' rejected: {} {}", fiscal_period_id,
               to_string(code), error);
  auto result = period_lock_result_t{};
  result.success = false;
  result.code = code;
  result.error = std::move(error);
  return result;
}

std::vector<std::string> validate_close_input(const period_close_input_t& input,
                                              const date_t today) {
  auto errors = std::vector<std::string>{};
  if (input.tenant_id.empty()) {
    errors.emplace_back("Tenant ID is required");
  }
  if (input.company_id.empty()) {
    errors.emplace_back("Company ID is required");
  }
  if (input.fiscal_period_id.empty()) {
    errors.emplace_back("Fiscal period ID is required");
  }
  if (input.closed_by.empty()) {
    errors.emplace_back("Closed by user ID is required");
  }
  if (input.user_role.empty()) {
    errors.emplace_back("User role is required");
  }
  if (!input.close_date) {
    errors.emplace_back("Close date is required");
  } else if (*input.close_date > today) {
    errors.emplace_back("Close date cannot be in the future");
  }
  return errors;
}

/// A period row is only visible to the tenant and company that own it.
bool owned_by(const fiscal_period_t& period,
              const std::string& tenant_id,
              const std::string& company_id) {
  return period.tenant_id == tenant_id && period.company_id == company_id;
}

void log_lock(const period_lock_t& lock) {
  spdlog::info("Locked period '{}' ({}) by '{}': {}", lock.fiscal_period_id,
               to_string(lock.lock_type), lock.locked_by, lock.reason);
}

// TODO: count unmatched bank statement lines once bank feeds are persisted.
uint64_t count_unreconciled_transactions(const fiscal_period_t&) {
  return 0;
}

}  // namespace

namespace folio::period {

manager::manager(folio::storage::ledger_storage_t& storage,
                 const folio::sod::authorizer& authorizer,
                 today_fn_t today)
    : storage_{storage}, authorizer_{authorizer}, today_{std::move(today)} {}

std::shared_ptr<std::mutex> manager::period_mutex(
    const std::string& fiscal_period_id) {
  auto lock = std::scoped_lock{registry_mutex_};
  std::erase_if(period_mutexes_,
                [](const auto& entry) { return entry.second.expired(); });
  auto& entry = period_mutexes_[fiscal_period_id];
  auto mutex = entry.lock();
  if (!mutex) {
    mutex = std::make_shared<std::mutex>();
    entry = mutex;
  }
  return mutex;
}

std::size_t manager::tracked_periods() {
  auto lock = std::scoped_lock{registry_mutex_};
  std::erase_if(period_mutexes_,
                [](const auto& entry) { return entry.second.expired(); });
  return period_mutexes_.size();
}

period_close_result_t manager::close_fiscal_period(
    const period_close_input_t& input) {
  auto input_errors = validate_close_input(input, today_());
  if (!input_errors.empty()) {
    return close_failure(
        input.fiscal_period_id, period_error_code_t::invalid_input,
        fmt::format("Input validation failed: {}",
                    fmt::join(input_errors, ", ")));
  }

  auto guard = period_mutex(input.fiscal_period_id);
  auto lock = std::scoped_lock{*guard};
  try {
    auto period = storage_.find_fiscal_period(input.fiscal_period_id);
    if (!period || !owned_by(*period, input.tenant_id, input.company_id)) {
      return close_failure(input.fiscal_period_id,
                           period_error_code_t::period_not_found,
                           "Fiscal period not found");
    }
    if (period->status != period_status_t::open) {
      return close_failure(
          input.fiscal_period_id, period_error_code_t::period_already_closed,
          fmt::format("Period is already {}", lowercase(to_string(period->status))));
    }

    auto decision = authorizer_.check(
        posting_context_t{.tenant_id = input.tenant_id,
                          .company_id = input.company_id,
                          .user_id = input.closed_by,
                          .user_role = input.user_role},
        sod_action_t::period_close);
    if (!decision.allowed) {
      return close_failure(
          input.fiscal_period_id, period_error_code_t::sod_violation,
          fmt::format("SoD violation: {}", decision.reason.value_or("")));
    }

    auto validation = validate_period_close(*period);
    if (!validation.can_close && !input.force_close) {
      auto result = close_failure(
          input.fiscal_period_id,
          period_error_code_t::period_close_validation_failed,
          fmt::format("Period cannot be closed: {}",
                      fmt::join(validation.errors, ", ")));
      result.validation = std::move(validation);
      return result;
    }
    if (!validation.can_close) {
      spdlog::warn("Force closing period '{}' with {} validation error(s)",
                   period->id, validation.errors.size());
    }

    auto next = storage_.find_next_period(*period);
    auto reversing_entries = uint64_t{0};
    if (input.generate_reversing_entries && next) {
      reversing_entries =
          create_reversing_entries(*period, *next, input.closed_by);
    }

    auto closed = *period;
    closed.status = period_status_t::closed;
    closed.closed_at = input.close_date;
    closed.closed_by = input.closed_by;
    auto posting_lock = storage_.compare_and_set_period(
        period_status_t::open, closed,
        make_lock(closed, lock_type_t::posting, input.closed_by,
                  input.close_reason.value_or("Period closed")));
    if (!posting_lock) {
      return close_failure(input.fiscal_period_id,
                           period_error_code_t::period_already_closed,
                           "Period is already closed");
    }
    log_lock(*posting_lock);
    spdlog::info("Closed period '{}' ({} to {}) by '{}', {} reversing entries",
                 closed.id, format_date(closed.start_date),
                 format_date(closed.end_date), input.closed_by,
                 reversing_entries);

    auto result = period_close_result_t{};
    result.success = true;
    result.fiscal_period_id = closed.id;
    result.status = period_status_t::closed;
    result.closed_at = closed.closed_at;
    result.closed_by = closed.closed_by;
    result.reversing_entries_created = reversing_entries;
    if (next) {
      result.next_period_id = next->id;
    }
    result.lock_id = posting_lock->id;
    result.validation = std::move(validation);
    return result;
  } catch (const storage_error& e) {
    spdlog::error("Close of period '{}' failed: {}", input.fiscal_period_id,
                  e.what());
    return close_failure(input.fiscal_period_id,
                         period_error_code_t::period_close_error, e.what());
  }
}

period_open_result_t manager::open_fiscal_period(
    const period_open_input_t& input) {
  if (input.fiscal_period_id.empty() || input.opened_by.empty() ||
      input.open_reason.empty()) {
    return open_failure(input.fiscal_period_id,
                        period_error_code_t::invalid_input,
                        "Missing required fields for period open");
  }

  auto guard = period_mutex(input.fiscal_period_id);
  auto lock = std::scoped_lock{*guard};
  try {
    auto period = storage_.find_fiscal_period(input.fiscal_period_id);
    if (!period || !owned_by(*period, input.tenant_id, input.company_id)) {
      return open_failure(input.fiscal_period_id,
                          period_error_code_t::period_not_found,
                          "Fiscal period not found");
    }
    if (period->status == period_status_t::open) {
      return open_failure(input.fiscal_period_id,
                          period_error_code_t::period_already_open,
                          "Period is already open");
    }

    auto decision = authorizer_.check(
        posting_context_t{.tenant_id = input.tenant_id,
                          .company_id = input.company_id,
                          .user_id = input.opened_by,
                          .user_role = input.user_role},
        sod_action_t::period_open);
    if (!decision.allowed) {
      return open_failure(
          input.fiscal_period_id, period_error_code_t::sod_violation,
          fmt::format("SoD violation: {}", decision.reason.value_or("")));
    }
    if (input.approval_required && !decision.requires_approval) {
      return open_failure(
          input.fiscal_period_id, period_error_code_t::approval_required,
          fmt::format("Period open requires approval from {}",
                      fmt::join(authorizer_.approver_roles(), " or ")));
    }

    auto reopened = *period;
    reopened.status = period_status_t::open;
    reopened.closed_at.reset();
    reopened.closed_by.reset();
    auto deactivated = storage_.reopen_period(period->status, reopened);
    if (!deactivated) {
      return open_failure(input.fiscal_period_id,
                          period_error_code_t::period_already_open,
                          "Period is already open");
    }
    spdlog::info("Reopened period '{}' by '{}' ({}), {} lock(s) deactivated",
                 reopened.id, input.opened_by, input.open_reason, *deactivated);

    auto result = period_open_result_t{};
    result.success = true;
    result.fiscal_period_id = reopened.id;
    result.status = period_status_t::open;
    result.opened_by = input.opened_by;
    result.locks_deactivated = *deactivated;
    result.requires_approval = decision.requires_approval;
    return result;
  } catch (const storage_error& e) {
    spdlog::error("Open of period '{}' failed: {}", input.fiscal_period_id,
                  e.what());
    return open_failure(input.fiscal_period_id,
                        period_error_code_t::period_open_error, e.what());
  }
}

period_lock_result_t manager::create_period_lock(
    const period_lock_input_t& input) {
  if (input.fiscal_period_id.empty() || input.locked_by.empty() ||
      input.reason.empty()) {
    return lock_failure(input.fiscal_period_id,
                        period_error_code_t::invalid_input,
                        "Missing required fields for period lock");
  }

  auto decision = authorizer_.check(
      posting_context_t{.tenant_id = input.tenant_id,
                        .company_id = input.company_id,
                        .user_id = input.locked_by,
                        .user_role = input.user_role},
      sod_action_t::period_lock);
  if (!decision.allowed) {
    return lock_failure(
        input.fiscal_period_id, period_error_code_t::sod_violation,
        fmt::format("SoD violation: {}", decision.reason.value_or("")));
  }

  auto guard = period_mutex(input.fiscal_period_id);
  auto lock = std::scoped_lock{*guard};
  try {
    auto period = storage_.find_fiscal_period(input.fiscal_period_id);
    if (!period || !owned_by(*period, input.tenant_id, input.company_id)) {
      return lock_failure(input.fiscal_period_id,
                          period_error_code_t::period_not_found,
                          "Fiscal period not found");
    }

    auto requested =
        make_lock(*period, input.lock_type, input.locked_by, input.reason);
    auto status = period->status;
    auto stored = std::optional<period_lock_t>{};
    if (input.lock_type == lock_type_t::full &&
        period->status == period_status_t::closed) {
      auto locked = *period;
      locked.status = period_status_t::locked;
      stored = storage_.compare_and_set_period(period_status_t::closed, locked,
                                               std::move(requested));
      if (!stored) {
        return lock_failure(input.fiscal_period_id,
                            period_error_code_t::period_lock_error,
                            "Period status changed while locking");
      }
      status = period_status_t::locked;
    } else {
      stored = storage_.insert_period_lock(std::move(requested));
    }
    log_lock(*stored);

    auto result = period_lock_result_t{};
    result.success = true;
    result.lock = std::move(stored);
    result.status = status;
    return result;
  } catch (const storage_error& e) {
    spdlog::error("Lock of period '{}' failed: {}", input.fiscal_period_id,
                  e.what());
    return lock_failure(input.fiscal_period_id,
                        period_error_code_t::period_lock_error, e.what());
  }
}

period_lock_t manager::make_lock(const fiscal_period_t& period,
                                 const lock_type_t lock_type,
                                 const std::string& locked_by,
                                 const std::string& reason) const {
  return period_lock_t{.tenant_id = period.tenant_id,
                       .company_id = period.company_id,
                       .fiscal_period_id = period.id,
                       .lock_type = lock_type,
                       .locked_by = locked_by,
                       .locked_at = today_(),
                       .reason = reason,
                       .is_active = true};
}

uint64_t manager::create_reversing_entries(const fiscal_period_t& period,
                                           const fiscal_period_t& next,
                                           const std::string& created_by) {
  auto created = uint64_t{0};
  auto accruals = storage_.list_unreversed_accruals(
      period.tenant_id, period.company_id, period.start_date, period.end_date);
  for (const auto& journal : accruals) {
    auto entry = reversing_entry_t{
        .id = folio::schema::key::make_reversing_entry_id(
            period.tenant_id, period.company_id, journal.id),
        .tenant_id = period.tenant_id,
        .company_id = period.company_id,
        .original_journal_id = journal.id,
        .reversal_date = next.start_date,
        .reversal_reason = fmt::format("Auto-reversal for period close: {}",
                                       journal.description),
        .status = reversing_entry_status_t::pending,
        .created_by = created_by};
    if (storage_.insert_reversing_entry(entry)) {
      ++created;
      spdlog::debug("Scheduled reversal of journal '{}' on {}", journal.id,
                    format_date(next.start_date));
    }
  }
  return created;
}

period_close_validation_t manager::validate_period_close(
    const fiscal_period_t& period) const {
  auto validation = period_close_validation_t{};

  validation.unposted_journal_count = storage_.count_unposted_journals(
      period.tenant_id, period.company_id, period.start_date, period.end_date);
  validation.checks.all_journals_posted =
      validation.unposted_journal_count == 0;
  if (!validation.checks.all_journals_posted) {
    validation.errors.push_back(fmt::format(
        "{} unposted journal entries found", validation.unposted_journal_count));
  }

  auto totals = storage_.trial_balance_as_of(period.tenant_id,
                                             period.company_id, period.end_date);
  validation.trial_balance_difference =
      round_amount(totals.total_debits - totals.total_credits);
  validation.checks.trial_balance_balanced =
      !exceeds_tolerance(validation.trial_balance_difference);
  if (!validation.checks.trial_balance_balanced) {
    validation.errors.push_back(
        fmt::format("Trial balance is out of balance by {:.2f}",
                    validation.trial_balance_difference));
  }

  validation.unreconciled_transaction_count =
      count_unreconciled_transactions(period);
  validation.checks.no_unreconciled_transactions =
      validation.unreconciled_transaction_count == 0;
  if (!validation.checks.no_unreconciled_transactions) {
    validation.warnings.push_back(
        fmt::format("{} unreconciled bank transactions",
                    validation.unreconciled_transaction_count));
  }

  validation.checks.all_required_adjustments = true;
  validation.checks.approval_required =
      !validation.errors.empty() || !validation.warnings.empty();
  validation.checks.sod_compliance = true;
  validation.can_close = validation.errors.empty();

  spdlog::debug(
      "Pre-close check for period '{}': unposted={} difference={:.2f} "
      "can_close={}",
      period.id, validation.unposted_journal_count,
      validation.trial_balance_difference, validation.can_close);
  return validation;
}

posting_check_result_t manager::check_posting_allowed(
    const std::string& tenant_id,
    const std::string& company_id,
    const date_t date) const {
  auto result = posting_check_result_t{};
  auto period = storage_.find_period_for_date(tenant_id, company_id, date);
  if (!period) {
    result.code = period_error_code_t::period_not_found;
    result.error =
        fmt::format("No fiscal period covers {}", format_date(date));
    return result;
  }
  result.fiscal_period_id = period->id;
  if (period->status != period_status_t::open) {
    result.code = period_error_code_t::period_locked;
    result.error = fmt::format("Fiscal period '{}' is {}", period->id,
                               lowercase(to_string(period->status)));
    return result;
  }
  auto locks = storage_.list_period_locks(period->id);
  auto blocking = std::ranges::find_if(locks, [](const period_lock_t& lock) {
    return lock.is_active && (lock.lock_type == lock_type_t::posting ||
                              lock.lock_type == lock_type_t::full);
  });
  if (blocking != std::end(locks)) {
    result.code = period_error_code_t::period_locked;
    result.error = fmt::format("Fiscal period '{}' has an active {} lock",
                               period->id, to_string(blocking->lock_type));
    return result;
  }
  result.allowed = true;
  return result;
}

}  // namespace folio::period
