#include <folio/fx/policy.hpp>
#include <folio/posting/journal_validator.hpp>

#include <iterator>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace folio::schema;

namespace {

journal_validation_result_t reject(const posting_error_code_t code,
                                   std::string error) {
  auto result = journal_validation_result_t{};
  result.validated = false;
  result.code = code;
  result.error = std::move(error);
  return result;
}

bool normally_debit(const account_type_t type) {
  switch (type) {
    case account_type_t::asset:
    case account_type_t::expense:
    case account_type_t::cost_of_goods_sold:
      return true;
    case account_type_t::liability:
    case account_type_t::equity:
    case account_type_t::revenue:
      return false;
  }
  return true;
}

std::vector<coa_warning_t> collect_coa_warnings(
    const journal_posting_input_t& input,
    const std::vector<account_t>& accounts) {
  auto warnings = std::vector<coa_warning_t>{};
  for (std::size_t i = 0; i < input.lines.size(); ++i) {
    const auto& line = input.lines[i];
    const auto& account = accounts[i];
    auto type_name = to_string(account.type);
    if (normally_debit(account.type) && line.credit > 0.0) {
      warnings.push_back(coa_warning_t{
          .account_id = account.id,
          .warning = fmt::format("{} account {} normally has debit balance",
                                 type_name, account.code),
          .account_type = account.type,
          .amount = line.credit,
          .side = posting_side_t::credit});
    } else if (!normally_debit(account.type) && line.debit > 0.0) {
      warnings.push_back(coa_warning_t{
          .account_id = account.id,
          .warning = fmt::format("{} account {} normally has credit balance",
                                 type_name, account.code),
          .account_type = account.type,
          .amount = line.debit,
          .side = posting_side_t::debit});
    }
    if (!account.currency.empty() && account.currency != input.currency) {
      auto debit_side = line.debit > 0.0;
      warnings.push_back(coa_warning_t{
          .account_id = account.id,
          .warning = fmt::format(
              "Account {} is denominated in {} but the journal is in {}",
              account.code, account.currency, input.currency),
          .account_type = account.type,
          .amount = debit_side ? line.debit : line.credit,
          .side = debit_side ? posting_side_t::debit : posting_side_t::credit});
    }
  }
  return warnings;
}

}  // namespace

namespace folio::posting {

journal_validator::journal_validator(const folio::chart::registry& registry,
                                     const folio::sod::authorizer& authorizer,
                                     std::string base_currency,
                                     today_fn_t today)
    : registry_{registry},
      authorizer_{authorizer},
      base_currency_{std::move(base_currency)},
      today_{std::move(today)} {}

journal_validation_result_t journal_validator::validate(
    const journal_posting_input_t& input) const {
  // 1. Structure and accounts.
  if (input.lines.empty()) {
    return reject(posting_error_code_t::invalid_accounts,
                  "Journal must have at least one line");
  }
  if (input.lines.size() > kMaxJournalLines) {
    return reject(posting_error_code_t::business_rule_violation,
                  fmt::format("Journal cannot have more than {} lines",
                              kMaxJournalLines));
  }
  auto accounts = std::vector<account_t>{};
  accounts.reserve(input.lines.size());
  auto missing = std::vector<std::string>{};
  auto inactive = std::vector<std::string>{};
  for (const auto& line : input.lines) {
    const auto* account = registry_.find(line.account_id);
    if (account == nullptr) {
      missing.push_back(line.account_id);
      continue;
    }
    if (!account->is_active) {
      inactive.push_back(line.account_id);
    }
    accounts.push_back(*account);
  }
  if (!missing.empty()) {
    spdlog::warn("Journal '{}' references unknown accounts: {}",
                 input.journal_number, fmt::join(missing, ", "));
    return reject(posting_error_code_t::invalid_accounts,
                  fmt::format("Accounts not found: {}", fmt::join(missing, ", ")));
  }
  if (!inactive.empty()) {
    return reject(posting_error_code_t::invalid_accounts,
                  fmt::format("Accounts are inactive: {}",
                              fmt::join(inactive, ", ")));
  }

  // 2. Currency and FX policy.
  if (!folio::fx::is_valid_currency_code(input.currency)) {
    return reject(posting_error_code_t::invalid_currency,
                  fmt::format("Invalid currency code '{}'", input.currency));
  }
  switch (folio::fx::validate_rate(base_currency_, input.currency,
                                   input.exchange_rate)) {
    case folio::fx::rate_status_t::ok:
      break;
    case folio::fx::rate_status_t::fx_rate_required:
      return reject(posting_error_code_t::invalid_currency,
                    fmt::format("Exchange rate required for {} to {} conversion",
                                input.currency, base_currency_));
    case folio::fx::rate_status_t::invalid_rate:
      return reject(posting_error_code_t::invalid_currency,
                    "Exchange rate must be a positive finite number");
  }
  auto rate = folio::fx::effective_rate(base_currency_, input.currency,
                                        input.exchange_rate);

  // 3. Balance in base currency.
  auto total_debit = amount_t{};
  auto total_credit = amount_t{};
  for (const auto& line : input.lines) {
    total_debit += line.debit * rate;
    total_credit += line.credit * rate;
  }
  auto difference = total_debit - total_credit;
  if (exceeds_tolerance(difference)) {
    auto result = reject(
        posting_error_code_t::journal_unbalanced,
        fmt::format("Journal is not balanced: debits {:.2f}, credits {:.2f}, "
                    "difference {:.2f}",
                    total_debit, total_credit, difference));
    result.difference = difference;
    result.total_debit = total_debit;
    result.total_credit = total_credit;
    return result;
  }

  // 4. Per-line amount range.
  auto number = std::size_t{0};
  for (const auto& line : input.lines) {
    ++number;
    if (line.debit < 0.0 || line.credit < 0.0) {
      return reject(posting_error_code_t::invalid_amount,
                    fmt::format("Line {}: debit and credit cannot be negative",
                                number));
    }
    for (auto value : {line.debit, line.credit}) {
      if (value != 0.0 && (value < kMinLineAmount || value > kMaxLineAmount)) {
        return reject(
            posting_error_code_t::invalid_amount,
            fmt::format("Line {}: amount {:.2f} is outside the allowed range "
                        "{:.2f} to {:.2f}",
                        number, value, kMinLineAmount, kMaxLineAmount));
      }
    }
  }

  // 5. Journal date.
  if (input.journal_date > today()) {
    return reject(posting_error_code_t::business_rule_violation,
                  "Journal date cannot be in the future");
  }

  // 6. Segregation of duties on the base-currency document amount.
  auto decision = authorizer_.check(input.context, input.action, total_debit);
  if (!decision.allowed) {
    spdlog::warn("SoD denied {} on journal '{}': {}", to_string(input.action),
                 input.journal_number, decision.reason.value_or(""));
    auto result = reject(
        posting_error_code_t::sod_violation,
        fmt::format("User role '{}' is not authorized to {}",
                    input.context.user_role, to_string(input.action)));
    result.sod_reason = decision.reason;
    return result;
  }

  auto result = journal_validation_result_t{};
  result.validated = true;
  result.requires_approval = decision.requires_approval;
  if (decision.requires_approval) {
    result.approver_roles = decision.approver_roles;
  }
  result.coa_warnings = collect_coa_warnings(input, accounts);
  result.account_details = std::move(accounts);
  result.total_debit = total_debit;
  result.total_credit = total_credit;
  spdlog::debug("Journal '{}' validated: {} line(s), {} warning(s), approval={}",
                input.journal_number, input.lines.size(),
                result.coa_warnings.size(), result.requires_approval);
  return result;
}

const std::string& journal_validator::base_currency() const {
  return base_currency_;
}

date_t journal_validator::today() const {
  return today_();
}

}  // namespace folio::posting
