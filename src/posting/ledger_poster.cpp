#include <folio/chart/registry.hpp>
#include <folio/posting/ledger_poster.hpp>
#include <folio/schema/key/ledger_keys.hpp>

#include <utility>

#include <spdlog/spdlog.h>

using namespace folio::schema;

namespace folio::posting {

ledger_poster::ledger_poster(folio::storage::ledger_storage_t& storage,
                             const folio::period::manager& periods,
                             const folio::sod::authorizer& authorizer,
                             std::string base_currency,
                             today_fn_t today)
    : storage_{storage},
      periods_{periods},
      authorizer_{authorizer},
      base_currency_{std::move(base_currency)},
      today_{std::move(today)} {}

ledger_posting_result_t ledger_poster::post(
    const journal_posting_input_t& input) const {
  const auto& tenant_id = input.context.tenant_id;
  const auto& company_id = input.context.company_id;

  auto registry =
      folio::chart::registry{storage_.list_accounts(tenant_id, company_id)};
  auto validator =
      journal_validator{registry, authorizer_, base_currency_, today_};
  auto validation = validator.validate(input);

  auto result = ledger_posting_result_t{};
  if (!validation.validated) {
    result.code = validation.code;
    result.error = validation.error;
    result.validation = std::move(validation);
    return result;
  }

  auto period =
      periods_.check_posting_allowed(tenant_id, company_id, input.journal_date);
  if (!period.allowed) {
    spdlog::warn("Journal '{}' dated {} not posted: {}", input.journal_number,
                 format_date(input.journal_date), period.error);
    result.code = posting_error_code_t::period_not_open;
    result.error = period.error;
    result.validation = std::move(validation);
    return result;
  }

  auto journal = journal_record_t{
      .id = folio::schema::key::make_journal_id(tenant_id, company_id,
                                                input.journal_number),
      .tenant_id = tenant_id,
      .company_id = company_id,
      .journal_number = input.journal_number,
      .reference = input.reference,
      .description = input.description.value_or(input.journal_number),
      .journal_date = input.journal_date,
      .status = validation.requires_approval
                    ? journal_status_t::pending_approval
                    : journal_status_t::posted,
      .total_debit = round_amount(validation.total_debit),
      .total_credit = round_amount(validation.total_credit)};
  storage_.put_journal(journal);
  spdlog::info("Recorded journal '{}' in period '{}' as {}",
               journal.journal_number, period.fiscal_period_id.value_or("-"),
               to_string(journal.status));

  result.success = true;
  result.journal = std::move(journal);
  result.validation = std::move(validation);
  return result;
}

}  // namespace folio::posting
