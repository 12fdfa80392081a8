#include <folio/posting/document_posting.hpp>

#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace folio::schema;

namespace folio::posting::detail {

document_posting_result_t reject_document(const posting_error_code_t code,
                                          std::string error,
                                          const document_totals_t& totals) {
  auto result = document_posting_result_t{};
  result.success = false;
  result.code = code;
  result.error = std::move(error);
  result.totals = totals;
  return result;
}

document_posting_result_t validate_document_journal(
    journal_posting_input_t journal,
    const document_totals_t& totals,
    const journal_validator& validator) {
  auto validation = validator.validate(journal);
  if (!validation.validated) {
    spdlog::warn("Document journal '{}' rejected: {} {}",
                 journal.journal_number,
                 to_string(validation.code.value_or(
                     posting_error_code_t::business_rule_violation)),
                 validation.error);
    auto result = reject_document(
        posting_error_code_t::business_rule_violation,
        fmt::format("Journal validation failed: {}", validation.error),
        totals);
    result.journal_code = validation.code;
    result.validation = std::move(validation);
    return result;
  }

  auto result = document_posting_result_t{};
  result.success = true;
  result.totals = totals;
  result.journal = std::move(journal);
  result.validation = std::move(validation);
  return result;
}

}  // namespace folio::posting::detail
