#pragma once

#include <folio/chart/registry.hpp>
#include <folio/schema/journal_posting_input.hpp>
#include <folio/schema/journal_validation_result.hpp>
#include <folio/schema/primitives.hpp>
#include <folio/sod/authorizer.hpp>
#include <cstddef>
#include <functional>
#include <string>

namespace folio::posting {

inline constexpr auto kMaxJournalLines = std::size_t{100};

/// Supplies "today" for future-date checks. Injected so tests can pin it.
using today_fn_t = std::function<folio::schema::date_t()>;

/// Double-entry invariant engine.
///
/// Checks run in a fixed order and stop at the first fatal error:
/// structure and accounts, currency and FX rate, balance in base currency,
/// per-line amount range, journal date, then segregation of duties.
/// Chart-of-accounts warnings are attached to successful results only.
/// Nothing is persisted.
class journal_validator final {
 public:
  journal_validator(const folio::chart::registry& registry,
                    const folio::sod::authorizer& authorizer,
                    std::string base_currency,
                    today_fn_t today = folio::schema::today);

  folio::schema::journal_validation_result_t validate(
      const folio::schema::journal_posting_input_t& input) const;

  const std::string& base_currency() const;
  folio::schema::date_t today() const;

 private:
  const folio::chart::registry& registry_;
  const folio::sod::authorizer& authorizer_;
  std::string base_currency_;
  today_fn_t today_;
};

}  // namespace folio::posting
