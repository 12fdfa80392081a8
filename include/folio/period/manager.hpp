#pragma once

#include <folio/schema/fiscal_period.hpp>
#include <folio/schema/lock_type.hpp>
#include <folio/schema/period_close_validation.hpp>
#include <folio/schema/period_inputs.hpp>
#include <folio/schema/period_lock.hpp>
#include <folio/schema/period_results.hpp>
#include <folio/schema/primitives.hpp>
#include <folio/sod/authorizer.hpp>
#include <folio/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace folio::period {

using today_fn_t = std::function<folio::schema::date_t()>;

/// Fiscal period lifecycle: OPEN -> CLOSED -> LOCKED, with reopen back to
/// OPEN.
///
/// At most one close/open/lock is in flight per period. Operations serialise
/// on a per-period mutex and every status write is a compare-and-set against
/// the status read at the start, so a lost race reports
/// PERIOD_ALREADY_CLOSED / PERIOD_ALREADY_OPEN instead of overwriting. The
/// status write and the lock it implies (POSTING on close, deactivation on
/// reopen) land in one storage batch.
class manager final {
 public:
  manager(folio::storage::ledger_storage_t& storage,
          const folio::sod::authorizer& authorizer,
          today_fn_t today = folio::schema::today);

  /// Validate, optionally schedule accrual reversals, mark CLOSED and write an
  /// active POSTING lock. Pre-close errors block unless `force_close` is set.
  folio::schema::period_close_result_t close_fiscal_period(
      const folio::schema::period_close_input_t& input);

  /// Reopen a CLOSED or LOCKED period and deactivate all of its locks.
  folio::schema::period_open_result_t open_fiscal_period(
      const folio::schema::period_open_input_t& input);

  /// SoD-gated lock insert. A FULL lock on a CLOSED period also moves it to
  /// LOCKED.
  folio::schema::period_lock_result_t create_period_lock(
      const folio::schema::period_lock_input_t& input);

  /// Pre-close report for `period`. Read only.
  folio::schema::period_close_validation_t validate_period_close(
      const folio::schema::fiscal_period_t& period) const;

  /// Whether a journal dated `date` may be posted. Storage failures propagate
  /// as storage_error.
  folio::schema::posting_check_result_t check_posting_allowed(
      const std::string& tenant_id,
      const std::string& company_id,
      folio::schema::date_t date) const;

  /// Periods whose serialising mutex is still registered.
  std::size_t tracked_periods();

 private:
  std::shared_ptr<std::mutex> period_mutex(const std::string& fiscal_period_id);

  /// Active lock stamped with today. Storage assigns the id.
  folio::schema::period_lock_t make_lock(
      const folio::schema::fiscal_period_t& period,
      folio::schema::lock_type_t lock_type,
      const std::string& locked_by,
      const std::string& reason) const;

  uint64_t create_reversing_entries(const folio::schema::fiscal_period_t& period,
                                    const folio::schema::fiscal_period_t& next,
                                    const std::string& created_by);

  folio::storage::ledger_storage_t& storage_;
  const folio::sod::authorizer& authorizer_;
  today_fn_t today_;
  std::mutex registry_mutex_;
  /// Only periods with an operation in flight keep their mutex alive.
  std::unordered_map<std::string, std::weak_ptr<std::mutex>> period_mutexes_;
};

}  // namespace folio::period
