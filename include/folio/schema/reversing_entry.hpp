#pragma once
#include <folio/schema/primitives.hpp>
#include <folio/schema/reversing_entry_status.hpp>
#include <cstdint>
#include <string>

// Schema type: reversing entry.
// Scheduled counter-entry for an accrual. Posting it to the GL is done
// downstream; this ledger only records the schedule.
namespace folio::schema {

template <uint16_t Version>
struct reversing_entry;

template <>
struct reversing_entry<1> final {
  uint16_t version{1};
  std::string id;
  std::string tenant_id;
  std::string company_id;
  std::string original_journal_id;
  date_t reversal_date{};
  std::string reversal_reason;
  reversing_entry_status_t status{reversing_entry_status_t::pending};
  std::string created_by;
};

using reversing_entry_t = reversing_entry<1>;

}  // namespace folio::schema
