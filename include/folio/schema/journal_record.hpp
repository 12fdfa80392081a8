#pragma once
#include <folio/schema/journal_status.hpp>
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: journal record.
// Header-level summary of a persisted journal, as seen by period close.
namespace folio::schema {

template <uint16_t Version>
struct journal_record;

template <>
struct journal_record<1> final {
  uint16_t version{1};
  std::string id;
  std::string tenant_id;
  std::string company_id;
  std::string journal_number;
  std::optional<std::string> reference;
  std::string description;
  date_t journal_date{};
  journal_status_t status{journal_status_t::draft};
  amount_t total_debit{};
  amount_t total_credit{};
};

using journal_record_t = journal_record<1>;

}  // namespace folio::schema
