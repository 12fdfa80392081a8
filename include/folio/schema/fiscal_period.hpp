#pragma once
#include <folio/schema/period_status.hpp>
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: fiscal period.
// Created administratively. Status and the closed_* stamps are the only
// fields the period manager writes.
namespace folio::schema {

template <uint16_t Version>
struct fiscal_period;

template <>
struct fiscal_period<1> final {
  uint16_t version{1};
  std::string id;
  std::string tenant_id;
  std::string company_id;
  std::string fiscal_calendar_id;
  uint32_t period_number{};
  date_t start_date{};
  date_t end_date{};
  period_status_t status{period_status_t::open};
  std::optional<date_t> closed_at;
  std::optional<std::string> closed_by;
};

using fiscal_period_t = fiscal_period<1>;

}  // namespace folio::schema
