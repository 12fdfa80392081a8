#pragma once

#include <folio/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: journal status.
// Only POSTED journals contribute to the trial balance.
namespace folio::schema {

enum class journal_status_t : uint8_t {
  draft = 0,
  pending_approval = 1,
  posted = 2,
  reversed = 3
};

inline constexpr auto kJournalStatusMappings = std::array{
    std::pair<std::string_view, journal_status_t>{"DRAFT", journal_status_t::draft},
    std::pair<std::string_view, journal_status_t>{"PENDING_APPROVAL", journal_status_t::pending_approval},
    std::pair<std::string_view, journal_status_t>{"POSTED", journal_status_t::posted},
    std::pair<std::string_view, journal_status_t>{"REVERSED", journal_status_t::reversed}};

template <>
inline std::optional<journal_status_t> try_from_string<journal_status_t>(
    const std::string_view value) {
  return from_string(value, kJournalStatusMappings);
}

inline constexpr std::string_view to_string(const journal_status_t value) {
  return to_string(value, kJournalStatusMappings).value_or("UNKNOWN");
}

}  // namespace folio::schema
