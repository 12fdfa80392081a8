#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace folio::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

/// Monetary value in major units (e.g. 12.34 MYR).
using amount_t = double;
/// Monetary value in integer minor units (cents) as persisted.
using minor_units_t = int64_t;
using date_t = std::chrono::sys_days;

/// Two-decimal currency tolerance applied to every balance comparison.
inline constexpr auto kAmountTolerance = amount_t{0.01};
inline constexpr auto kMinLineAmount = amount_t{0.01};
inline constexpr auto kMaxLineAmount = amount_t{999'999'999.99};

bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);

/// Round half away from zero to two decimals.
amount_t round_amount(amount_t value);

/// True when |difference| is larger than the two-decimal tolerance.
bool exceeds_tolerance(amount_t difference);

minor_units_t to_minor_units(amount_t value);
amount_t from_minor_units(minor_units_t value);

/// Parse an ISO-8601 calendar date (YYYY-MM-DD).
std::optional<date_t> try_parse_date(std::string_view value);
std::string format_date(date_t value);

int64_t to_epoch_days(date_t value);
date_t from_epoch_days(int64_t days);

/// Current UTC calendar date.
date_t today();

}  // namespace folio::schema
