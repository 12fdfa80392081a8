#include <folio/schema/primitives.hpp>

#include <charconv>
#include <cmath>
#include <iterator>

#include <fmt/format.h>

namespace folio::schema {

namespace {

// Guards the tolerance comparison against binary representation noise, so
// 100.00 - 99.99 still counts as within one cent.
constexpr auto kToleranceEpsilon = 1e-9;

template <typename T>
std::optional<T> parse_number(const std::string_view value) {
  auto out = T{};
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(),
                                   out);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return out;
}

}  // namespace

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

amount_t round_amount(const amount_t value) {
  return std::round(value * 100.0) / 100.0;
}

bool exceeds_tolerance(const amount_t difference) {
  return (std::abs(difference) - kAmountTolerance) > kToleranceEpsilon;
}

minor_units_t to_minor_units(const amount_t value) {
  return static_cast<minor_units_t>(std::llround(value * 100.0));
}

amount_t from_minor_units(const minor_units_t value) {
  return static_cast<amount_t>(value) / 100.0;
}

std::optional<date_t> try_parse_date(const std::string_view value) {
  if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
    return std::nullopt;
  }
  auto year = parse_number<int>(value.substr(0, 4));
  auto month = parse_number<unsigned>(value.substr(5, 2));
  auto day = parse_number<unsigned>(value.substr(8, 2));
  if (!year || !month || !day) {
    return std::nullopt;
  }
  auto ymd = std::chrono::year_month_day{std::chrono::year{*year},
                                         std::chrono::month{*month},
                                         std::chrono::day{*day}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return date_t{ymd};
}

std::string format_date(const date_t value) {
  auto ymd = std::chrono::year_month_day{value};
  return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                     static_cast<unsigned>(ymd.month()),
                     static_cast<unsigned>(ymd.day()));
}

int64_t to_epoch_days(const date_t value) {
  return static_cast<int64_t>(value.time_since_epoch().count());
}

date_t from_epoch_days(const int64_t days) {
  return date_t{std::chrono::days{days}};
}

date_t today() {
  return std::chrono::floor<std::chrono::days>(
      std::chrono::system_clock::now());
}

}  // namespace folio::schema
