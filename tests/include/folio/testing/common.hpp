#pragma once

#include <folio/schema/account.hpp>
#include <folio/schema/account_type.hpp>
#include <folio/schema/posting_context.hpp>
#include <folio/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace folio::testing {

inline folio::schema::date_t make_date(const int year,
                                       const unsigned month,
                                       const unsigned day) {
  return folio::schema::date_t{std::chrono::year{year} /
                               std::chrono::month{month} /
                               std::chrono::day{day}};
}

/// Pinned "today" for every clock-dependent test.
inline folio::schema::date_t fixed_today() {
  return make_date(2025, 6, 30);
}

inline folio::schema::account_t make_account(
    const std::string_view id,
    const std::string_view code,
    const folio::schema::account_type_t type,
    const std::string_view currency = "MYR",
    const bool is_active = true) {
  return folio::schema::account_t{.id = std::string{id},
                                  .code = std::string{code},
                                  .name = std::string{id},
                                  .type = type,
                                  .currency = std::string{currency},
                                  .is_active = is_active};
}

inline folio::schema::posting_context_t make_context(
    const std::string_view role,
    const std::string_view user_id = "user-1") {
  return folio::schema::posting_context_t{.tenant_id = "tenant-1",
                                          .company_id = "company-1",
                                          .user_id = std::string{user_id},
                                          .user_role = std::string{role}};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace folio::testing
