#include <gtest/gtest.h>
#include <folio/config/settings.hpp>
#include <folio/testing/common.hpp>

#include <fstream>
#include <string>
#include <vector>

using folio::config::config_error;
using folio::sod::governance_preset_t;

TEST(settings, defaults_without_arguments) {
  auto config = folio::config::parse({});
  EXPECT_EQ(config.db_path, "folio-ledger");
  EXPECT_EQ(config.base_currency, "MYR");
  EXPECT_EQ(config.governance_preset, governance_preset_t::business);
  EXPECT_FALSE(config.approval_threshold.has_value());
  EXPECT_EQ(config.log_level, spdlog::level::info);
}

TEST(settings, command_line_values_are_applied) {
  auto config = folio::config::parse(
      {"--ledger.db-path=/tmp/books", "--ledger.base-currency=SGD",
       "--sod.governance-pack=enterprise", "--sod.approval-threshold=1250.50",
       "--log.level=debug"});
  EXPECT_EQ(config.db_path, "/tmp/books");
  EXPECT_EQ(config.base_currency, "SGD");
  EXPECT_EQ(config.governance_preset, governance_preset_t::enterprise);
  ASSERT_TRUE(config.approval_threshold.has_value());
  EXPECT_DOUBLE_EQ(*config.approval_threshold, 1250.50);
  EXPECT_EQ(config.log_level, spdlog::level::debug);
}

TEST(settings, malformed_values_are_rejected) {
  EXPECT_THROW(folio::config::parse({"--sod.governance-pack=startup"}),
               config_error);
  EXPECT_THROW(folio::config::parse({"--ledger.base-currency=ringgit"}),
               config_error);
  EXPECT_THROW(folio::config::parse({"--ledger.db-path="}), config_error);
  EXPECT_THROW(folio::config::parse({"--log.level=loud"}), config_error);
  EXPECT_THROW(folio::config::parse({"--sod.approval-threshold=12abc"}),
               config_error);
  EXPECT_THROW(folio::config::parse({"--sod.approval-threshold=-5"}),
               config_error);
  EXPECT_THROW(folio::config::parse({"--no-such-option"}), config_error);
}

TEST(settings, log_level_off_is_accepted) {
  auto config = folio::config::parse({"--log.level=off"});
  EXPECT_EQ(config.log_level, spdlog::level::off);
}

TEST(settings, threshold_override_reaches_governance_pack) {
  auto config = folio::config::parse(
      {"--sod.governance-pack=starter", "--sod.approval-threshold=100"});
  auto pack = folio::config::make_governance_pack(config);
  EXPECT_EQ(pack.name, "starter");
  EXPECT_DOUBLE_EQ(pack.approval_threshold, 100.0);

  auto untouched = folio::config::make_governance_pack(
      folio::config::parse({"--sod.governance-pack=starter"}));
  EXPECT_DOUBLE_EQ(untouched.approval_threshold, 50'000.0);
}

TEST(settings, config_file_fills_values_not_given_on_command_line) {
  auto path = folio::testing::make_db_path("folio_settings") + ".ini";
  {
    auto file = std::ofstream{path};
    file << "[ledger]\n"
         << "db-path = /var/lib/folio\n"
         << "base-currency = USD\n"
         << "[sod]\n"
         << "governance-pack = starter\n"
         << "[reporting]\n"
         << "format = csv\n";
  }

  auto config = folio::config::parse(
      {"--config=" + path, "--ledger.base-currency=EUR"});
  EXPECT_EQ(config.db_path, "/var/lib/folio");
  EXPECT_EQ(config.base_currency, "EUR");
  EXPECT_EQ(config.governance_preset, governance_preset_t::starter);
  folio::testing::remove_path(path);
}

TEST(settings, missing_config_file_is_an_error) {
  EXPECT_THROW(folio::config::parse({"--config=/nonexistent/folio.ini"}),
               config_error);
}
