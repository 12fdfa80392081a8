#include <folio/config/settings.hpp>
#include <folio/fx/policy.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace po = boost::program_options;

namespace folio::config {

po::options_description make_options_description() {
  auto defaults = settings{};
  auto description = po::options_description{"Configuration"};
  description.add_options()("config,c", po::value<std::string>(),
                            "INI configuration file")(
      "ledger.db-path",
      po::value<std::string>()->default_value(defaults.db_path),
      "RocksDB ledger directory")(
      "ledger.base-currency",
      po::value<std::string>()->default_value(defaults.base_currency),
      "Functional currency (ISO 4217)")(
      "sod.governance-pack", po::value<std::string>()->default_value("business"),
      "Governance preset: starter, business or enterprise")(
      "sod.approval-threshold", po::value<std::string>(),
      "Override of the pack-wide approval threshold")(
      "log.level", po::value<std::string>()->default_value("info"),
      "Log level: trace, debug, info, warn, error, critical or off");
  return description;
}

void load_config_file(po::variables_map& vm,
                      const po::options_description& options) {
  if (!vm.contains("config")) {
    return;
  }
  const auto& path = vm["config"].as<std::string>();
  try {
    po::store(po::parse_config_file(path.c_str(), options, true), vm);
  } catch (const po::error& e) {
    throw config_error{
        fmt::format("failed to read config file '{}': {}", path, e.what())};
  }
  spdlog::debug("Loaded configuration from {}", path);
}

settings make_settings(const po::variables_map& vm) {
  auto config = settings{};
  if (vm.contains("ledger.db-path")) {
    config.db_path = vm["ledger.db-path"].as<std::string>();
  }
  if (config.db_path.empty()) {
    throw config_error{"ledger.db-path must not be empty"};
  }

  if (vm.contains("ledger.base-currency")) {
    config.base_currency = vm["ledger.base-currency"].as<std::string>();
  }
  if (!folio::fx::is_valid_currency_code(config.base_currency)) {
    throw config_error{fmt::format(
        "ledger.base-currency '{}' is not a 3-letter currency code",
        config.base_currency)};
  }

  if (vm.contains("sod.governance-pack")) {
    const auto& name = vm["sod.governance-pack"].as<std::string>();
    auto preset =
        folio::schema::from_string(name, folio::sod::kGovernancePresetMappings);
    if (!preset) {
      throw config_error{fmt::format(
          "sod.governance-pack '{}' is not one of: {}", name,
          folio::schema::names_of(folio::sod::kGovernancePresetMappings))};
    }
    config.governance_preset = *preset;
  }

  if (vm.contains("sod.approval-threshold")) {
    const auto& raw = vm["sod.approval-threshold"].as<std::string>();
    auto threshold = double{};
    try {
      auto consumed = std::size_t{};
      threshold = std::stod(raw, &consumed);
      if (consumed != raw.size()) {
        throw std::invalid_argument{raw};
      }
    } catch (const std::logic_error&) {
      throw config_error{
          fmt::format("sod.approval-threshold '{}' is not a number", raw)};
    }
    if (!std::isfinite(threshold) || threshold < 0.0) {
      throw config_error{fmt::format(
          "sod.approval-threshold '{}' must be a non-negative amount", raw)};
    }
    config.approval_threshold = threshold;
  }

  if (vm.contains("log.level")) {
    const auto& name = vm["log.level"].as<std::string>();
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
      throw config_error{fmt::format("log.level '{}' is not a log level", name)};
    }
    config.log_level = level;
  }
  return config;
}

settings parse(const std::vector<std::string>& args) {
  auto options = make_options_description();
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(args).options(options).run(), vm);
    load_config_file(vm, options);
    po::notify(vm);
  } catch (const po::error& e) {
    throw config_error{e.what()};
  }
  return make_settings(vm);
}

folio::sod::governance_pack make_governance_pack(const settings& config) {
  auto pack = folio::sod::make_pack(config.governance_preset);
  if (config.approval_threshold) {
    pack.approval_threshold = *config.approval_threshold;
  }
  return pack;
}

}  // namespace folio::config
