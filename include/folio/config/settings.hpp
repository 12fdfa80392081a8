#pragma once

#include <folio/schema/primitives.hpp>
#include <folio/sod/governance_pack.hpp>
#include <boost/program_options.hpp>
#include <spdlog/common.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace folio::config {

/// Rejected option value, or a config file that cannot be read.
class config_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Runtime configuration shared by the CLI and embedding applications.
struct settings final {
  std::string db_path{"folio-ledger"};
  /// Functional currency every journal is balanced in.
  std::string base_currency{"MYR"};
  folio::sod::governance_preset_t governance_preset{
      folio::sod::governance_preset_t::business};
  /// Replaces the preset's pack-wide approval threshold when set.
  std::optional<folio::schema::amount_t> approval_threshold;
  spdlog::level::level_enum log_level{spdlog::level::info};
};

/// `--config`, `ledger.*`, `sod.*` and `log.*` options. Values are kept as
/// strings so make_settings can report every malformed value the same way.
boost::program_options::options_description make_options_description();

/// Merge the INI file named by `--config` (if any) into `vm`. Values already
/// present from the command line win.
void load_config_file(boost::program_options::variables_map& vm,
                      const boost::program_options::options_description& options);

/// Validate and convert parsed options. Throws config_error.
settings make_settings(const boost::program_options::variables_map& vm);

/// Parse `args` (without the program name) plus any `--config` file.
settings parse(const std::vector<std::string>& args);

/// Governance pack for the configured preset and threshold override.
folio::sod::governance_pack make_governance_pack(const settings& config);

}  // namespace folio::config
