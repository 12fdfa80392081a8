#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <folio/config/settings.hpp>
#include <folio/fx/policy.hpp>
#include <folio/period/manager.hpp>
#include <folio/posting/ledger_poster.hpp>
#include <folio/schema/period_error_code.hpp>
#include <folio/schema/posting_error_code.hpp>
#include <folio/sod/authorizer.hpp>
#include <folio/storage/rocksdb/storage.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;

namespace {

constexpr auto kExitSuccess = 0;
constexpr auto kExitBusinessFailure = 1;
constexpr auto kExitUsage = 2;

class usage_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

void setup_logging(const spdlog::level::level_enum level) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("folio.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "folio", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(level);
}

std::string required(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    throw usage_error{fmt::format("--{} is required", name)};
  }
  return vm[name].as<std::string>();
}

folio::schema::date_t required_date(const po::variables_map& vm,
                                    const std::string& name) {
  auto raw = required(vm, name);
  auto date = folio::schema::try_parse_date(raw);
  if (!date) {
    throw usage_error{fmt::format("--{} '{}' is not a YYYY-MM-DD date", name, raw)};
  }
  return *date;
}

int report(const std::optional<folio::schema::period_error_code_t>& code,
           const std::string& error) {
  std::cout << folio::schema::to_string(
                   code.value_or(folio::schema::period_error_code_t::invalid_input))
            << " " << error << std::endl;
  return kExitBusinessFailure;
}

int report(const std::optional<folio::schema::posting_error_code_t>& code,
           const std::string& error) {
  std::cout << folio::schema::to_string(code.value_or(
                   folio::schema::posting_error_code_t::journal_validation_failed))
            << " " << error << std::endl;
  return kExitBusinessFailure;
}

int create_account(folio::storage::ledger_storage_t& storage,
                   const folio::config::settings& config,
                   const po::variables_map& vm) {
  auto type_name = required(vm, "type");
  auto type =
      folio::schema::try_from_string<folio::schema::account_type_t>(type_name);
  if (!type) {
    throw usage_error{fmt::format(
        "--type '{}' is not one of: {}", type_name,
        folio::schema::names_of(folio::schema::kAccountTypeMappings))};
  }
  auto account = folio::schema::account_t{
      .id = required(vm, "account"),
      .code = required(vm, "code"),
      .name = required(vm, "name"),
      .type = *type,
      .currency = vm.contains("currency") ? required(vm, "currency")
                                          : config.base_currency,
      .is_active = !vm.contains("inactive")};
  if (vm.contains("parent")) {
    account.parent_id = required(vm, "parent");
  }
  if (!folio::fx::is_valid_currency_code(account.currency)) {
    throw usage_error{
        fmt::format("--currency '{}' is not an ISO code", account.currency)};
  }
  storage.put_account(required(vm, "tenant"), required(vm, "company"), account);
  std::cout << fmt::format("OK {} {} {} {}", account.id, account.code,
                           folio::schema::to_string(account.type),
                           account.currency)
            << std::endl;
  return kExitSuccess;
}

int post_journal(const folio::posting::ledger_poster& poster,
                 const folio::config::settings& config,
                 const po::variables_map& vm) {
  if (!vm.contains("amount")) {
    throw usage_error{"--amount is required"};
  }
  auto amount = vm["amount"].as<double>();
  auto input = folio::schema::journal_posting_input_t{};
  input.journal_number = required(vm, "journal");
  input.journal_date = required_date(vm, "date");
  input.currency =
      vm.contains("currency") ? required(vm, "currency") : config.base_currency;
  if (vm.contains("rate")) {
    input.exchange_rate = vm["rate"].as<double>();
  }
  if (vm.contains("reference")) {
    input.reference = required(vm, "reference");
  }
  if (vm.contains("reason")) {
    input.description = required(vm, "reason");
  }
  input.lines = {
      folio::schema::journal_line_t{.account_id = required(vm, "debit-account"),
                                    .debit = amount},
      folio::schema::journal_line_t{
          .account_id = required(vm, "credit-account"), .credit = amount}};
  input.context = folio::schema::posting_context_t{
      .tenant_id = required(vm, "tenant"),
      .company_id = required(vm, "company"),
      .user_id = required(vm, "user"),
      .user_role = required(vm, "role")};

  auto result = poster.post(input);
  if (!result.success) {
    return report(result.code, result.error);
  }
  std::cout << fmt::format("OK {} {} debit={:.2f} credit={:.2f} id={}",
                           result.journal->journal_number,
                           folio::schema::to_string(result.journal->status),
                           result.journal->total_debit,
                           result.journal->total_credit, result.journal->id)
            << std::endl;
  for (const auto& warning : result.validation->coa_warnings) {
    spdlog::warn("{}", warning.warning);
  }
  return kExitSuccess;
}

int create_period(folio::storage::ledger_storage_t& storage,
                  const po::variables_map& vm) {
  auto period = folio::schema::fiscal_period_t{
      .id = required(vm, "period"),
      .tenant_id = required(vm, "tenant"),
      .company_id = required(vm, "company"),
      .fiscal_calendar_id = required(vm, "calendar"),
      .period_number = vm["number"].as<uint32_t>(),
      .start_date = required_date(vm, "start"),
      .end_date = required_date(vm, "end")};
  if (period.end_date < period.start_date) {
    throw usage_error{"--end must not be before --start"};
  }
  storage.put_fiscal_period(period);
  std::cout << "OK " << period.id << " "
            << folio::schema::to_string(period.status) << std::endl;
  return kExitSuccess;
}

int show_period(folio::storage::ledger_storage_t& storage,
                const po::variables_map& vm) {
  auto id = required(vm, "period");
  auto period = storage.find_fiscal_period(id);
  if (!period) {
    return report(folio::schema::period_error_code_t::period_not_found,
                  "Fiscal period not found");
  }
  auto active_locks = std::size_t{0};
  for (const auto& lock : storage.list_period_locks(period->id)) {
    active_locks += lock.is_active ? 1 : 0;
  }
  std::cout << fmt::format(
                   "OK {} {} {}..{} calendar={} number={} active_locks={}",
                   period->id, folio::schema::to_string(period->status),
                   folio::schema::format_date(period->start_date),
                   folio::schema::format_date(period->end_date),
                   period->fiscal_calendar_id, period->period_number,
                   active_locks)
            << std::endl;
  return kExitSuccess;
}

int close_period(folio::period::manager& manager, const po::variables_map& vm) {
  auto input = folio::schema::period_close_input_t{
      .tenant_id = required(vm, "tenant"),
      .company_id = required(vm, "company"),
      .fiscal_period_id = required(vm, "period"),
      .close_date = vm.contains("date") ? std::optional{required_date(vm, "date")}
                                        : std::optional{folio::schema::today()},
      .closed_by = required(vm, "user"),
      .user_role = required(vm, "role"),
      .force_close = vm.contains("force"),
      .generate_reversing_entries = vm.contains("reversing")};
  if (vm.contains("reason")) {
    input.close_reason = vm["reason"].as<std::string>();
  }
  auto result = manager.close_fiscal_period(input);
  if (!result.success) {
    return report(result.code, result.error);
  }
  std::cout << fmt::format("OK {} CLOSED reversing_entries={} next_period={}",
                           result.fiscal_period_id,
                           result.reversing_entries_created,
                           result.next_period_id.value_or("-"))
            << std::endl;
  if (result.validation) {
    for (const auto& error : result.validation->errors) {
      spdlog::warn("Closed despite: {}", error);
    }
  }
  return kExitSuccess;
}

int open_period(folio::period::manager& manager, const po::variables_map& vm) {
  auto result = manager.open_fiscal_period(folio::schema::period_open_input_t{
      .tenant_id = required(vm, "tenant"),
      .company_id = required(vm, "company"),
      .fiscal_period_id = required(vm, "period"),
      .opened_by = required(vm, "user"),
      .user_role = required(vm, "role"),
      .open_reason = required(vm, "reason"),
      .approval_required = vm.contains("approval-required")});
  if (!result.success) {
    return report(result.code, result.error);
  }
  std::cout << fmt::format("OK {} OPEN locks_deactivated={} requires_approval={}",
                           result.fiscal_period_id, result.locks_deactivated,
                           result.requires_approval)
            << std::endl;
  return kExitSuccess;
}

int lock_period(folio::period::manager& manager, const po::variables_map& vm) {
  auto lock_name = vm["lock-type"].as<std::string>();
  auto lock_type =
      folio::schema::try_from_string<folio::schema::lock_type_t>(lock_name);
  if (!lock_type) {
    throw usage_error{fmt::format(
        "--lock-type '{}' is not one of: {}", lock_name,
        folio::schema::names_of(folio::schema::kLockTypeMappings))};
  }
  auto result = manager.create_period_lock(folio::schema::period_lock_input_t{
      .tenant_id = required(vm, "tenant"),
      .company_id = required(vm, "company"),
      .fiscal_period_id = required(vm, "period"),
      .lock_type = *lock_type,
      .locked_by = required(vm, "user"),
      .user_role = required(vm, "role"),
      .reason = required(vm, "reason")});
  if (!result.success) {
    return report(result.code, result.error);
  }
  std::cout << fmt::format("OK {} {} lock={}", result.lock->fiscal_period_id,
                           folio::schema::to_string(*result.status),
                           result.lock->id)
            << std::endl;
  return kExitSuccess;
}

int check_posting(const folio::period::manager& manager,
                  const po::variables_map& vm) {
  auto date = required_date(vm, "date");
  auto result = manager.check_posting_allowed(required(vm, "tenant"),
                                              required(vm, "company"), date);
  if (!result.allowed) {
    return report(result.code, result.error);
  }
  std::cout << "OK " << result.fiscal_period_id.value_or("-") << " "
            << folio::schema::format_date(date) << std::endl;
  return kExitSuccess;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto config_options = folio::config::make_options_description();

  auto command_options = po::options_description{"Commands"};
  command_options.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(),
      "create-account | create-period | show-period | close-period | "
      "open-period | lock-period | check-posting | post-journal")(
      "period,p", po::value<std::string>(), "Fiscal period id")(
      "tenant,t", po::value<std::string>(), "Tenant id")(
      "company", po::value<std::string>(), "Company id")(
      "user,u", po::value<std::string>(), "Acting user id")(
      "role,r", po::value<std::string>(), "Acting user role")(
      "reason", po::value<std::string>(),
      "Close, open or lock reason, or journal description")(
      "date,d", po::value<std::string>(), "Close date or posting date")(
      "calendar", po::value<std::string>(), "Fiscal calendar id")(
      "number", po::value<uint32_t>()->default_value(1),
      "Period number within the calendar")(
      "start", po::value<std::string>(), "Period start date")(
      "end", po::value<std::string>(), "Period end date")(
      "lock-type", po::value<std::string>()->default_value("POSTING"),
      "POSTING, REPORTING or FULL")("force", "Close despite validation errors")(
      "reversing", "Schedule reversals for accrual journals")(
      "approval-required", "Reopen only under an approval-gated decision")(
      "account", po::value<std::string>(), "Account id")(
      "code", po::value<std::string>(), "Account code")(
      "name", po::value<std::string>(), "Account name")(
      "type", po::value<std::string>(),
      "ASSET, LIABILITY, EQUITY, REVENUE, EXPENSE or COST_OF_GOODS_SOLD")(
      "parent", po::value<std::string>(), "Parent account id")(
      "inactive", "Create the account inactive")(
      "currency", po::value<std::string>(),
      "Account or journal currency (defaults to ledger.base-currency)")(
      "journal", po::value<std::string>(), "Journal number")(
      "debit-account", po::value<std::string>(), "Account id to debit")(
      "credit-account", po::value<std::string>(), "Account id to credit")(
      "amount", po::value<double>(), "Journal amount")(
      "rate", po::value<double>(), "Journal currency to base currency rate")(
      "reference", po::value<std::string>(), "Journal reference");

  auto description = po::options_description{"Folio"};
  description.add(command_options).add(config_options);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  auto config = folio::config::settings{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    folio::config::load_config_file(vm, config_options);
    po::notify(vm);
    config = folio::config::make_settings(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << std::endl;
    return kExitUsage;
  } catch (const folio::config::config_error& e) {
    std::cerr << e.what() << std::endl;
    return kExitUsage;
  }

  if (vm.contains("help") || !vm.contains("command")) {
    std::cout << description << std::endl;
    return vm.contains("help") ? kExitSuccess : kExitUsage;
  }

  setup_logging(config.log_level);

  auto exit_code = kExitSuccess;
  try {
    auto storage = folio::storage::make_storage<folio::storage::rocksdb_storage_tag>(
        config.db_path);
    auto authorizer =
        folio::sod::authorizer{folio::config::make_governance_pack(config)};
    auto manager = folio::period::manager{storage, authorizer};
    auto poster = folio::posting::ledger_poster{storage, manager, authorizer,
                                                config.base_currency};
    spdlog::debug("Using '{}' governance pack, base currency {}",
                  authorizer.pack().name, config.base_currency);

    const auto& command = vm["command"].as<std::string>();
    if (command == "create-account") {
      exit_code = create_account(storage, config, vm);
    } else if (command == "post-journal") {
      exit_code = post_journal(poster, config, vm);
    } else if (command == "create-period") {
      exit_code = create_period(storage, vm);
    } else if (command == "show-period") {
      exit_code = show_period(storage, vm);
    } else if (command == "close-period") {
      exit_code = close_period(manager, vm);
    } else if (command == "open-period") {
      exit_code = open_period(manager, vm);
    } else if (command == "lock-period") {
      exit_code = lock_period(manager, vm);
    } else if (command == "check-posting") {
      exit_code = check_posting(manager, vm);
    } else {
      throw usage_error{fmt::format("unknown command '{}'", command)};
    }
  } catch (const usage_error& e) {
    std::cerr << e.what() << std::endl;
    exit_code = kExitUsage;
  } catch (const folio::storage::storage_error& e) {
    spdlog::error("Ledger store failure: {}", e.what());
    std::cout << "STORAGE_ERROR " << e.what() << std::endl;
    exit_code = kExitBusinessFailure;
  }

  spdlog::shutdown();
  return exit_code;
}
