#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <strongbox/config/vault_config.hpp>
#include <strongbox/execution/vault_service.hpp>
#include <strongbox/ledger/price_oracle.hpp>
#include <strongbox/schema/vault_error_code.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace po = boost::program_options;
using namespace strongbox::schema;

namespace {

void configure_logging(const strongbox::config::vault_config& config) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "strongbox", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(config.log_level));
}

std::optional<hash32_t> read_id(const po::variables_map& vm,
                                const std::string& name) {
  if (!vm.contains(name)) {
    spdlog::error("missing --{}", name);
    return std::nullopt;
  }
  auto id = try_make_hash32(vm[name].as<std::string>());
  if (!id) {
    spdlog::error("--{} must be 32 bytes of hex", name);
  }
  return id;
}

std::optional<amount_t> read_amount(const po::variables_map& vm) {
  auto amount = try_make_amount(vm["amount"].as<std::string>());
  if (!amount) {
    spdlog::error("--amount must be an unsigned decimal integer");
  }
  return amount;
}

int report(const operation_result_t& result) {
  if (result.code != 0) {
    std::cout << result.codespace << " rejected: " << result.log;
    if (!result.info.empty()) {
      std::cout << " (" << result.info << ")";
    }
    std::cout << '\n';
    return static_cast<int>(result.code);
  }
  std::cout << result.codespace << " ok, value " << result.value.str() << '\n';
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  strongbox deposit-native --account <hex> --amount <n>\n"
            << "  strongbox deposit-asset --account <hex> --asset <hex> "
               "--amount <n>\n"
            << "  strongbox withdraw --account <hex> [--asset <hex>] "
               "--amount <n>\n"
            << "  strongbox balance --account <hex> [--asset <hex>]\n"
            << "  strongbox info\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto config_path = std::string{};

  auto vault_options = strongbox::config::describe_options();
  auto command_options = po::options_description{"command options"};
  command_options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "deposit-native|deposit-asset|withdraw|balance|info")(
      "config", po::value<std::string>(&config_path), "config file path")(
      "account", po::value<std::string>(), "account hash32 hex")(
      "asset", po::value<std::string>(),
      "asset hash32 hex, native currency when omitted")(
      "amount", po::value<std::string>()->default_value("0"),
      "amount in the asset's own precision");
  auto options = po::options_description{};
  options.add(command_options).add(vault_options);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto error = std::string{};
  if (!config_path.empty() &&
      !strongbox::config::store_config_file(config_path, vault_options, vm,
                                            error)) {
    std::cerr << error << '\n';
    return 1;
  }
  auto config = strongbox::config::make_config(vm, error);
  if (!config) {
    std::cerr << error << '\n';
    return 1;
  }

  configure_logging(*config);

  auto storage =
      strongbox::storage::make_storage<strongbox::storage::rocksdb_storage_tag>(
          config->db_path);
  auto clock = strongbox::ledger::system_time_source();
  auto converter = strongbox::ledger::value_converter{
      strongbox::ledger::make_fixed_rate_oracle(
          config->oracle_rate, config->oracle_precision, clock),
      config->oracle_max_age_ms, clock};
  // Transfers are settled out of band; the CLI only records them.
  auto log_transfer = [](std::string_view direction) {
    return [direction](const account_id_t& account, const asset_id_t& asset,
                       const amount_t& amount) {
      spdlog::info("{} {} of asset {} for account {}", direction, amount.str(),
                   to_hex(asset), to_hex(account));
      return true;
    };
  };
  auto service = strongbox::execution::vault_service{
      storage, config->limits, std::move(converter),
      strongbox::ledger::transfer_gateway_t{.pull = log_transfer("pull"),
                                            .push = log_transfer("push")}};

  auto exit_code = 1;
  auto asset = vm.contains("asset") ? read_id(vm, "asset")
                                    : std::optional{native_asset_id()};
  if (command == "info") {
    auto info = service.info();
    std::cout << "sequence " << info.sequence << '\n'
              << "state_root " << to_hex(info.state_root) << '\n'
              << "total_deposited_value " << info.total_deposited_value.str()
              << '\n'
              << "max_total_value " << info.limits.max_total_value.str() << '\n'
              << "max_withdraw_value " << info.limits.max_withdraw_value.str()
              << '\n';
    exit_code = 0;
  } else if (auto account = read_id(vm, "account"); account && asset) {
    if (command == "balance") {
      std::cout << service.balance_of(*account, *asset).str() << '\n';
      exit_code = 0;
    } else if (auto amount = read_amount(vm); !amount) {
      exit_code = 1;
    } else if (command == "deposit-native") {
      exit_code = report(service.deposit_native(*account, *amount));
    } else if (command == "deposit-asset") {
      exit_code = report(service.deposit_asset(*account, *asset, *amount));
    } else if (command == "withdraw") {
      exit_code = report(service.withdraw(*account, *asset, *amount));
    } else {
      spdlog::error("unknown command '{}'", command);
    }
  }

  spdlog::shutdown();
  return exit_code;
}
