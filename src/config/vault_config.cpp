#include <spdlog/spdlog.h>
#include <strongbox/config/vault_config.hpp>
#include <strongbox/ledger/value_converter.hpp>

#include <fstream>

namespace po = boost::program_options;

namespace strongbox::config {

namespace {

std::optional<strongbox::schema::amount_t> read_amount(
    const po::variables_map& vm,
    const std::string& name,
    std::string& error) {
  if (!vm.contains(name)) {
    error = "missing required option --" + name;
    return std::nullopt;
  }
  auto parsed = strongbox::schema::try_make_amount(vm[name].as<std::string>());
  if (!parsed) {
    error = "--" + name + " must be an unsigned decimal integer";
  }
  return parsed;
}

}  // namespace

po::options_description describe_options() {
  auto options = po::options_description{"strongbox vault options"};
  options.add_options()("db-path",
                        po::value<std::string>()->default_value("strongbox.db"),
                        "RocksDB directory holding the ledger")(
      "max-total-value", po::value<std::string>(),
      "global cap in accounting units (value x 10^6)")(
      "max-withdraw-value", po::value<std::string>(),
      "per-withdrawal ceiling in accounting units (value x 10^6)")(
      "oracle-rate", po::value<std::string>()->default_value("0"),
      "native price in accounting units x 10^precision")(
      "oracle-precision", po::value<uint32_t>()->default_value(8),
      "decimal precision of --oracle-rate")(
      "oracle-max-age-ms", po::value<uint64_t>()->default_value(0),
      "oldest acceptable oracle reading, 0 disables the check")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value("strongbox.log"),
      "log file path");
  return options;
}

std::optional<vault_config> make_config(const po::variables_map& vm,
                                        std::string& error) {
  auto config = vault_config{};
  config.db_path = vm["db-path"].as<std::string>();
  if (config.db_path.empty()) {
    error = "--db-path must not be empty";
    return std::nullopt;
  }

  auto max_total = read_amount(vm, "max-total-value", error);
  if (!max_total) {
    return std::nullopt;
  }
  auto max_withdraw = read_amount(vm, "max-withdraw-value", error);
  if (!max_withdraw) {
    return std::nullopt;
  }
  config.limits.max_total_value = *max_total;
  config.limits.max_withdraw_value = *max_withdraw;

  auto rate =
      strongbox::schema::try_make_rate(vm["oracle-rate"].as<std::string>());
  if (!rate) {
    error = "--oracle-rate must be a decimal integer";
    return std::nullopt;
  }
  config.oracle_rate = *rate;

  auto precision = vm["oracle-precision"].as<uint32_t>();
  if (precision > strongbox::ledger::kMaxRatePrecision) {
    error = "--oracle-precision must not exceed " +
            std::to_string(strongbox::ledger::kMaxRatePrecision);
    return std::nullopt;
  }
  config.oracle_precision = static_cast<uint8_t>(precision);
  config.oracle_max_age_ms = vm["oracle-max-age-ms"].as<uint64_t>();

  config.log_level = vm["log-level"].as<std::string>();
  if (spdlog::level::from_str(config.log_level) == spdlog::level::off &&
      config.log_level != "off") {
    error = "unknown --log-level '" + config.log_level + "'";
    return std::nullopt;
  }
  config.log_file = vm["log-file"].as<std::string>();
  return config;
}

bool store_config_file(const std::string& path,
                       const po::options_description& options,
                       po::variables_map& vm,
                       std::string& error) {
  auto input = std::ifstream{path};
  if (!input) {
    error = "cannot open config file '" + path + "'";
    return false;
  }
  try {
    po::store(po::parse_config_file(input, options), vm);
  } catch (const po::error& ex) {
    error = "invalid config file '" + path + "': " + ex.what();
    return false;
  }
  return true;
}

}  // namespace strongbox::config
