#pragma once

#include <boost/program_options.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/vault_limits.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace strongbox::config {

/// Construction-time settings of a vault instance. Nothing here can change
/// once the service is built.
struct vault_config final {
  std::string db_path{"strongbox.db"};
  strongbox::schema::vault_limits_t limits{};
  strongbox::schema::rate_t oracle_rate{};
  uint8_t oracle_precision{8};
  strongbox::schema::duration_milliseconds_t oracle_max_age_ms{};
  std::string log_level{"info"};
  std::string log_file{"strongbox.log"};
};

/// Options understood by `make_config`, for the command line and for config
/// files alike.
boost::program_options::options_description describe_options();

/// Build and validate a config from parsed options.
///
/// On failure, `error` contains a human-readable reason.
std::optional<vault_config> make_config(
    const boost::program_options::variables_map& vm,
    std::string& error);

/// Store options from a config file into `vm`. Values already present in
/// `vm` (from the command line) take precedence.
bool store_config_file(const std::string& path,
                       const boost::program_options::options_description&
                           options,
                       boost::program_options::variables_map& vm,
                       std::string& error);

}  // namespace strongbox::config
