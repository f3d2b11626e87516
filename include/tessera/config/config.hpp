#pragma once

#include <tessera/execution/engine.hpp>
#include <tessera/schema/primitives.hpp>
#include <boost/program_options.hpp>
#include <spdlog/common.h>
#include <optional>
#include <string>
#include <string_view>

// Node settings: command line first, INI config file second, defaults last.
namespace tessera::config {

struct node_config final {
  std::string db_path{"tessera.db"};
  std::string chain_id{"tessera-local"};
  bool strict_crypto{true};
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::string log_file{"tessera.log"};
  tessera::execution::genesis_config genesis;
};

/// Options shared by the command line and the config file. Genesis keys live
/// in a [genesis] section of the file.
boost::program_options::options_description make_options_description();

/// Merge an INI file into `vm`. Values already present win.
void parse_config_file(const std::string& path,
                       const boost::program_options::options_description&
                           description,
                       boost::program_options::variables_map& vm);

/// Build a node_config from parsed options. Malformed addresses, schema ids
/// or log levels are logged and yield nullopt.
std::optional<node_config> load(
    const boost::program_options::variables_map& vm);

/// A 64 digit hex chain id is used verbatim, anything else is hashed.
tessera::schema::hash32_t make_chain_id(std::string_view name);

}  // namespace tessera::config
