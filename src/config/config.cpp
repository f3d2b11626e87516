#include <tessera/blake3/hash.hpp>
#include <tessera/config/config.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <vector>

namespace po = boost::program_options;

namespace tessera::config {

namespace {

bool load_addresses(const po::variables_map& vm,
                    const std::string& name,
                    std::vector<tessera::schema::address_t>& out) {
  if (!vm.contains(name)) {
    return true;
  }
  for (const auto& value : vm[name].as<std::vector<std::string>>()) {
    auto address = tessera::schema::try_make_hash32(value);
    if (!address) {
      spdlog::error("{} '{}' is not a 32 byte hex address", name, value);
      return false;
    }
    out.push_back(*address);
  }
  return true;
}

}  // namespace

po::options_description make_options_description() {
  auto description = po::options_description{"Tessera"};
  description.add_options()(
      "db-path", po::value<std::string>()->default_value("tessera.db"),
      "RocksDB ledger directory")(
      "chain-id", po::value<std::string>()->default_value("tessera-local"),
      "Chain name or 32 byte hex chain id")(
      "strict-crypto", po::value<bool>()->default_value(true),
      "Verify envelope signatures")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value("tessera.log"),
      "Log file path")("genesis.admin",
                       po::value<std::vector<std::string>>()->composing(),
                       "Genesis admin address (hex32, repeatable)")(
      "genesis.executor", po::value<std::vector<std::string>>()->composing(),
      "Genesis executor address (hex32, repeatable)")(
      "genesis.governor", po::value<std::vector<std::string>>()->composing(),
      "Genesis governor address (hex32, repeatable)")(
      "genesis.attestation-service",
      po::value<std::vector<std::string>>()->composing(),
      "Genesis attestation service address (hex32, repeatable)")(
      "genesis.capability-schema", po::value<std::string>(),
      "Capability attestation schema id (hex32)");
  return description;
}

void parse_config_file(const std::string& path,
                       const po::options_description& description,
                       po::variables_map& vm) {
  auto file = std::ifstream{path};
  if (!file) {
    throw po::error{"cannot open config file '" + path + "'"};
  }
  po::store(po::parse_config_file(file, description), vm);
  po::notify(vm);
}

std::optional<node_config> load(const po::variables_map& vm) {
  auto config = node_config{};
  if (vm.contains("db-path")) {
    config.db_path = vm["db-path"].as<std::string>();
  }
  if (vm.contains("chain-id")) {
    config.chain_id = vm["chain-id"].as<std::string>();
  }
  if (vm.contains("strict-crypto")) {
    config.strict_crypto = vm["strict-crypto"].as<bool>();
  }
  if (vm.contains("log-file")) {
    config.log_file = vm["log-file"].as<std::string>();
  }
  if (vm.contains("log-level")) {
    const auto& level = vm["log-level"].as<std::string>();
    config.log_level = spdlog::level::from_str(level);
    // from_str maps unknown names to off.
    if (config.log_level == spdlog::level::off && level != "off") {
      spdlog::error("unknown log-level '{}'", level);
      return std::nullopt;
    }
  }

  auto& genesis = config.genesis;
  if (!load_addresses(vm, "genesis.admin", genesis.admins) ||
      !load_addresses(vm, "genesis.executor", genesis.executors) ||
      !load_addresses(vm, "genesis.governor", genesis.governors) ||
      !load_addresses(vm, "genesis.attestation-service",
                      genesis.attestation_services)) {
    return std::nullopt;
  }
  if (vm.contains("genesis.capability-schema")) {
    const auto& value = vm["genesis.capability-schema"].as<std::string>();
    auto schema_id = tessera::schema::try_make_hash32(value);
    if (!schema_id) {
      spdlog::error("genesis.capability-schema '{}' is not hex32", value);
      return std::nullopt;
    }
    genesis.capability_schema_id = *schema_id;
  }
  return config;
}

tessera::schema::hash32_t make_chain_id(const std::string_view name) {
  if (name.size() == 64) {
    if (auto hash = tessera::schema::try_make_hash32(name)) {
      return *hash;
    }
  }
  return tessera::blake3::hash(name);
}

}  // namespace tessera::config
