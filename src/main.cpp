#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tessera/config/config.hpp>
#include <tessera/execution/engine.hpp>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/storage/rocksdb/storage.hpp>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

using encoder_t = tessera::schema::encoding::encoder<
    tessera::schema::encoding::scale_encoder_tag>;
using storage_tag_t = tessera::storage::rocksdb_storage_tag;

void install_logger(const tessera::config::node_config& config) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "tessera", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(config.log_level);
}

// One hex encoded transaction per non-empty line.
std::optional<std::vector<tessera::schema::bytes_t>> read_transactions(
    const std::vector<std::string>& paths) {
  auto txs = std::vector<tessera::schema::bytes_t>{};
  for (const auto& path : paths) {
    auto file = std::ifstream{path};
    if (!file) {
      spdlog::error("cannot open transaction file '{}'", path);
      return std::nullopt;
    }
    auto line = std::string{};
    while (std::getline(file, line)) {
      std::erase_if(line, [](const char c) {
        return c == ' ' || c == '\t' || c == '\r';
      });
      if (line.empty()) {
        continue;
      }
      auto tx = tessera::schema::try_from_hex(line);
      if (!tx) {
        spdlog::error("'{}' holds a line that is not hex", path);
        return std::nullopt;
      }
      txs.push_back(std::move(*tx));
    }
  }
  return txs;
}

uint64_t now_milliseconds() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

int run_apply(tessera::execution::engine& engine, const po::variables_map& vm) {
  auto paths = vm.contains("tx") ? vm["tx"].as<std::vector<std::string>>()
                                 : std::vector<std::string>{};
  auto txs = read_transactions(paths);
  if (!txs) {
    return 1;
  }

  auto height = vm.contains("height")
                    ? vm["height"].as<uint64_t>()
                    : static_cast<uint64_t>(engine.info().last_block_height) +
                          1;
  auto block_time = vm.contains("time") ? vm["time"].as<uint64_t>()
                                        : now_milliseconds();

  auto block = engine.finalize_block(height, block_time, *txs);
  auto failures = 0;
  for (std::size_t i = 0; i < block.tx_results.size(); ++i) {
    const auto& result = block.tx_results[i];
    if (result.code != 0) {
      ++failures;
    }
    std::cout << i << " code=" << result.code << " log=" << result.log;
    if (!result.data.empty()) {
      std::cout << " data=" << tessera::schema::to_hex(result.data);
    }
    std::cout << std::endl;
  }
  auto committed = engine.commit();
  std::cout << "height=" << committed.committed_height
            << " state_root=" << tessera::schema::to_hex(committed.state_root)
            << " written_keys=" << committed.written_keys << std::endl;
  return failures == 0 ? 0 : 2;
}

int run_query(tessera::execution::engine& engine, const po::variables_map& vm) {
  if (!vm.contains("path")) {
    spdlog::error("query needs --path");
    return 1;
  }
  auto data = tessera::schema::bytes_t{};
  if (vm.contains("data")) {
    auto decoded = tessera::schema::try_from_hex(vm["data"].as<std::string>());
    if (!decoded) {
      spdlog::error("--data must be hex");
      return 1;
    }
    data = std::move(*decoded);
  }
  auto result = engine.query(vm["path"].as<std::string>(), data);
  std::cout << "code=" << result.code << " height=" << result.height
            << " log=" << result.log << std::endl;
  if (result.code == 0) {
    std::cout << tessera::schema::to_hex(result.value) << std::endl;
  }
  return result.code == 0 ? 0 : 2;
}

int run_info(const tessera::execution::engine& engine) {
  auto info = engine.info();
  std::cout << info.data << " " << info.version
            << " app_version=" << info.app_version
            << " height=" << info.last_block_height << " state_root="
            << tessera::schema::to_hex(info.last_block_state_root)
            << " chain_id=" << tessera::schema::to_hex(engine.chain_id())
            << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto description = tessera::config::make_options_description();
  auto cli = po::options_description{"Command"};
  cli.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI config file")(
      "command", po::value<std::string>()->default_value("info"),
      "apply|query|info")("tx,t", po::value<std::vector<std::string>>(),
                          "File of hex transactions, one per line (apply)")(
      "height", po::value<uint64_t>(), "Block height (apply)")(
      "time", po::value<uint64_t>(), "Block time in milliseconds (apply)")(
      "path,p", po::value<std::string>(), "Query route (query)")(
      "data,d", po::value<std::string>(), "Hex query key (query)");
  cli.add(description);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(cli)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
    if (vm.contains("config")) {
      tessera::config::parse_config_file(vm["config"].as<std::string>(),
                                         description, vm);
    }
  } catch (const po::error& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << cli << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << cli << std::endl;
    return 0;
  }

  auto config = tessera::config::load(vm);
  if (!config) {
    return 1;
  }
  install_logger(*config);

  const auto& command = vm["command"].as<std::string>();
  if (command != "apply" && command != "query" && command != "info") {
    spdlog::error("unknown command '{}'", command);
    spdlog::shutdown();
    return 1;
  }

  auto encoder = encoder_t{};
  auto storage = tessera::storage::make_storage<storage_tag_t>(config->db_path);
  auto engine = tessera::execution::engine{
      encoder, storage, tessera::config::make_chain_id(config->chain_id),
      config->strict_crypto};
  if (engine.initialize(config->genesis)) {
    spdlog::info("Applied genesis to '{}'", config->db_path);
  }

  auto status = 0;
  if (command == "apply") {
    status = run_apply(engine, vm);
  } else if (command == "query") {
    status = run_query(engine, vm);
  } else {
    status = run_info(engine);
  }

  spdlog::shutdown();
  return status;
}
