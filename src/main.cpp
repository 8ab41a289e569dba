#include <csignal>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <boost/program_options.hpp>
#include <iostream>
#include <string>
#include <trustee/execution/engine.hpp>
#include <trustee/schema/encoding/scale/encoder.hpp>
#include <trustee/storage/rocksdb/storage.hpp>
#include <vector>

namespace {

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

std::string trim(const std::string& line) {
  auto begin = line.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = line.find_last_not_of(" \t\r\n");
  return line.substr(begin, end - begin + 1);
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto db_path = std::string{};
  auto chain_name = std::string{};
  auto threshold = uint32_t{};
  auto log_file = std::string{};
  auto log_level = std::string{};
  auto participants = std::vector<std::string>{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Trustee"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "trustee-data"),
      "RocksDB directory for wallet state")(
      "chain-id,c",
      boost::program_options::value<std::string>(&chain_name)->default_value(
          "trustee-local-chain"),
      "Chain id as 64 hex digits or a name to hash")(
      "participant,p",
      boost::program_options::value<std::vector<std::string>>(&participants)
          ->composing(),
      "Genesis participant (repeatable)")(
      "threshold,t",
      boost::program_options::value<uint32_t>(&threshold)->default_value(1),
      "Genesis approval threshold")(
      "log-file,l",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "trustee.log"),
      "Log file path")(
      "log-level",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace|debug|info|warn|error|critical")("verbose,v",
                                              "Enable verbose output");
  boost::program_options::store(
      boost::program_options::parse_command_line(argc, argv, description), vm);
  boost::program_options::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "trustee", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose")
                        ? spdlog::level::debug
                        : spdlog::level::from_str(log_level));

  auto chain_id = trustee::schema::parse_identity(chain_name);
  auto encoder = trustee::schema::encoding::scale_encoder_t{};
  auto storage =
      trustee::storage::make_storage<trustee::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = trustee::execution::engine{encoder, storage, chain_id};

  if (!participants.empty() && !engine.membership()) {
    auto genesis = std::vector<trustee::schema::participant_id_t>{};
    for (const auto& participant : participants) {
      genesis.push_back(trustee::schema::parse_identity(participant));
    }
    auto result = engine.initialize(genesis, threshold);
    if (result.code != 0) {
      spdlog::error("Genesis rejected: {} ({})", result.log, result.info);
      spdlog::shutdown();
      return 1;
    }
    engine.commit();
  } else if (!engine.membership()) {
    spdlog::warn("Wallet has no participants; submit initialize_wallet first");
  }

  auto line = std::string{};
  while (!shutdown_requested() && std::getline(std::cin, line)) {
    auto encoded = trim(line);
    if (encoded.empty()) {
      continue;
    }
    auto raw = trustee::schema::try_from_base64(encoded);
    if (!raw) {
      spdlog::warn("Skipping line that is not base64");
      std::cout << "error: invalid base64" << std::endl;
      continue;
    }

    auto height =
        static_cast<uint64_t>(engine.info().last_block_height) + 1;
    auto block = engine.finalize_block(height, {*raw});
    auto committed = engine.commit();
    for (const auto& tx_result : block.tx_results) {
      std::cout << "height=" << committed.committed_height
                << " code=" << tx_result.code
                << " log=" << (tx_result.log.empty() ? "ok" : tx_result.log)
                << " events=" << tx_result.events.size() << " state_root="
                << trustee::schema::to_hex(trustee::schema::bytes_view_t{
                       committed.state_root.data(),
                       committed.state_root.size()})
                << std::endl;
    }
  }

  spdlog::info("Shutting down at height {}", engine.info().last_block_height);
  spdlog::shutdown();
  return 0;
}
