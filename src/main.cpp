#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <stakehist/schema/primitives.hpp>
#include <stakehist/storage/rocksdb/storage.hpp>
#include <stakehist/sysvar/record_decoder.hpp>
#include <stakehist/sysvar/stake_history_sysvar.hpp>
#include <stakehist/sysvar/sysvar_id.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

namespace {

void init_logging(const bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("stakehist.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "stakehist", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

std::optional<stakehist::schema::bytes_t> read_file(
    const std::filesystem::path& path) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input) {
    return std::nullopt;
  }
  return stakehist::schema::bytes_t{std::istreambuf_iterator<char>{input},
                                    std::istreambuf_iterator<char>{}};
}

int import_account(
    const stakehist::storage::storage<stakehist::storage::rocksdb_storage_tag>&
        storage,
    const std::string& path) {
  auto data = read_file(path);
  if (!data) {
    spdlog::warn("Unable to read stake history data from '{}'", path);
    return 1;
  }
  auto records = stakehist::sysvar::try_parse_record_count(
      stakehist::schema::make_bytes_view(*data));
  if (!records) {
    spdlog::warn("'{}' is not a serialized stake history account", path);
    return 1;
  }
  storage.store(stakehist::sysvar::id(),
                stakehist::schema::make_bytes_view(*data));
  spdlog::info("Imported {} stake history records from '{}'", *records, path);
  return 0;
}

int lookup_entry(
    const stakehist::storage::storage<stakehist::storage::rocksdb_storage_tag>&
        storage,
    const uint64_t current_epoch,
    const uint64_t target_epoch) {
  auto sysvar = stakehist::sysvar::stake_history_sysvar{current_epoch, storage};
  auto result = sysvar.lookup(target_epoch);
  if (!result.entry) {
    std::cout << "epoch " << target_epoch << ": no entry ("
              << stakehist::sysvar::to_string(result) << ")" << std::endl;
    return 1;
  }
  const auto& entry = result.entry;
  std::cout << "epoch " << target_epoch << ": effective=" << entry->effective
            << " activating=" << entry->activating
            << " deactivating=" << entry->deactivating << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto import_path = std::string{};
  auto current_epoch = uint64_t{};
  auto target_epoch = uint64_t{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"stakehist"};
  description.add_options()("help,h", "Show the help message")(
      "db,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "stakehist.db"),
      "RocksDB path holding the sysvar account")(
      "import,i", boost::program_options::value<std::string>(&import_path),
      "Store raw stake history sysvar data read from a file")(
      "current-epoch,c", boost::program_options::value<uint64_t>(&current_epoch),
      "Epoch lookups are resolved against")(
      "target-epoch,t", boost::program_options::value<uint64_t>(&target_epoch),
      "Epoch whose stake history entry is printed")(
      "id", "Print the stake history sysvar id")(
      "size", "Print the largest serialized sysvar size")(
      "verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  init_logging(vm.contains("verbose"));

  if (vm.contains("id")) {
    const auto& id = stakehist::sysvar::id();
    std::cout << stakehist::schema::to_base58(id) << std::endl
              << stakehist::schema::to_hex(id) << std::endl;
  }
  if (vm.contains("size")) {
    std::cout << stakehist::sysvar::size_of() << std::endl;
  }

  auto wants_lookup =
      vm.contains("current-epoch") || vm.contains("target-epoch");
  if (wants_lookup &&
      !(vm.contains("current-epoch") && vm.contains("target-epoch"))) {
    spdlog::warn("--current-epoch and --target-epoch must be given together");
    spdlog::shutdown();
    return 1;
  }

  auto exit_code = 0;
  if (vm.contains("import") || wants_lookup) {
    auto storage =
        stakehist::storage::make_storage<stakehist::storage::rocksdb_storage_tag>(
            db_path);
    if (vm.contains("import")) {
      exit_code = import_account(storage, import_path);
    }
    if (exit_code == 0 && wants_lookup) {
      exit_code = lookup_entry(storage, current_epoch, target_epoch);
    }
  }

  spdlog::shutdown();
  return exit_code;
}
