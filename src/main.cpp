#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <refuge/access/policy.hpp>
#include <refuge/execution/engine.hpp>
#include <refuge/schema/aid_category.hpp>
#include <refuge/schema/aid_status.hpp>
#include <refuge/storage/rocksdb/storage.hpp>

#include <charconv>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace {

namespace po = boost::program_options;
using ledger_t =
    refuge::execution::engine<refuge::storage::rocksdb_storage_tag>;

std::optional<uint64_t> parse_u64(std::string_view text) {
  auto value = uint64_t{};
  auto [end, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::pair<uint64_t, uint64_t>> parse_range(
    std::string_view text) {
  auto colon = text.find(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  auto from = parse_u64(text.substr(0, colon));
  auto to = parse_u64(text.substr(colon + 1));
  if (!from || !to) {
    return std::nullopt;
  }
  return std::pair{*from, *to};
}

void print_record(const refuge::schema::aid_record_t& record) {
  std::cout << "record " << record.id << '\n'
            << "  status:    " << refuge::schema::to_string(record.status)
            << '\n'
            << "  category:  " << refuge::schema::to_string(record.category)
            << '\n'
            << "  location:  " << record.location << '\n'
            << "  amount:    " << record.amount << '\n'
            << "  needs:    ";
  for (const auto& need : record.needs) {
    std::cout << ' ' << need;
  }
  std::cout << '\n'
            << "  timestamp: " << record.timestamp << '\n'
            << "  identity:  "
            << refuge::schema::to_hex(record.encrypted_identity) << '\n';
}

int list_records(const ledger_t& ledger, const po::variables_map& vm) {
  auto filter = refuge::schema::record_filter_t{};
  if (vm.contains("status")) {
    filter.status = refuge::schema::try_from_string<refuge::schema::aid_status_t>(
        vm["status"].as<std::string>());
    if (!filter.status) {
      spdlog::error("Unknown status '{}'", vm["status"].as<std::string>());
      return 2;
    }
  }
  if (vm.contains("category")) {
    filter.category =
        refuge::schema::try_from_string<refuge::schema::aid_category_t>(
            vm["category"].as<std::string>());
    if (!filter.category) {
      spdlog::error("Unknown category '{}'", vm["category"].as<std::string>());
      return 2;
    }
  }
  if (vm.contains("search")) {
    filter.search = vm["search"].as<std::string>();
  }
  for (const auto& record : ledger.list_records(filter)) {
    std::cout << record.id << '\t' << refuge::schema::to_string(record.status)
              << '\t' << refuge::schema::to_string(record.category) << '\t'
              << record.location << '\t' << record.amount << '\n';
  }
  return 0;
}

int show_stats(const ledger_t& ledger) {
  auto stats = ledger.stats();
  auto info = ledger.info();
  std::cout << "records:       " << stats.total << '\n'
            << "  pending:     " << stats.pending << '\n'
            << "  approved:    " << stats.approved << '\n'
            << "  distributed: " << stats.distributed << '\n'
            << "  rejected:    " << stats.rejected << '\n'
            << "aid requested: " << stats.total_amount << '\n'
            << "packages:      " << stats.packages << '\n'
            << "verifications: " << stats.verifications << '\n'
            << "outstanding:   " << stats.outstanding_requests << '\n'
            << "events:        " << info.event_count << '\n'
            << "chain head:    " << refuge::schema::to_hex(info.chain_head)
            << '\n';
  return 0;
}

int show_events(const ledger_t& ledger, std::string_view range_text) {
  auto range = parse_range(range_text);
  if (!range) {
    spdlog::error("Expected --events <from>:<to>, got '{}'", range_text);
    return 2;
  }
  for (const auto& event : ledger.events(range->first, range->second)) {
    std::cout << event.event_id << '\t' << refuge::schema::to_string(event.type)
              << '\t' << event.entity_id << '\t' << event.recorded_at << '\t'
              << refuge::schema::to_hex(event.hash) << '\n';
  }
  if (auto broken = ledger.verify_event_chain()) {
    spdlog::warn("Event chain breaks at event {}", *broken);
    return 1;
  }
  return 0;
}

int show_pending(const ledger_t& ledger) {
  for (const auto& entry : ledger.outstanding_requests()) {
    std::cout << entry.request_id << '\t'
              << refuge::schema::to_string(entry.target_kind) << '\t'
              << entry.target_id << '\t' << entry.submitted_at << '\n';
  }
  return 0;
}

int report_index(const refuge::ledger::index_report_t& report) {
  std::cout << "records:       " << report.records << '\n'
            << "index entries: " << report.index_entries << '\n'
            << "orphans:       " << report.orphans.size() << '\n'
            << "unindexed:     " << report.unindexed.size() << '\n';
  return report.consistent() ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto config_path = std::string{};
  auto log_file = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Refuge"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d", po::value<std::string>(&db_path)->default_value("refuge.db"),
      "RocksDB directory holding the ledger")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with any of these options")(
      "log-file,l", po::value<std::string>(&log_file)->default_value("refuge.log"),
      "Log file path")("verbose,v", "Enable debug logging")(
      "list", "List records, newest first")(
      "status", po::value<std::string>(), "Only list records with this status")(
      "category", po::value<std::string>(),
      "Only list records in this category")(
      "search", po::value<std::string>(),
      "Only list records matching this term")(
      "show", po::value<uint64_t>(), "Show one record")(
      "stats", "Show ledger statistics")(
      "events", po::value<std::string>(),
      "Show events <from>:<to> and check the hash chain")(
      "pending", "Show outstanding decryption requests")(
      "check-index", "Compare the record index with stored records")(
      "rebuild-index", "Rebuild the record index from stored records");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto config = std::ifstream{vm["config"].as<std::string>()};
      if (!config) {
        std::cerr << "Cannot open config file " << vm["config"].as<std::string>()
                  << std::endl;
        return 2;
      }
      po::store(po::parse_config_file(config, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "refuge", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto storage =
      refuge::storage::make_storage<refuge::storage::rocksdb_storage_tag>(
          db_path);
  // Inspection only: no decryption capabilities and no gated operations.
  // The index is left as found; only --rebuild-index writes.
  auto collaborators = refuge::execution::collaborators_t{};
  collaborators.repair_index_on_open = false;
  auto ledger = ledger_t{storage, std::move(collaborators)};

  auto status = 0;
  if (vm.contains("list")) {
    status = list_records(ledger, vm);
  } else if (vm.contains("show")) {
    auto id = vm["show"].as<uint64_t>();
    if (auto record = ledger.get_record(id)) {
      print_record(*record);
    } else {
      spdlog::error("Record {} not found", id);
      status = 1;
    }
  } else if (vm.contains("stats")) {
    status = show_stats(ledger);
  } else if (vm.contains("events")) {
    status = show_events(ledger, vm["events"].as<std::string>());
  } else if (vm.contains("pending")) {
    status = show_pending(ledger);
  } else if (vm.contains("check-index")) {
    status = report_index(ledger.check_index());
  } else if (vm.contains("rebuild-index")) {
    report_index(ledger.rebuild_index());
    status = report_index(ledger.check_index());
  } else {
    std::cout << description << std::endl;
  }

  spdlog::shutdown();
  return status;
}
