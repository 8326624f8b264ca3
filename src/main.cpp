#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <prizepool/common/critical.hpp>
#include <prizepool/execution/engine.hpp>
#include <prizepool/execution/transfer_outbox.hpp>
#include <prizepool/schema/encoding/scale/encoder.hpp>
#include <prizepool/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

using encoder_t = prizepool::schema::encoding::encoder<
    prizepool::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string hex(const prizepool::schema::hash32_t& value) {
  return prizepool::schema::to_hex(
      prizepool::schema::bytes_view_t{value.data(), value.size()});
}

prizepool::schema::hash32_t get_hash32(const po::variables_map& vm,
                                       const std::string& name) {
  if (!vm.contains(name)) {
    prizepool::common::critical("missing required --" + name);
  }
  auto parsed = prizepool::schema::try_make_hash32(vm[name].as<std::string>());
  if (!parsed.has_value()) {
    prizepool::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *parsed;
}

prizepool::schema::amount_t get_amount(const po::variables_map& vm,
                                       const std::string& name) {
  if (!vm.contains(name)) {
    return prizepool::schema::amount_t{0};
  }
  auto parsed =
      prizepool::schema::try_parse_amount(vm[name].as<std::string>());
  if (!parsed.has_value()) {
    prizepool::common::critical("--" + name + " must be a decimal amount");
  }
  return *parsed;
}

prizepool::schema::vault_id_t get_vault_id(const po::variables_map& vm) {
  if (!vm.contains("vault-id")) {
    prizepool::common::critical("missing required --vault-id");
  }
  return vm["vault-id"].as<uint64_t>();
}

prizepool::schema::asset_ref_t get_asset(const po::variables_map& vm) {
  auto kind = prizepool::schema::try_from_string<prizepool::schema::asset_kind_t>(
      vm["asset"].as<std::string>());
  if (!kind.has_value()) {
    prizepool::common::critical("--asset must be native|token");
  }
  if (*kind == prizepool::schema::asset_kind_t::native) {
    return prizepool::schema::make_native_asset();
  }
  return prizepool::schema::make_token_asset(get_hash32(vm, "contract"));
}

spdlog::level::level_enum get_log_level(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    prizepool::common::critical("unknown --log-level " + name);
  }
  return level;
}

int print_result(const prizepool::schema::transaction_result_t& result) {
  std::cout << "code: " << result.code << std::endl;
  if (!result.log.empty()) {
    std::cout << "log: " << result.codespace << ": " << result.log
              << std::endl;
  }
  for (const auto& event : result.events) {
    std::cout << "event: " << prizepool::schema::to_string(event.type);
    for (const auto& attribute : event.attributes) {
      std::cout << " " << attribute.key << "=" << attribute.value;
    }
    std::cout << std::endl;
  }
  return result.code == 0 ? 0 : 1;
}

int run_command(const std::string& command,
                const po::variables_map& vm,
                prizepool::execution::engine& engine,
                prizepool::execution::transfer_outbox& outbox) {
  auto encoder = encoder_t{};
  if (command == "create") {
    auto result = engine.create_vault(
        get_hash32(vm, "signer"),
        prizepool::schema::create_vault_t{
            .name = prizepool::schema::make_bytes(vm["name"].as<std::string>()),
            .asset = get_asset(vm),
            .duration = vm["duration"].as<uint64_t>(),
            .interest_rate_bps = vm["rate-bps"].as<uint32_t>()});
    if (result.code == 0) {
      std::cout << "vault_id: "
                << encoder.decode<prizepool::schema::vault_id_t>(
                       prizepool::schema::make_bytes_view(result.data))
                << std::endl;
    }
    return print_result(result);
  }
  if (command == "deposit") {
    return print_result(engine.deposit(
        get_hash32(vm, "signer"), get_amount(vm, "attached"),
        prizepool::schema::deposit_t{.vault_id = get_vault_id(vm),
                                     .amount = get_amount(vm, "amount")}));
  }
  if (command == "withdraw") {
    auto result =
        engine.withdraw(get_hash32(vm, "signer"),
                        prizepool::schema::withdraw_t{.vault_id = get_vault_id(vm)});
    if (result.code == 0) {
      std::cout << "paid: "
                << prizepool::schema::to_string(
                       encoder.decode<prizepool::schema::amount_t>(
                           prizepool::schema::make_bytes_view(result.data)))
                << std::endl;
    }
    return print_result(result);
  }
  if (command == "delete") {
    return print_result(engine.delete_vault(
        get_hash32(vm, "signer"),
        prizepool::schema::delete_vault_t{.vault_id = get_vault_id(vm)}));
  }
  if (command == "settle") {
    return print_result(engine.select_winner(
        get_hash32(vm, "signer"),
        prizepool::schema::select_winner_t{.vault_id = get_vault_id(vm)}));
  }
  if (command == "fund") {
    return print_result(engine.fund_reserve(
        get_hash32(vm, "signer"), get_amount(vm, "attached"),
        prizepool::schema::fund_reserve_t{.asset = get_asset(vm),
                                          .amount = get_amount(vm, "amount")}));
  }
  if (command == "set-admin") {
    return print_result(engine.set_admin(
        get_hash32(vm, "signer"),
        prizepool::schema::set_admin_t{.admin = get_hash32(vm, "admin")}));
  }
  if (command == "summary") {
    auto summary = engine.vault_summary(get_vault_id(vm));
    if (!summary.has_value()) {
      std::cout << "vault not found" << std::endl;
      return 1;
    }
    std::cout << "vault_id: " << summary->vault_id << std::endl
              << "name: " << prizepool::schema::make_string(summary->name)
              << std::endl
              << "asset: " << prizepool::schema::to_string(summary->asset.kind)
              << std::endl
              << "interest_rate_bps: " << summary->interest_rate_bps
              << std::endl
              << "created_at: " << summary->created_at << std::endl
              << "duration: " << summary->duration << std::endl
              << "time_left: " << summary->time_left << std::endl
              << "total_principal: "
              << prizepool::schema::to_string(summary->total_principal)
              << std::endl
              << "depositors: " << summary->depositor_count << std::endl
              << "active: " << std::boolalpha << summary->active << std::endl
              << "winner_selected: " << summary->winner_selected << std::endl;
    return 0;
  }
  if (command == "balance") {
    auto balance =
        engine.depositor_balance(get_vault_id(vm), get_hash32(vm, "account"));
    if (!balance.has_value()) {
      std::cout << "vault not found" << std::endl;
      return 1;
    }
    std::cout << "principal: "
              << prizepool::schema::to_string(balance->principal) << std::endl
              << "accrued_interest: "
              << prizepool::schema::to_string(balance->accrued_interest)
              << std::endl
              << "claimable: "
              << prizepool::schema::to_string(balance->claimable) << std::endl;
    return 0;
  }
  if (command == "depositors") {
    auto accounts = engine.list_depositors(get_vault_id(vm));
    if (!accounts.has_value()) {
      std::cout << "vault not found" << std::endl;
      return 1;
    }
    for (const auto& account : *accounts) {
      std::cout << hex(account) << std::endl;
    }
    return 0;
  }
  if (command == "winner") {
    auto info = engine.winner(get_vault_id(vm));
    if (!info.has_value()) {
      std::cout << "winner not selected yet" << std::endl;
      return 1;
    }
    std::cout << "winner: " << hex(info->winner) << std::endl
              << "total_interest: "
              << prizepool::schema::to_string(info->total_interest)
              << std::endl;
    return 0;
  }
  if (command == "reserve") {
    std::cout << "reserve: "
              << prizepool::schema::to_string(engine.reserve(get_asset(vm)))
              << std::endl;
    return 0;
  }
  if (command == "events") {
    for (const auto& record : engine.events(vm["from"].as<uint64_t>(),
                                            vm["to"].as<uint64_t>())) {
      std::cout << record.event_id << " " << record.recorded_at << " "
                << prizepool::schema::to_string(record.event.type);
      for (const auto& attribute : record.event.attributes) {
        std::cout << " " << attribute.key << "=" << attribute.value;
      }
      std::cout << std::endl;
    }
    return 0;
  }
  if (command == "transfers") {
    for (const auto& [sequence, request] : outbox.list()) {
      std::cout << sequence << " " << prizepool::schema::to_string(request.direction)
                << " vault=" << request.vault_id
                << " account=" << hex(request.account)
                << " asset=" << prizepool::schema::to_string(request.asset.kind)
                << " amount=" << prizepool::schema::to_string(request.amount)
                << std::endl;
    }
    return 0;
  }
  std::cerr << "unknown command '" << command << "'" << std::endl;
  return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto config_path = std::string{};
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};

  auto vm = po::variables_map{};
  auto general = po::options_description{"Prize pool"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI-style file with default option values");

  auto settings = po::options_description{"Settings"};
  settings.add_options()(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("prizepool.db"),
      "RocksDB directory")(
      "genesis-owner", po::value<std::string>(),
      "Owner recorded when the database is created (32-byte hex)")(
      "log-level",
      po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file",
      po::value<std::string>(&log_file)->default_value("prizepool.log"),
      "Log file path");

  auto arguments = po::options_description{"Command arguments"};
  arguments.add_options()(
      "command", po::value<std::string>(&command),
      "create|deposit|withdraw|delete|fund|set-admin|settle|summary|balance|"
      "depositors|winner|reserve|events|transfers")(
      "signer,s", po::value<std::string>(), "Caller account (32-byte hex)")(
      "account", po::value<std::string>(), "Queried account (32-byte hex)")(
      "admin", po::value<std::string>(), "New administrator (32-byte hex)")(
      "vault-id,v", po::value<uint64_t>(), "Vault id")(
      "name", po::value<std::string>()->default_value(""), "Vault name")(
      "asset", po::value<std::string>()->default_value("native"),
      "native|token")("contract", po::value<std::string>(),
                      "Token contract (32-byte hex)")(
      "duration", po::value<uint64_t>()->default_value(0),
      "Vault duration in seconds")(
      "rate-bps", po::value<uint32_t>()->default_value(0),
      "Annual interest rate in basis points")(
      "amount", po::value<std::string>(), "Decimal amount")(
      "attached", po::value<std::string>(),
      "Decimal native value attached to the call")(
      "from", po::value<uint64_t>()->default_value(1), "First event id")(
      "to", po::value<uint64_t>()->default_value(UINT64_MAX), "Last event id");

  auto description = po::options_description{};
  description.add(general).add(settings).add(arguments);
  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  po::store(po::command_line_parser(argc, argv)
                .options(description)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    po::store(po::parse_config_file(vm["config"].as<std::string>().c_str(),
                                    settings),
              vm);
  }
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    return command.empty() && !vm.contains("help") ? 2 : 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "prizepool", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(get_log_level(log_level));

  auto options = prizepool::execution::engine_options{};
  if (vm.contains("genesis-owner")) {
    options.genesis_owner = get_hash32(vm, "genesis-owner");
  }

  auto encoder = encoder_t{};
  auto storage = prizepool::storage::make_storage<
      prizepool::storage::rocksdb_storage_tag>(db_path);
  auto engine = prizepool::execution::engine{encoder, storage, options};
  auto outbox = prizepool::execution::transfer_outbox{encoder, storage};
  engine.set_asset_transfer(outbox.hook());

  auto status = run_command(command, vm, engine, outbox);
  spdlog::shutdown();
  return status;
}
