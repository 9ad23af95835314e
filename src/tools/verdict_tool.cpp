#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <verdict/address/derive.hpp>
#include <verdict/common/critical.hpp>
#include <verdict/crypto/keypair.hpp>
#include <verdict/execution/engine.hpp>
#include <verdict/program/address_deriver.hpp>
#include <verdict/program/config.hpp>
#include <verdict/program/instruction.hpp>
#include <verdict/program/processor.hpp>
#include <verdict/schema/encoding/fixed/verdict_record.hpp>
#include <verdict/schema/encoding/scale/encoder.hpp>
#include <verdict/schema/encoding/scale/verdict_entry.hpp>
#include <verdict/schema/program_error.hpp>
#include <verdict/storage/rocksdb/storage.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace {

using encoder_t = verdict::schema::encoding::scale_encoder_t;
using engine_t =
    verdict::execution::engine<verdict::storage::rocksdb_storage_tag>;
namespace po = boost::program_options;

void setup_logging(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  // stdout carries command results, so diagnostics go to stderr.
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "verdict", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    verdict::common::critical("missing required option --" + name);
  }
  return vm[name].as<std::string>();
}

verdict::schema::pubkey_t get_pubkey(const po::variables_map& vm,
                                     const std::string& name) {
  auto parsed = verdict::schema::try_parse_pubkey(require(vm, name));
  if (!parsed) {
    verdict::common::critical("--" + name +
                              " must be base58 or 0x-prefixed hex");
  }
  return *parsed;
}

verdict::schema::hash32_t get_hash32(const po::variables_map& vm,
                                     const std::string& name) {
  auto parsed = verdict::schema::try_make_hash32(require(vm, name));
  if (!parsed) {
    verdict::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *parsed;
}

verdict::program::program_config_t make_config(const po::variables_map& vm) {
  auto schema = verdict::schema::from_string(
      vm["schema"].as<std::string>(), verdict::program::kRecordSchemaNames);
  if (!schema) {
    verdict::common::critical("--schema must be fixed|variable");
  }
  auto program_id = get_pubkey(vm, "program-id");
  auto config = *schema == verdict::program::record_schema::fixed
                    ? verdict::program::make_fixed_config(program_id)
                    : verdict::program::make_variable_config(program_id);
  if (vm.contains("domain")) {
    config.domain_tag = vm["domain"].as<std::string>();
  }
  return config;
}

verdict::schema::record_request_t make_record(
    const verdict::program::program_config_t& config,
    const po::variables_map& vm) {
  if (config.schema == verdict::program::record_schema::fixed) {
    auto request = verdict::schema::fixed_record_request{};
    request.subject_hash = get_hash32(vm, "subject");
    if (vm.contains("payload")) {
      auto payload = verdict::schema::try_from_hex(require(vm, "payload"));
      if (!payload || payload->size() != request.payload.size()) {
        verdict::common::critical("--payload must be 7 bytes of hex");
      }
      std::ranges::copy(*payload, std::begin(request.payload));
    }
    auto discriminator = vm["discriminator"].as<uint32_t>();
    if (discriminator > 0xff) {
      verdict::common::critical("--discriminator must fit in one byte");
    }
    request.discriminator = static_cast<uint8_t>(discriminator);
    return request;
  }

  auto args = verdict::schema::store_verdict_args_t{};
  args.token_address = require(vm, "token");
  args.chain = require(vm, "chain");
  args.score = vm["score"].as<uint16_t>();
  args.grade = vm["grade"].as<std::string>();
  auto agents = vm["agents"].as<uint32_t>();
  if (agents > 0xff) {
    verdict::common::critical("--agents must fit in one byte");
  }
  args.agent_count = static_cast<uint8_t>(agents);
  args.tier = vm["tier"].as<std::string>();
  args.scan_hash = get_hash32(vm, "scan-hash");
  return verdict::schema::variable_record_request{.args = std::move(args)};
}

void print_slot(const verdict::schema::slot_t& slot) {
  std::cout << "lamports " << slot.lamports << '\n'
            << "owner " << verdict::schema::to_base58(slot.owner) << '\n'
            << "size " << slot.data.size() << '\n'
            << "data " << verdict::schema::to_hex(slot.data) << '\n';
}

void print_record(const verdict::schema::bytes_view_t& data) {
  if (auto record = verdict::schema::encoding::fixed::try_read(data)) {
    std::cout << "bump " << static_cast<uint32_t>(record->bump) << '\n'
              << "subject " << verdict::schema::to_hex(record->subject_hash)
              << '\n'
              << "payload " << verdict::schema::to_hex(record->payload) << '\n'
              << "discriminator "
              << static_cast<uint32_t>(record->discriminator) << '\n'
              << "authority " << verdict::schema::to_base58(record->authority)
              << '\n';
    return;
  }
  if (auto entry =
          verdict::schema::encoding::scale::try_decode_verdict_entry(data)) {
    std::cout << "bump " << static_cast<uint32_t>(entry->bump) << '\n'
              << "token " << entry->token_address << '\n'
              << "chain " << entry->chain << '\n'
              << "score " << entry->score << '\n'
              << "grade " << entry->grade << '\n'
              << "agents " << static_cast<uint32_t>(entry->agent_count) << '\n'
              << "tier " << entry->tier << '\n'
              << "timestamp " << entry->timestamp << '\n'
              << "scan_hash " << verdict::schema::to_hex(entry->scan_hash)
              << '\n'
              << "authority " << verdict::schema::to_base58(entry->authority)
              << '\n';
    return;
  }
  verdict::common::critical("bytes are neither a fixed record nor an entry");
}

int run_register(const po::variables_map& vm) {
  auto config = make_config(vm);
  auto record = make_record(config, vm);

  auto seed = get_hash32(vm, "seed");
  auto signer = verdict::crypto::make_keypair(seed);

  auto storage =
      verdict::storage::make_storage<verdict::storage::rocksdb_storage_tag>(
          require(vm, "db"));
  auto engine = engine_t{storage};
  engine.register_program(
      config.program_id, std::make_shared<verdict::program::processor>(config));

  if (auto airdrop = vm["airdrop"].as<uint64_t>(); airdrop > 0) {
    engine.credit(signer.public_key, airdrop);
  }
  auto now = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch());
  engine.set_clock(verdict::schema::clock_sysvar_t{
      .slot = engine.info().height,
      .unix_timestamp = static_cast<int64_t>(now.count())});

  auto tx = verdict::schema::transaction_t{};
  tx.message.recent_blockhash = engine.state_root();
  tx.message.instructions.push_back(verdict::program::make_register_instruction(
      config, signer.public_key, record));
  auto message = encoder_t{}.encode(tx.message);
  tx.signatures.push_back(verdict::schema::signature_entry_t{
      .signer = signer.public_key,
      .signature = verdict::crypto::sign(
          signer, verdict::schema::make_bytes_view(message))});

  auto result = engine.process_transaction(tx);
  auto target = tx.message.instructions.front().accounts[1].key;
  std::cout << "code " << result.code << ' ' << result.log << '\n'
            << "address " << verdict::schema::to_base58(target) << '\n';
  for (const auto& line : result.logs) {
    std::cout << "log " << line << '\n';
  }
  return result.code == 0 ? 0 : 1;
}

int run_inspect(const po::variables_map& vm) {
  auto storage =
      verdict::storage::make_storage<verdict::storage::rocksdb_storage_tag>(
          require(vm, "db"));
  auto address = get_pubkey(vm, "address");
  auto slot = storage.load_slot(address);
  if (!slot) {
    std::cout << "missing " << verdict::schema::to_base58(address) << '\n';
    return 1;
  }
  print_slot(*slot);
  if (!slot->data.empty()) {
    print_record(verdict::schema::make_bytes_view(slot->data));
  }
  return 0;
}

int dispatch(const std::string& command, const po::variables_map& vm) {
  if (command == "derive") {
    auto config = make_config(vm);
    auto derivation =
        verdict::program::derive_address(config, make_record(config, vm));
    std::cout << "address "
              << verdict::schema::to_base58(derivation.derived.address)
              << '\n'
              << "hex " << verdict::schema::to_hex(derivation.derived.address)
              << '\n'
              << "bump " << static_cast<uint32_t>(derivation.derived.bump)
              << '\n';
    return 0;
  }
  if (command == "instruction") {
    auto config = make_config(vm);
    auto data = verdict::program::make_request_data(make_record(config, vm));
    std::cout << verdict::schema::to_hex(data) << '\n';
    return 0;
  }
  if (command == "decode") {
    auto bytes = verdict::schema::try_from_hex(require(vm, "record"));
    if (!bytes) {
      verdict::common::critical("--record must be hex");
    }
    print_record(verdict::schema::make_bytes_view(*bytes));
    return 0;
  }
  if (command == "register") {
    return run_register(vm);
  }
  if (command == "inspect") {
    return run_inspect(vm);
  }
  verdict::common::critical(
      "command must be derive|instruction|decode|register|inspect");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  verdict-tool derive [options]\n"
            << "  verdict-tool instruction [options]\n"
            << "  verdict-tool decode --record <hex>\n"
            << "  verdict-tool register [options]\n"
            << "  verdict-tool inspect --db <path> --address <key>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"verdict-tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "derive|instruction|decode|register|inspect")(
      "verbose,v", "enable debug logging")(
      "log-file", po::value<std::string>()->default_value("verdict-tool.log"),
      "log file path")("schema",
                       po::value<std::string>()->default_value("fixed"),
                       "fixed|variable")(
      "program-id", po::value<std::string>(), "program identity")(
      "domain", po::value<std::string>(), "override the domain tag")(
      "subject", po::value<std::string>(), "subject hash, 32 bytes hex")(
      "payload", po::value<std::string>(), "opaque payload, 7 bytes hex")(
      "discriminator", po::value<uint32_t>()->default_value(0),
      "discriminator byte")("token", po::value<std::string>(),
                            "token address")(
      "chain", po::value<std::string>(), "chain name")(
      "score", po::value<uint16_t>()->default_value(0), "score 0..1000")(
      "grade", po::value<std::string>()->default_value(""), "grade")(
      "agents", po::value<uint32_t>()->default_value(0), "agent count")(
      "tier", po::value<std::string>()->default_value(""), "tier")(
      "scan-hash", po::value<std::string>(), "scan hash, 32 bytes hex")(
      "record", po::value<std::string>(), "slot data hex")(
      "db", po::value<std::string>(), "RocksDB ledger path")(
      "seed", po::value<std::string>(), "caller ed25519 seed, 32 bytes hex")(
      "airdrop", po::value<uint64_t>()->default_value(0),
      "lamports to credit the caller first")("address",
                                             po::value<std::string>(),
                                             "slot address");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  setup_logging(vm["log-file"].as<std::string>(), vm.contains("verbose"));

  auto status = 0;
  try {
    status = dispatch(command, vm);
  } catch (const verdict::schema::program_error& error) {
    std::cout << "error " << verdict::schema::error_name(error.code()) << '\n';
    spdlog::error("{}", error.what());
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
