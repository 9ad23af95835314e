#include <verdict/blake3/hash.hpp>
#include <verdict/common/critical.hpp>
#include <verdict/crypto/verify.hpp>
#include <verdict/execution/engine.hpp>
#include <verdict/execution/invoke_context.hpp>
#include <verdict/schema/encoding/scale/encoder.hpp>
#include <verdict/schema/program_error.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <set>
#include <string_view>
#include <utility>

using namespace verdict::schema;

namespace {

using encoder_t = verdict::schema::encoding::scale_encoder_t;

inline constexpr auto kCodespace = std::string_view{"verdict.execute"};

bool is_writable(const std::vector<account_meta_t>& accounts,
                 const pubkey_t& key) {
  return std::ranges::any_of(accounts, [&](const auto& account) {
    return account.key == key && account.is_writable;
  });
}

// Compare what the program left in staging with what it was entitled to
// find. Native create_slot effects are already folded into `baseline`.
void check_instruction_effects(const pubkey_t& program_id,
                               const std::vector<account_meta_t>& accounts,
                               const verdict::execution::slot_map_t& baseline,
                               const verdict::execution::slot_map_t& staged) {
  auto before = lamports_t{};
  auto after = lamports_t{};
  for (const auto& [key, expected] : baseline) {
    const auto& current = staged.at(key);
    before += expected.lamports;
    after += current.lamports;
    if (current == expected) {
      continue;
    }
    if (!is_writable(accounts, key)) {
      throw program_error{error_code::external_slot_modified,
                          fmt::format("read-only slot {} was modified",
                                      to_base58(key))};
    }
    auto owned = expected.owner == program_id;
    if (!owned && (current.data != expected.data ||
                   current.owner != expected.owner ||
                   current.lamports < expected.lamports)) {
      throw program_error{error_code::external_slot_modified,
                          fmt::format("slot {} is owned by {}", to_base58(key),
                                      to_base58(expected.owner))};
    }
  }
  if (before != after) {
    throw program_error{error_code::unbalanced_transaction,
                        fmt::format("lamports before {} after {}", before,
                                    after)};
  }
}

}  // namespace

namespace verdict::execution {

template <typename Library>
engine<Library>::engine(verdict::storage::storage<Library> storage,
                        engine_config config)
    : storage_{std::move(storage)}, config_{config} {
  auto lock = std::scoped_lock{mutex_};
  if (config_.require_strict_crypto) {
    if (!verdict::crypto::available()) {
      verdict::common::critical(
          "ed25519 verification is unavailable in strict crypto mode");
    }
    signature_verifier_ = &verdict::crypto::verify_signature;
  } else {
    spdlog::warn("Strict crypto disabled; signatures are not verified");
  }

  if (auto committed = storage_.load_committed_state()) {
    committed_ = *committed;
  } else {
    committed_.state_root = compute_state_root({});
    storage_.save_committed_state(committed_);
  }
  spdlog::info("Execution engine ready at height {} with state root {}",
               committed_.height, to_hex(committed_.state_root));
}

template <typename Library>
void engine<Library>::register_program(const pubkey_t& program_id,
                                       std::shared_ptr<program> instance) {
  if (program_id == kSystemProgramId) {
    verdict::common::critical("the system program identity is reserved");
  }
  auto lock = std::scoped_lock{mutex_};
  programs_.insert_or_assign(program_id, std::move(instance));
  spdlog::info("Registered program {}", to_base58(program_id));
}

template <typename Library>
transaction_result_t engine<Library>::process_transaction(
    const transaction_t& tx) {
  auto lock = std::scoped_lock{mutex_};
  auto result = transaction_result_t{};
  result.codespace = std::string{kCodespace};
  try {
    execute(tx, result);
  } catch (const program_error& error) {
    spdlog::warn("Transaction rejected: {}", error.what());
    result.code = to_code(error.code());
    result.log = std::string{error_name(error.code())};
    result.info = error.what();
    result.created_slots.clear();
  }
  return result;
}

template <typename Library>
transaction_result_t engine<Library>::process_transaction(
    const bytes_view_t& raw_tx) {
  auto encoder = encoder_t{};
  auto tx = std::optional<transaction_t>{};
  if (!raw_tx.empty()) {
    tx = encoder.try_decode<transaction_t>(raw_tx);
  }
  if (!tx) {
    auto result = transaction_result_t{};
    result.code = to_code(error_code::invalid_transaction);
    result.log = std::string{error_name(error_code::invalid_transaction)};
    result.info = "undecodable transaction";
    result.codespace = std::string{kCodespace};
    return result;
  }
  return process_transaction(*tx);
}

template <typename Library>
void engine<Library>::execute(const transaction_t& tx,
                              transaction_result_t& result) {
  if (tx.message.version != 1) {
    throw program_error{
        error_code::unsupported_transaction_version,
        fmt::format("expected version 1, got {}", tx.message.version)};
  }
  if (tx.message.instructions.empty()) {
    throw program_error{error_code::invalid_transaction, "no instructions"};
  }

  auto signers = std::set<pubkey_t>{};
  auto encoder = encoder_t{};
  auto message = encoder.encode(tx.message);
  for (const auto& entry : tx.signatures) {
    if (config_.require_strict_crypto &&
        !signature_verifier_(make_bytes_view(message), entry.signer,
                             entry.signature)) {
      throw program_error{error_code::signature_verification_failed,
                          fmt::format("bad signature from {}",
                                      to_base58(entry.signer))};
    }
    signers.insert(entry.signer);
  }

  auto loaded = slot_map_t{};
  for (const auto& instruction : tx.message.instructions) {
    for (const auto& account : instruction.accounts) {
      if (!loaded.contains(account.key)) {
        loaded.emplace(account.key,
                       storage_.load_slot(account.key).value_or(slot_t{}));
      }
    }
  }
  auto staged = loaded;

  for (const auto& instruction : tx.message.instructions) {
    auto found = programs_.find(instruction.program_id);
    if (found == std::end(programs_)) {
      throw program_error{error_code::unknown_program,
                          to_base58(instruction.program_id)};
    }

    auto accounts = instruction.accounts;
    for (auto& account : accounts) {
      account.is_signer = account.is_signer && signers.contains(account.key);
    }

    auto context = invoke_context{instruction.program_id, accounts, staged,
                                  config_.rent, config_.clock};
    try {
      found->second->process(context, make_bytes_view(instruction.data));
    } catch (const program_error&) {
      result.logs.insert(std::end(result.logs), std::begin(context.logs()),
                         std::end(context.logs()));
      throw;
    }
    result.logs.insert(std::end(result.logs), std::begin(context.logs()),
                       std::end(context.logs()));
    result.created_slots.insert(std::end(result.created_slots),
                                std::begin(context.created_slots()),
                                std::end(context.created_slots()));
    check_instruction_effects(instruction.program_id, accounts,
                              context.baseline(), staged);
  }

  auto changed = std::vector<verdict::storage::slot_entry_t>{};
  for (const auto& [key, slot] : staged) {
    if (loaded.at(key) != slot) {
      changed.emplace_back(key, slot);
    }
  }
  commit(changed);

  result.code = 0;
  result.log = "ok";
  result.info = fmt::format("{} instruction(s), {} slot(s) written",
                            tx.message.instructions.size(), changed.size());
  spdlog::debug("Transaction committed at height {}", committed_.height);
}

template <typename Library>
slot_t engine<Library>::get_slot(const pubkey_t& key) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.load_slot(key).value_or(slot_t{});
}

template <typename Library>
void engine<Library>::credit(const pubkey_t& key, const lamports_t lamports) {
  auto lock = std::scoped_lock{mutex_};
  auto slot = storage_.load_slot(key).value_or(slot_t{});
  if (lamports > std::numeric_limits<lamports_t>::max() - slot.lamports) {
    throw program_error{error_code::malformed_input,
                        fmt::format("credit of {} lamports overflows {}",
                                    lamports, to_base58(key))};
  }
  slot.lamports += lamports;
  commit(std::vector<verdict::storage::slot_entry_t>{{key, slot}});
  spdlog::info("Credited {} lamports to {}", lamports, to_base58(key));
}

template <typename Library>
void engine<Library>::set_rent(const rent_t& rent) {
  auto lock = std::scoped_lock{mutex_};
  config_.rent = rent;
}

template <typename Library>
void engine<Library>::set_clock(const clock_sysvar_t& clock) {
  auto lock = std::scoped_lock{mutex_};
  config_.clock = clock;
}

template <typename Library>
rent_t engine<Library>::rent() const {
  auto lock = std::scoped_lock{mutex_};
  return config_.rent;
}

template <typename Library>
clock_sysvar_t engine<Library>::clock() const {
  auto lock = std::scoped_lock{mutex_};
  return config_.clock;
}

template <typename Library>
void engine<Library>::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!config_.require_strict_crypto) {
    spdlog::warn("Ignoring signature verifier: strict crypto is disabled");
    return;
  }
  if (!verifier) {
    spdlog::warn("Ignoring empty signature verifier");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

template <typename Library>
hash32_t engine<Library>::state_root() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_.state_root;
}

template <typename Library>
verdict::storage::committed_state engine<Library>::info() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_;
}

template <typename Library>
void engine<Library>::commit(
    const std::vector<verdict::storage::slot_entry_t>& changed) {
  auto next = committed_;
  next.height += 1;
  next.state_root = compute_state_root(changed);
  storage_.commit(changed, next);
  committed_ = next;
}

template <typename Library>
hash32_t engine<Library>::compute_state_root(
    const std::vector<verdict::storage::slot_entry_t>& pending) const {
  auto slots = std::map<pubkey_t, slot_t>{};
  for (auto& [key, slot] : storage_.list_slots()) {
    slots.insert_or_assign(key, std::move(slot));
  }
  for (const auto& [key, slot] : pending) {
    slots.insert_or_assign(key, slot);
  }

  auto encoder = encoder_t{};
  auto hasher = verdict::blake3::hasher{};
  for (const auto& [key, slot] : slots) {
    auto encoded = encoder.encode(slot);
    hasher.update(key).update(make_bytes_view(encoded));
  }
  return hasher.finalize();
}

template class engine<verdict::storage::memory_storage_tag>;
template class engine<verdict::storage::rocksdb_storage_tag>;

}  // namespace verdict::execution
