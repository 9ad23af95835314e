#pragma once

#include <verdict/execution/program.hpp>
#include <verdict/execution/signature_verifier.hpp>
#include <verdict/schema/primitives.hpp>
#include <verdict/schema/slot.hpp>
#include <verdict/schema/sysvars.hpp>
#include <verdict/schema/transaction.hpp>
#include <verdict/schema/transaction_result.hpp>
#include <verdict/storage/memory/storage.hpp>
#include <verdict/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

namespace verdict::execution {

struct engine_config final {
  verdict::schema::rent_t rent{};
  verdict::schema::clock_sysvar_t clock{};
  /// When false, signatures are accepted without verification.
  bool require_strict_crypto{true};
};

/// In-process ledger hosting registered programs over a slot store.
///
/// Transactions execute one at a time under an engine-wide mutex. All slots a
/// transaction names are staged, every instruction runs against the staging
/// map, and the result is written back in one atomic batch only when every
/// instruction and every post-execution check succeeded.
template <typename Library>
class engine final {
 public:
  explicit engine(verdict::storage::storage<Library> storage,
                  engine_config config = {});

  /// Host `instance` under `program_id`. Replaces any earlier registration.
  void register_program(const verdict::schema::pubkey_t& program_id,
                        std::shared_ptr<program> instance);

  /// Verify, execute and commit a transaction. Never throws for request
  /// failures; the outcome is reported in the result code.
  verdict::schema::transaction_result_t process_transaction(
      const verdict::schema::transaction_t& tx);

  /// Decode a SCALE-encoded transaction and process it.
  verdict::schema::transaction_result_t process_transaction(
      const verdict::schema::bytes_view_t& raw_tx);

  /// Committed slot at `key`; a never-created slot reads as the default.
  verdict::schema::slot_t get_slot(const verdict::schema::pubkey_t& key) const;

  /// Mint lamports into `key` outside any transaction (local faucet).
  /// Throws program_error (malformed_input) if the balance would overflow.
  void credit(const verdict::schema::pubkey_t& key,
              verdict::schema::lamports_t lamports);

  void set_rent(const verdict::schema::rent_t& rent);
  void set_clock(const verdict::schema::clock_sysvar_t& clock);
  verdict::schema::rent_t rent() const;
  verdict::schema::clock_sysvar_t clock() const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled or `verifier` is empty.
  void set_signature_verifier(signature_verifier_t verifier);

  /// BLAKE3 digest over every committed slot in key order.
  verdict::schema::hash32_t state_root() const;

  /// Latest committed checkpoint.
  verdict::storage::committed_state info() const;

 private:
  /// Run every instruction against a staging map and commit on success.
  /// Throws program_error for any envelope or program failure.
  void execute(const verdict::schema::transaction_t& tx,
               verdict::schema::transaction_result_t& result);
  void commit(const std::vector<verdict::storage::slot_entry_t>& changed);
  /// Root over the stored slots with `pending` applied on top.
  verdict::schema::hash32_t compute_state_root(
      const std::vector<verdict::storage::slot_entry_t>& pending) const;

  mutable std::mutex mutex_;
  verdict::storage::storage<Library> storage_;
  engine_config config_;
  signature_verifier_t signature_verifier_;
  std::map<verdict::schema::pubkey_t, std::shared_ptr<program>> programs_;
  verdict::storage::committed_state committed_;
};

extern template class engine<verdict::storage::memory_storage_tag>;
extern template class engine<verdict::storage::rocksdb_storage_tag>;

}  // namespace verdict::execution
