#pragma once

#include <verdict/address/derive.hpp>
#include <verdict/execution/system_program.hpp>
#include <verdict/schema/primitives.hpp>
#include <verdict/schema/slot.hpp>
#include <verdict/schema/sysvars.hpp>
#include <verdict/schema/transaction.hpp>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace verdict::execution {

using slot_map_t = std::map<verdict::schema::pubkey_t, verdict::schema::slot_t>;

/// Everything one instruction may see and touch while it runs.
///
/// Slots live in the transaction's staging map; `baseline()` records their
/// state as the program is entitled to find it, i.e. at entry and after each
/// native create_slot call. The engine compares staging against that baseline
/// once the program returns.
class invoke_context final {
 public:
  invoke_context(const verdict::schema::pubkey_t& program_id,
                 std::vector<verdict::schema::account_meta_t> accounts,
                 slot_map_t& staged,
                 const verdict::schema::rent_t& rent,
                 const verdict::schema::clock_sysvar_t& clock);

  const verdict::schema::pubkey_t& program_id() const { return program_id_; }

  /// Participating identities in request order. `is_signer` is only set for
  /// keys whose signature the engine verified.
  const std::vector<verdict::schema::account_meta_t>& accounts() const {
    return accounts_;
  }

  bool is_signer(const verdict::schema::pubkey_t& key) const;

  /// Staged slot for a participating identity. Throws
  /// program_error(malformed_input) for keys the request did not list.
  const verdict::schema::slot_t& slot(
      const verdict::schema::pubkey_t& key) const;
  verdict::schema::slot_t& mutable_slot(const verdict::schema::pubkey_t& key);

  const verdict::schema::rent_t& rent() const { return rent_; }
  const verdict::schema::clock_sysvar_t& clock() const { return clock_; }

  void log(std::string message);

  /// Invoke the native slot-creation service on behalf of this program.
  void create_slot(
      const system_program::create_slot_request_t& request,
      std::span<const verdict::address::derivation_proof_t> proofs);

  const slot_map_t& baseline() const { return baseline_; }
  const std::vector<std::string>& logs() const { return logs_; }
  const std::vector<verdict::schema::pubkey_t>& created_slots() const {
    return created_slots_;
  }

 private:
  bool is_listed(const verdict::schema::pubkey_t& key) const;

  verdict::schema::pubkey_t program_id_;
  std::vector<verdict::schema::account_meta_t> accounts_;
  slot_map_t& staged_;
  slot_map_t baseline_;
  verdict::schema::rent_t rent_;
  verdict::schema::clock_sysvar_t clock_;
  std::vector<std::string> logs_;
  std::vector<verdict::schema::pubkey_t> created_slots_;
};

}  // namespace verdict::execution
