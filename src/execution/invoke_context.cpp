#include <verdict/execution/invoke_context.hpp>
#include <verdict/schema/program_error.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

using namespace verdict::schema;

namespace verdict::execution {

invoke_context::invoke_context(const pubkey_t& program_id,
                               std::vector<account_meta_t> accounts,
                               slot_map_t& staged,
                               const rent_t& rent,
                               const clock_sysvar_t& clock)
    : program_id_{program_id},
      accounts_{std::move(accounts)},
      staged_{staged},
      rent_{rent},
      clock_{clock} {
  for (const auto& account : accounts_) {
    auto& current = staged_[account.key];
    baseline_.insert_or_assign(account.key, current);
  }
}

bool invoke_context::is_listed(const pubkey_t& key) const {
  return baseline_.contains(key);
}

bool invoke_context::is_signer(const pubkey_t& key) const {
  return std::ranges::any_of(accounts_, [&](const auto& account) {
    return account.key == key && account.is_signer;
  });
}

const slot_t& invoke_context::slot(const pubkey_t& key) const {
  if (!is_listed(key)) {
    throw program_error{error_code::malformed_input,
                        fmt::format("{} is not a participating identity",
                                    to_base58(key))};
  }
  return staged_.at(key);
}

slot_t& invoke_context::mutable_slot(const pubkey_t& key) {
  if (!is_listed(key)) {
    throw program_error{error_code::malformed_input,
                        fmt::format("{} is not a participating identity",
                                    to_base58(key))};
  }
  return staged_.at(key);
}

void invoke_context::log(std::string message) {
  spdlog::debug("Program {} log: {}", to_base58(program_id_), message);
  logs_.push_back(std::move(message));
}

void invoke_context::create_slot(
    const system_program::create_slot_request_t& request,
    std::span<const verdict::address::derivation_proof_t> proofs) {
  for (const auto& key : {request.funder, request.target}) {
    auto writable = std::ranges::any_of(accounts_, [&](const auto& account) {
      return account.key == key && account.is_writable;
    });
    if (!writable) {
      throw program_error{error_code::malformed_input,
                          fmt::format("{} must be writable", to_base58(key))};
    }
  }
  auto& funder = mutable_slot(request.funder);
  auto& target = mutable_slot(request.target);
  system_program::create_slot(
      request,
      system_program::create_slot_authority_t{
          .invoker = program_id_,
          .funder_signed = is_signer(request.funder),
          .target_signed = is_signer(request.target),
          .proofs = proofs},
      funder, target);

  // Carry the native transfer into the baseline without absorbing anything
  // the program itself changed on the funder.
  baseline_.at(request.funder).lamports -= request.lamports;
  baseline_.insert_or_assign(request.target, target);
  created_slots_.push_back(request.target);
}

}  // namespace verdict::execution
