#include <verdict/program/request_validator.hpp>
#include <verdict/program/slot_provisioner.hpp>
#include <verdict/schema/program_error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace verdict::schema;

namespace verdict::program {

void provision_slot(verdict::execution::invoke_context& context,
                    const pubkey_t& authority,
                    const pubkey_t& target,
                    const uint64_t space,
                    const verdict::address::derivation_proof_t& proof) {
  const auto& accounts = context.accounts();
  // Collaborator identities start after the caller and the target.
  auto has_system_program =
      accounts.size() >= kMinimumAccounts &&
      std::any_of(std::next(std::begin(accounts), 2), std::end(accounts),
                  [](const auto& account) {
                    return account.key == kSystemProgramId;
                  });
  if (!has_system_program) {
    throw program_error{error_code::malformed_input,
                        "slot-creation service identity not supplied"};
  }

  // Rent parameters may change between requests; never cache them.
  auto lamports = context.rent().minimum_balance(space);
  spdlog::debug("Provisioning {} bytes at {} for {} lamports", space,
                to_base58(target), lamports);
  context.create_slot(
      verdict::execution::system_program::create_slot_request_t{
          .funder = authority,
          .target = target,
          .lamports = lamports,
          .space = space,
          .owner = context.program_id()},
      std::span{&proof, 1});
}

}  // namespace verdict::program
