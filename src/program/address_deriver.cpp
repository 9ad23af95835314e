#include <verdict/program/address_deriver.hpp>
#include <verdict/schema/program_error.hpp>

#include <fmt/format.h>

using namespace verdict::schema;

namespace verdict::program {

verdict::address::builder make_seeds(const program_config_t& config,
                                     const record_request_t& record) {
  auto seeds = verdict::address::builder{};
  seeds.write(config.domain_tag);
  std::visit(overloaded{[&](const fixed_record_request& fixed) {
                          seeds.write(fixed.subject_hash);
                        },
                        [&](const variable_record_request& variable) {
                          seeds.write(variable.args.token_address)
                              .write(variable.args.chain)
                              .write(variable.args.scan_hash);
                        }},
             record);
  return seeds;
}

derivation_result_t derive_address(const program_config_t& config,
                                   const record_request_t& record) {
  auto seeds = make_seeds(config, record);
  auto derived = seeds.derive(config.program_id);
  if (!derived) {
    throw program_error{error_code::address_space_exhausted};
  }
  return derivation_result_t{.derived = *derived,
                             .proof = seeds.proof(derived->bump)};
}

void check_target(const derivation_result_t& derivation,
                  const pubkey_t& target) {
  if (derivation.derived.address != target) {
    throw program_error{
        error_code::address_mismatch,
        fmt::format("expected {}, got {}",
                    to_base58(derivation.derived.address), to_base58(target))};
  }
}

}  // namespace verdict::program
