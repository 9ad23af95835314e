#include <verdict/program/address_deriver.hpp>
#include <verdict/program/instruction.hpp>
#include <verdict/schema/encoding/scale/verdict_entry.hpp>
#include <verdict/schema/program_error.hpp>
#include <verdict/schema/slot.hpp>

#include <iterator>

using namespace verdict::schema;

namespace verdict::program {

bytes_t make_request_data(const fixed_record_request& request) {
  auto data = bytes_t{};
  data.reserve(kMinimumRequestSize);
  data.insert(std::end(data), std::begin(request.subject_hash),
              std::end(request.subject_hash));
  data.insert(std::end(data), std::begin(request.payload),
              std::end(request.payload));
  data.push_back(request.discriminator);
  return data;
}

bytes_t make_request_data(const record_request_t& record) {
  return std::visit(
      overloaded{[](const fixed_record_request& fixed) {
                   return make_request_data(fixed);
                 },
                 [](const variable_record_request& variable) {
                   return encoding::scale::encode_store_verdict(
                       variable.args);
                 }},
      record);
}

instruction_t make_register_instruction(const program_config_t& config,
                                        const pubkey_t& authority,
                                        const record_request_t& record) {
  auto derivation = derive_address(config, record);
  auto instruction = instruction_t{};
  instruction.program_id = config.program_id;
  instruction.accounts = {
      account_meta_t{.key = authority, .is_signer = true, .is_writable = true},
      account_meta_t{.key = derivation.derived.address,
                     .is_signer = false,
                     .is_writable = true},
      account_meta_t{.key = kSystemProgramId,
                     .is_signer = false,
                     .is_writable = false}};
  instruction.data = make_request_data(record);
  return instruction;
}

}  // namespace verdict::program
