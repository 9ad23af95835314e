#include <verdict/program/address_deriver.hpp>
#include <verdict/program/processor.hpp>
#include <verdict/program/record_encoder.hpp>
#include <verdict/program/request_validator.hpp>
#include <verdict/program/slot_provisioner.hpp>
#include <verdict/schema/program_error.hpp>

#include <fmt/format.h>

using namespace verdict::schema;

namespace verdict::program {

namespace {

std::string describe(const record_request_t& record) {
  return std::visit(
      overloaded{[](const fixed_record_request&) {
                   return std::string{"verdict stored"};
                 },
                 [](const variable_record_request& variable) {
                   const auto& args = variable.args;
                   return fmt::format(
                       "Stored verdict for {} on {}: score {}/1000, grade {}",
                       args.token_address, args.chain, args.score, args.grade);
                 }},
      record);
}

}  // namespace

processor::processor(program_config_t config) : config_{std::move(config)} {}

void processor::process(verdict::execution::invoke_context& context,
                        const bytes_view_t& data) {
  if (context.program_id() != config_.program_id) {
    throw program_error{error_code::unknown_program,
                        "invoked under a foreign identity"};
  }

  auto request = validate_request(config_, context.accounts(), data);
  auto derivation = derive_address(config_, request.record);
  check_target(derivation, request.target);

  auto space = record_size(request.record);
  provision_slot(context, request.authority, request.target, space,
                 derivation.proof);

  auto& slot = context.mutable_slot(request.target);
  write_record(slot.data, request.record,
               record_context_t{.authority = request.authority,
                                .bump = derivation.derived.bump,
                                .timestamp = context.clock().unix_timestamp});
  context.log(describe(request.record));
}

}  // namespace verdict::program
