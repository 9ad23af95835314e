#include <verdict/program/record_encoder.hpp>
#include <verdict/schema/encoding/fixed/verdict_record.hpp>
#include <verdict/schema/encoding/scale/verdict_entry.hpp>
#include <verdict/schema/program_error.hpp>

#include <fmt/format.h>

#include <algorithm>

using namespace verdict::schema;

namespace verdict::program {

namespace {

verdict_record_t make_fixed_record(const fixed_record_request& request,
                                   const record_context_t& context) {
  return verdict_record_t{.bump = context.bump,
                          .subject_hash = request.subject_hash,
                          .payload = request.payload,
                          .discriminator = request.discriminator,
                          .authority = context.authority};
}

verdict_entry_t make_entry(const variable_record_request& request,
                           const record_context_t& context) {
  const auto& args = request.args;
  return verdict_entry_t{.authority = context.authority,
                         .token_address = args.token_address,
                         .chain = args.chain,
                         .score = args.score,
                         .grade = args.grade,
                         .agent_count = args.agent_count,
                         .tier = args.tier,
                         .timestamp = context.timestamp,
                         .scan_hash = args.scan_hash,
                         .bump = context.bump};
}

}  // namespace

bytes_t encode_record(const record_request_t& record,
                      const record_context_t& context) {
  return std::visit(
      overloaded{[&](const fixed_record_request& fixed) {
                   return encoding::fixed::encode(
                       make_fixed_record(fixed, context));
                 },
                 [&](const variable_record_request& variable) {
                   return encoding::scale::encode_verdict_entry(
                       make_entry(variable, context));
                 }},
      record);
}

std::size_t record_size(const record_request_t& record) {
  // Every field that is only known later has a fixed encoded width.
  return encode_record(record, record_context_t{}).size();
}

void write_record(std::span<uint8_t> slot_data,
                  const record_request_t& record,
                  const record_context_t& context) {
  std::visit(
      overloaded{[&](const fixed_record_request& fixed) {
                   encoding::fixed::write(make_fixed_record(fixed, context),
                                          slot_data);
                 },
                 [&](const variable_record_request& variable) {
                   auto encoded = encoding::scale::encode_verdict_entry(
                       make_entry(variable, context));
                   if (encoded.size() != slot_data.size()) {
                     throw program_error{
                         error_code::slot_too_small,
                         fmt::format("slot holds {} bytes, entry needs {}",
                                     slot_data.size(), encoded.size())};
                   }
                   std::ranges::copy(encoded, std::begin(slot_data));
                 }},
      record);
}

}  // namespace verdict::program
