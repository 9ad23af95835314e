#include <verdict/program/request_validator.hpp>
#include <verdict/schema/encoding/scale/verdict_entry.hpp>
#include <verdict/schema/program_error.hpp>

#include <fmt/format.h>

#include <algorithm>

using namespace verdict::schema;

namespace verdict::program {

namespace {

fixed_record_request parse_fixed(const bytes_view_t& data) {
  if (data.size() < kMinimumRequestSize) {
    throw program_error{error_code::malformed_input,
                        fmt::format("request data is {} bytes, need {}",
                                    data.size(), kMinimumRequestSize)};
  }
  auto request = fixed_record_request{};
  std::ranges::copy(
      data.subspan(kRequestSubjectHashOffset, request.subject_hash.size()),
      std::begin(request.subject_hash));
  std::ranges::copy(data.subspan(kRequestPayloadOffset, kVerdictPayloadSize),
                    std::begin(request.payload));
  request.discriminator = data[kRequestDiscriminatorOffset];
  return request;
}

variable_record_request parse_variable(const bytes_view_t& data) {
  auto args = verdict::schema::encoding::scale::try_decode_store_verdict(data);
  if (!args) {
    throw program_error{error_code::malformed_input,
                        "undecodable store_verdict instruction"};
  }
  return variable_record_request{.args = std::move(*args)};
}

}  // namespace

void validate_fields(const store_verdict_args_t& args) {
  if (args.token_address.size() > kMaxTokenAddressLength) {
    throw program_error{error_code::token_address_too_long,
                        fmt::format("{} bytes", args.token_address.size())};
  }
  if (args.chain.size() > kMaxChainLength) {
    throw program_error{error_code::chain_too_long,
                        fmt::format("{} bytes", args.chain.size())};
  }
  if (args.score > kMaxScore) {
    throw program_error{error_code::score_out_of_range,
                        fmt::format("score {}", args.score)};
  }
  if (args.grade.size() > kMaxGradeLength) {
    throw program_error{error_code::grade_too_long,
                        fmt::format("{} bytes", args.grade.size())};
  }
  if (args.tier.size() > kMaxTierLength) {
    throw program_error{error_code::tier_too_long,
                        fmt::format("{} bytes", args.tier.size())};
  }
}

validated_request_t validate_request(const program_config_t& config,
                                     const std::vector<account_meta_t>& accounts,
                                     const bytes_view_t& data) {
  auto record = record_request_t{};
  if (config.schema == record_schema::fixed) {
    record = parse_fixed(data);
  } else {
    record = parse_variable(data);
  }

  if (accounts.size() < kMinimumAccounts) {
    throw program_error{error_code::malformed_input,
                        fmt::format("{} identities supplied, need {}",
                                    accounts.size(), kMinimumAccounts)};
  }
  if (!accounts[0].is_signer) {
    throw program_error{error_code::unauthorized,
                        fmt::format("caller {} did not sign",
                                    to_base58(accounts[0].key))};
  }

  if (const auto* variable = std::get_if<variable_record_request>(&record)) {
    validate_fields(variable->args);
  }

  return validated_request_t{.authority = accounts[0].key,
                             .target = accounts[1].key,
                             .record = std::move(record)};
}

}  // namespace verdict::program
