#pragma once

#include <verdict/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: error code.
// Terminal failure kinds surfaced in a transaction result. Codes below 10
// belong to the transaction envelope, the rest are raised by programs.
namespace verdict::schema {

enum class error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  signature_verification_failed = 3,
  unknown_program = 4,
  unbalanced_transaction = 5,
  external_slot_modified = 6,
  malformed_input = 10,
  unauthorized = 11,
  address_mismatch = 12,
  address_space_exhausted = 13,
  slot_already_exists = 14,
  insufficient_funds = 15,
  slot_too_small = 16,
  seed_too_long = 17,
  invalid_slot_size = 18,
  token_address_too_long = 20,
  chain_too_long = 21,
  score_out_of_range = 22,
  grade_too_long = 23,
  tier_too_long = 24,
};

inline constexpr auto kErrorCodeNames =
    std::array<std::pair<std::string_view, error_code>, 20>{{
        {"invalid_transaction", error_code::invalid_transaction},
        {"unsupported_transaction_version",
         error_code::unsupported_transaction_version},
        {"signature_verification_failed",
         error_code::signature_verification_failed},
        {"unknown_program", error_code::unknown_program},
        {"unbalanced_transaction", error_code::unbalanced_transaction},
        {"external_slot_modified", error_code::external_slot_modified},
        {"malformed_input", error_code::malformed_input},
        {"unauthorized", error_code::unauthorized},
        {"address_mismatch", error_code::address_mismatch},
        {"address_space_exhausted", error_code::address_space_exhausted},
        {"slot_already_exists", error_code::slot_already_exists},
        {"insufficient_funds", error_code::insufficient_funds},
        {"slot_too_small", error_code::slot_too_small},
        {"seed_too_long", error_code::seed_too_long},
        {"invalid_slot_size", error_code::invalid_slot_size},
        {"token_address_too_long", error_code::token_address_too_long},
        {"chain_too_long", error_code::chain_too_long},
        {"score_out_of_range", error_code::score_out_of_range},
        {"grade_too_long", error_code::grade_too_long},
        {"tier_too_long", error_code::tier_too_long},
    }};

constexpr std::string_view error_name(const error_code code) {
  return to_string(code, kErrorCodeNames).value_or("unknown_error");
}

constexpr uint32_t to_code(const error_code code) {
  return static_cast<uint32_t>(code);
}

}  // namespace verdict::schema
