#pragma once

#include <verdict/schema/primitives.hpp>
#include <verdict/schema/verdict_entry.hpp>
#include <verdict/schema/verdict_record.hpp>
#include <variant>

// Schema type: record request.
// Validated registration input, one alternative per record schema. Shared by
// the validation, derivation, and provisioning steps; only the record
// encoding differs per alternative.
namespace verdict::schema {

struct fixed_record_request final {
  hash32_t subject_hash{};
  verdict_payload_t payload{};
  uint8_t discriminator{};
};

struct variable_record_request final {
  store_verdict_args_t args;
};

using record_request_t =
    std::variant<fixed_record_request, variable_record_request>;

}  // namespace verdict::schema
