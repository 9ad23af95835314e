#pragma once

#include <verdict/program/config.hpp>
#include <verdict/schema/primitives.hpp>
#include <verdict/schema/record_request.hpp>
#include <verdict/schema/transaction.hpp>
#include <vector>

namespace verdict::program {

/// Minimum participating identities: caller, target slot, slot-creation
/// service.
inline constexpr auto kMinimumAccounts = std::size_t{3};

struct validated_request final {
  verdict::schema::pubkey_t authority{};
  verdict::schema::pubkey_t target{};
  verdict::schema::record_request_t record;
};

using validated_request_t = validated_request;

/// Structural and authorization checks that run before any state is touched.
/// Pure; throws program_error on the first failing check.
validated_request_t validate_request(
    const program_config_t& config,
    const std::vector<verdict::schema::account_meta_t>& accounts,
    const verdict::schema::bytes_view_t& data);

/// Field bounds of the variable-layout schema.
void validate_fields(const verdict::schema::store_verdict_args_t& args);

}  // namespace verdict::program
