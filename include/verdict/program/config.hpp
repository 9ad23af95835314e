#pragma once

#include <verdict/schema/enum_string.hpp>
#include <verdict/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace verdict::program {

enum class record_schema : uint8_t { fixed = 0, variable = 1 };

inline constexpr auto kRecordSchemaNames =
    std::array<std::pair<std::string_view, record_schema>, 2>{{
        {"fixed", record_schema::fixed},
        {"variable", record_schema::variable},
    }};

/// Domain tags keep each record kind in its own derived-address namespace.
inline constexpr auto kFixedDomainTag = std::string_view{"v"};
inline constexpr auto kVariableDomainTag = std::string_view{"verdict"};

/// Everything a registration program instance depends on. The program
/// identity is part of every derived address, so it is passed in explicitly.
struct program_config final {
  verdict::schema::pubkey_t program_id{};
  std::string domain_tag{kFixedDomainTag};
  record_schema schema{record_schema::fixed};
};

using program_config_t = program_config;

inline program_config_t make_fixed_config(
    const verdict::schema::pubkey_t& program_id) {
  return program_config_t{.program_id = program_id,
                          .domain_tag = std::string{kFixedDomainTag},
                          .schema = record_schema::fixed};
}

inline program_config_t make_variable_config(
    const verdict::schema::pubkey_t& program_id) {
  return program_config_t{.program_id = program_id,
                          .domain_tag = std::string{kVariableDomainTag},
                          .schema = record_schema::variable};
}

}  // namespace verdict::program
