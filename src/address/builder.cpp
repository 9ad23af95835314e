#include <verdict/address/builder.hpp>

#include <iterator>

using namespace verdict::address;

builder& builder::write(const std::string_view& str) {
  seeds.emplace_back(std::begin(str), std::end(str));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  seeds.emplace_back(std::begin(bytes), std::end(bytes));
  return *this;
}

builder& builder::write(const uint8_t value) {
  seeds.push_back(verdict::schema::bytes_t{value});
  return *this;
}

std::optional<derived_address_t> builder::derive(
    const verdict::schema::pubkey_t& program_id) const {
  return find_program_address(seeds, program_id);
}

derivation_proof_t builder::proof(const uint8_t bump) const {
  return derivation_proof_t{.seeds = seeds, .bump = bump};
}
