#include <verdict/address/derive.hpp>
#include <verdict/crypto/curve.hpp>
#include <verdict/crypto/sha256.hpp>
#include <verdict/schema/program_error.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>

using namespace verdict::schema;

namespace verdict::address {

namespace {

std::vector<bytes_view_t> with_bump(const seeds_t& seeds,
                                    const std::array<uint8_t, 1>& bump) {
  auto views = std::vector<bytes_view_t>{};
  views.reserve(seeds.size() + 1);
  for (const auto& seed : seeds) {
    views.emplace_back(seed.data(), seed.size());
  }
  views.emplace_back(bump.data(), bump.size());
  return views;
}

}  // namespace

std::optional<pubkey_t> create_program_address(
    std::span<const bytes_view_t> seeds,
    const pubkey_t& program_id) {
  if (seeds.size() > kMaxSeeds) {
    throw program_error{
        error_code::seed_too_long,
        fmt::format("{} seeds exceed the limit of {}", seeds.size(),
                    kMaxSeeds)};
  }

  auto material = bytes_t{};
  for (const auto& seed : seeds) {
    if (seed.size() > kMaxSeedLength) {
      throw program_error{
          error_code::seed_too_long,
          fmt::format("seed of {} bytes exceeds the limit of {}", seed.size(),
                      kMaxSeedLength)};
    }
    material.insert(std::end(material), std::begin(seed), std::end(seed));
  }

  auto address = verdict::crypto::sha256(
      {bytes_view_t{material.data(), material.size()},
       bytes_view_t{program_id.data(), program_id.size()},
       make_bytes_view(kDerivedAddressMarker)});
  if (verdict::crypto::is_on_curve(address)) {
    return std::nullopt;
  }
  return address;
}

std::optional<derived_address_t> find_program_address(
    const seeds_t& seeds,
    const pubkey_t& program_id) {
  for (auto bump = 256; bump-- > 0;) {
    auto bump_seed = std::array<uint8_t, 1>{static_cast<uint8_t>(bump)};
    auto views = with_bump(seeds, bump_seed);
    if (auto address = create_program_address(views, program_id)) {
      return derived_address_t{.address = *address,
                               .bump = static_cast<uint8_t>(bump)};
    }
  }
  spdlog::warn("No off-curve bump for {} seed(s) under program {}",
               seeds.size(), to_base58(program_id));
  return std::nullopt;
}

bool verify(const derivation_proof_t& proof,
            const pubkey_t& program_id,
            const pubkey_t& address) {
  auto bump_seed = std::array<uint8_t, 1>{proof.bump};
  auto views = with_bump(proof.seeds, bump_seed);
  auto derived = create_program_address(views, program_id);
  return derived.has_value() && *derived == address;
}

}  // namespace verdict::address
