#pragma once

#include <verdict/schema/primitives.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

// Schema type: verdict entry (variable layout).
// Same lifecycle as the fixed record, but the scoring payload is carried as
// bounded text fields and serialised through SCALE, so the slot size depends
// on the field lengths.
namespace verdict::schema {

inline constexpr auto kMaxTokenAddressLength = std::size_t{64};
inline constexpr auto kMaxChainLength = std::size_t{16};
inline constexpr auto kMaxGradeLength = std::size_t{4};
inline constexpr auto kMaxTierLength = std::size_t{16};
inline constexpr auto kMaxScore = uint16_t{1000};

/// 8-byte type tags: sha256("global:store_verdict")[0..8] prefixes the
/// instruction data, sha256("account:Verdict")[0..8] prefixes the slot data.
using type_tag_t = std::array<uint8_t, 8>;
inline constexpr auto kStoreVerdictInstructionTag =
    type_tag_t{0xa1, 0xdb, 0x06, 0x0b, 0x5b, 0x33, 0x71, 0xbc};
inline constexpr auto kVerdictEntryTag =
    type_tag_t{0xa9, 0x01, 0xab, 0x45, 0x18, 0x6a, 0x42, 0xc1};

template <uint16_t Version>
struct store_verdict_args;

template <>
struct store_verdict_args<1> final {
  std::string token_address;
  std::string chain;
  uint16_t score{};
  std::string grade;
  uint8_t agent_count{};
  std::string tier;
  hash32_t scan_hash{};

  bool operator==(const store_verdict_args<1>&) const = default;
};

using store_verdict_args_t = store_verdict_args<1>;

template <uint16_t Version>
struct verdict_entry;

template <>
struct verdict_entry<1> final {
  pubkey_t authority{};
  std::string token_address;
  std::string chain;
  uint16_t score{};
  std::string grade;
  uint8_t agent_count{};
  std::string tier;
  unix_timestamp_t timestamp{};
  hash32_t scan_hash{};
  uint8_t bump{};

  bool operator==(const verdict_entry<1>&) const = default;
};

using verdict_entry_t = verdict_entry<1>;

}  // namespace verdict::schema
