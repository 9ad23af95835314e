#pragma once

#include <verdict/schema/primitives.hpp>
#include <array>
#include <cstddef>
#include <cstdint>

// Schema type: verdict record (fixed layout).
// Immutable scored assessment of a subject, persisted as exactly 73 bytes:
//
//   [0]      bump
//   [1..33)  subject hash
//   [33..40) opaque payload
//   [40]     discriminator
//   [41..73) authority
namespace verdict::schema {

inline constexpr auto kVerdictPayloadSize = std::size_t{7};

inline constexpr auto kRecordBumpOffset = std::size_t{0};
inline constexpr auto kRecordSubjectHashOffset = std::size_t{1};
inline constexpr auto kRecordPayloadOffset = std::size_t{33};
inline constexpr auto kRecordDiscriminatorOffset = std::size_t{40};
inline constexpr auto kRecordAuthorityOffset = std::size_t{41};
inline constexpr auto kVerdictRecordSize = std::size_t{73};

/// Request data layout: [0..32) subject hash, [32..39) payload, [39]
/// discriminator. Trailing bytes are ignored.
inline constexpr auto kRequestSubjectHashOffset = std::size_t{0};
inline constexpr auto kRequestPayloadOffset = std::size_t{32};
inline constexpr auto kRequestDiscriminatorOffset = std::size_t{39};
inline constexpr auto kMinimumRequestSize = std::size_t{40};

using verdict_payload_t = std::array<uint8_t, kVerdictPayloadSize>;

template <uint16_t Version>
struct verdict_record;

template <>
struct verdict_record<1> final {
  uint8_t bump{};
  hash32_t subject_hash{};
  verdict_payload_t payload{};
  uint8_t discriminator{};
  pubkey_t authority{};

  bool operator==(const verdict_record<1>&) const = default;
};

using verdict_record_t = verdict_record<1>;

static_assert(kRecordAuthorityOffset + sizeof(pubkey_t) == kVerdictRecordSize);

}  // namespace verdict::schema
