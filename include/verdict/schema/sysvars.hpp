#pragma once

#include <verdict/schema/primitives.hpp>
#include <cstdint>

// Schema type: sysvars.
// Ledger parameters readable by programs while a request executes. They may
// change between requests, so programs read them per request and never cache.
namespace verdict::schema {

/// Fixed per-slot bookkeeping overhead charged on top of the data size.
inline constexpr auto kSlotStorageOverhead = uint64_t{128};

template <uint16_t Version>
struct rent;

template <>
struct rent<1> final {
  lamports_t lamports_per_byte_year{3480};
  double exemption_threshold{2.0};

  /// Balance a slot of `data_size` bytes must hold to be exempt from rent.
  lamports_t minimum_balance(uint64_t data_size) const {
    auto bytes = kSlotStorageOverhead + data_size;
    return static_cast<lamports_t>(
        static_cast<double>(bytes * lamports_per_byte_year) *
        exemption_threshold);
  }
};

using rent_t = rent<1>;

template <uint16_t Version>
struct clock_sysvar;

template <>
struct clock_sysvar<1> final {
  uint64_t slot{};
  unix_timestamp_t unix_timestamp{};
};

using clock_sysvar_t = clock_sysvar<1>;

}  // namespace verdict::schema
