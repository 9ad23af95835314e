#pragma once

#include <verdict/crypto/keypair.hpp>
#include <verdict/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace verdict::testing {

/// Program identity used across the suite (base58
/// 3i6GVUgshmbymqrsvxWQMX98yKzqLxNRUHEhtwRBZ35p).
inline verdict::schema::pubkey_t program_id() {
  return verdict::schema::make_hash32(std::string_view{
      "283e247d5da5bbab91fef8f0858e58c11b55fafb5ca1084450c0e0f23140e4ff"});
}

inline verdict::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = verdict::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline verdict::crypto::keypair_t make_signer(const uint8_t seed) {
  auto secret = verdict::crypto::seed_t{};
  secret.fill(seed);
  return verdict::crypto::make_keypair(secret);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace verdict::testing
