#pragma once
#include <blake3.h>
#include <verdict/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace verdict::blake3 {

verdict::schema::hash32_t hash(const std::string_view& str);
verdict::schema::hash32_t hash(const verdict::schema::bytes_view_t& bytes);

/// Incremental hashing for inputs assembled from many parts.
class hasher final {
 public:
  hasher();
  hasher& update(const verdict::schema::bytes_view_t& bytes);
  verdict::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

}  // namespace verdict::blake3
