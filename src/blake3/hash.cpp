#include <blake3.h>
#include <verdict/blake3/hash.hpp>

namespace verdict::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const verdict::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

verdict::schema::hash32_t hasher::finalize() const {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<verdict::schema::hash32_t>);
  auto output = verdict::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

verdict::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(verdict::schema::make_bytes_view(str)).finalize();
}

verdict::schema::hash32_t hash(const verdict::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace verdict::blake3
