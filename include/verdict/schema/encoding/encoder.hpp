#pragma once
#include <verdict/schema/primitives.hpp>
#include <optional>
#include <span>

namespace verdict::schema::encoding {

// Codec selection is a build-time choice: each library gets a tag type and a
// specialisation of this template. Hot swapping is not a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  verdict::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, verdict::schema::bytes_t& out);

  template <typename T>
  T decode(const verdict::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const verdict::schema::bytes_view_t& bytes);
};

}  // namespace verdict::schema::encoding
