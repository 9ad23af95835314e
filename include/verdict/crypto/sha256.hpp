#pragma once
#include <verdict/schema/primitives.hpp>
#include <initializer_list>
#include <span>
#include <string_view>

namespace verdict::crypto {

verdict::schema::hash32_t sha256(const verdict::schema::bytes_view_t& bytes);
verdict::schema::hash32_t sha256(const std::string_view& str);

/// Digest of the concatenation of `parts`, without materialising it.
verdict::schema::hash32_t sha256(
    std::initializer_list<verdict::schema::bytes_view_t> parts);

}  // namespace verdict::crypto
