#pragma once

#include <verdict/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace verdict::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  /// Diagnostic messages emitted by programs, in emission order.
  std::vector<std::string> logs;
  /// Slots created by the transaction, in creation order.
  std::vector<pubkey_t> created_slots;
};

using transaction_result_t = transaction_result<1>;

}  // namespace verdict::schema
