#pragma once
#include <verdict/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: transaction.
// Request envelope: an ordered list of instructions executed as one atomic
// unit, plus the ed25519 signatures over the encoded message.
namespace verdict::schema {

struct account_meta final {
  pubkey_t key{};
  bool is_signer{};
  bool is_writable{};
};

using account_meta_t = account_meta;

template <uint16_t Version>
struct instruction;

template <>
struct instruction<1> final {
  pubkey_t program_id{};
  std::vector<account_meta_t> accounts;
  bytes_t data;
};

using instruction_t = instruction<1>;

template <uint16_t Version>
struct message;

template <>
struct message<1> final {
  uint16_t version{1};
  hash32_t recent_blockhash{};
  std::vector<instruction_t> instructions;
};

using message_t = message<1>;

struct signature_entry final {
  pubkey_t signer{};
  signature_t signature{};
};

using signature_entry_t = signature_entry;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  message_t message;
  std::vector<signature_entry_t> signatures;
};

using transaction_t = transaction<1>;

}  // namespace verdict::schema
