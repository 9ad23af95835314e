#include <verdict/storage/memory/storage.hpp>

#include <spdlog/spdlog.h>

#include <tuple>

using namespace verdict::schema;

namespace verdict::storage {

namespace {

using encoder_t = verdict::schema::encoding::scale_encoder_t;

std::vector<std::pair<pubkey_t, bytes_t>> encode_slots(
    const std::vector<slot_entry_t>& slots) {
  auto encoder = encoder_t{};
  auto encoded = std::vector<std::pair<pubkey_t, bytes_t>>{};
  encoded.reserve(slots.size());
  for (const auto& [key, slot] : slots) {
    encoded.emplace_back(key, encoder.encode(slot));
  }
  return encoded;
}

}  // namespace

std::optional<slot_t> storage<memory_storage_tag>::load_slot(
    const pubkey_t& key) const {
  auto lock = std::scoped_lock{state->mutex};
  auto it = state->slots.find(key);
  if (it == std::end(state->slots)) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  return encoder.decode<slot_t>(make_bytes_view(it->second));
}

void storage<memory_storage_tag>::save_slots(
    const std::vector<slot_entry_t>& slots) const {
  auto encoded = encode_slots(slots);
  auto lock = std::scoped_lock{state->mutex};
  for (auto& [key, value] : encoded) {
    state->slots.insert_or_assign(key, std::move(value));
  }
}

std::vector<slot_entry_t> storage<memory_storage_tag>::list_slots() const {
  auto encoder = encoder_t{};
  auto entries = std::vector<slot_entry_t>{};
  auto lock = std::scoped_lock{state->mutex};
  entries.reserve(state->slots.size());
  for (const auto& [key, value] : state->slots) {
    entries.emplace_back(key, encoder.decode<slot_t>(make_bytes_view(value)));
  }
  return entries;
}

std::optional<committed_state>
storage<memory_storage_tag>::load_committed_state() const {
  auto lock = std::scoped_lock{state->mutex};
  if (!state->committed) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto decoded = encoder.decode<std::tuple<uint64_t, hash32_t>>(
      make_bytes_view(*state->committed));
  return committed_state{.height = std::get<0>(decoded),
                         .state_root = std::get<1>(decoded)};
}

void storage<memory_storage_tag>::save_committed_state(
    const committed_state& committed) const {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple{committed.height,
                                           committed.state_root});
  auto lock = std::scoped_lock{state->mutex};
  state->committed = std::move(encoded);
}

void storage<memory_storage_tag>::commit(
    const std::vector<slot_entry_t>& slots,
    const committed_state& committed) const {
  auto encoder = encoder_t{};
  auto encoded = encode_slots(slots);
  auto encoded_committed =
      encoder.encode(std::tuple{committed.height, committed.state_root});

  auto lock = std::scoped_lock{state->mutex};
  for (auto& [key, value] : encoded) {
    state->slots.insert_or_assign(key, std::move(value));
  }
  state->committed = std::move(encoded_committed);
}

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  spdlog::debug("Using in-memory slot storage (ignoring path '{}')", path);
  return storage<memory_storage_tag>{};
}

}  // namespace verdict::storage
