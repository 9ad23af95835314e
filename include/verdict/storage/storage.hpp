#pragma once
#include <verdict/schema/primitives.hpp>
#include <verdict/schema/slot.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace verdict::storage {

using slot_entry_t =
    std::pair<verdict::schema::pubkey_t, verdict::schema::slot_t>;

/// Last committed ledger checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t height{};
  verdict::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return the slot at key, or std::nullopt when never written.
  std::optional<verdict::schema::slot_t> load_slot(
      const verdict::schema::pubkey_t& key) const;

  /// Atomically persist every entry, all or none.
  void save_slots(const std::vector<slot_entry_t>& slots) const;

  /// Every persisted slot in ascending key order.
  std::vector<slot_entry_t> list_slots() const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Persist every entry and the checkpoint that covers them in one atomic
  /// write, so a reopened store never pairs new slots with a stale root.
  void commit(const std::vector<slot_entry_t>& slots,
              const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace verdict::storage
