#pragma once
#include <verdict/schema/encoding/scale/encoder.hpp>
#include <verdict/storage/storage.hpp>
#include <map>
#include <memory>
#include <mutex>

namespace verdict::storage {

struct memory_storage_tag {};

namespace detail {

struct memory_state final {
  std::mutex mutex;
  std::map<verdict::schema::pubkey_t, verdict::schema::bytes_t> slots;
  std::optional<verdict::schema::bytes_t> committed;
};

}  // namespace detail

// Values are kept SCALE-encoded so both backends round-trip through the same
// codec. Copies share the underlying state.
template <>
struct storage<memory_storage_tag> final {
  std::shared_ptr<detail::memory_state> state{
      std::make_shared<detail::memory_state>()};

  std::optional<verdict::schema::slot_t> load_slot(
      const verdict::schema::pubkey_t& key) const;
  void save_slots(const std::vector<slot_entry_t>& slots) const;
  std::vector<slot_entry_t> list_slots() const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  void commit(const std::vector<slot_entry_t>& slots,
              const committed_state& state) const;
};

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

}  // namespace verdict::storage
