#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <verdict/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace verdict::storage {

namespace detail {

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|LEDGER|COMMITTED"};
inline constexpr auto kSlotPrefix = std::string_view{"SLOT|"};

inline std::string make_slot_key(const verdict::schema::pubkey_t& key) {
  auto slot_key = std::string{kSlotPrefix};
  slot_key.append(reinterpret_cast<const char*>(key.data()), key.size());
  return slot_key;
}

inline verdict::schema::bytes_view_t to_bytes_view(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()), slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::shared_ptr<ROCKSDB_NAMESPACE::DB> database;

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
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace verdict::storage
