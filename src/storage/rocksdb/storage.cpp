#include <verdict/common/critical.hpp>
#include <verdict/schema/encoding/scale/encoder.hpp>
#include <verdict/storage/rocksdb/storage.hpp>

#include <spdlog/spdlog.h>

#include <tuple>

using namespace verdict::schema;

namespace verdict::storage {

namespace {

using encoder_t = verdict::schema::encoding::scale_encoder_t;

void require_database(const std::shared_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    verdict::common::critical("RocksDB database is not initialized");
  }
}

void stage_slots(ROCKSDB_NAMESPACE::WriteBatch& batch,
                 const std::vector<slot_entry_t>& slots) {
  auto encoder = encoder_t{};
  for (const auto& [key, slot] : slots) {
    auto encoded = encoder.encode(slot);
    auto put_status = batch.Put(
        detail::make_slot_key(key),
        ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(encoded.data()),
                                 encoded.size()});
    if (!put_status.ok()) {
      verdict::common::critical("failed staging slot write");
    }
  }
}

void stage_committed_state(ROCKSDB_NAMESPACE::WriteBatch& batch,
                           const committed_state& state) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto put_status = batch.Put(
      std::string{detail::kCommittedStateKey},
      ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(encoded.data()),
                               encoded.size()});
  if (!put_status.ok()) {
    verdict::common::critical("failed staging committed state");
  }
}

void write_batch(ROCKSDB_NAMESPACE::DB& database,
                 ROCKSDB_NAMESPACE::WriteBatch& batch) {
  auto write_status = database.Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    verdict::common::critical("failed to commit write batch");
  }
}

}  // namespace

std::optional<slot_t> storage<rocksdb_storage_tag>::load_slot(
    const pubkey_t& key) const {
  require_database(database);
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::make_slot_key(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get slot from RocksDB: {}", status.ToString());
    verdict::common::critical("Failed to get slot from RocksDB");
  }
  auto encoder = encoder_t{};
  return encoder.decode<slot_t>(make_bytes_view(value));
}

void storage<rocksdb_storage_tag>::save_slots(
    const std::vector<slot_entry_t>& slots) const {
  require_database(database);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  stage_slots(batch, slots);
  write_batch(*database, batch);
}

std::vector<slot_entry_t> storage<rocksdb_storage_tag>::list_slots() const {
  require_database(database);
  auto entries = std::vector<slot_entry_t>{};
  auto encoder = encoder_t{};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(std::string{detail::kSlotPrefix});
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(detail::kSlotPrefix)) {
      break;
    }
    auto raw_key = detail::to_bytes_view(iterator->key())
                       .subspan(detail::kSlotPrefix.size());
    if (raw_key.size() != pubkey_t{}.size()) {
      spdlog::warn("Skipping malformed slot key of {} bytes", raw_key.size());
      iterator->Next();
      continue;
    }
    entries.emplace_back(
        make_hash32(raw_key),
        encoder.decode<slot_t>(detail::to_bytes_view(iterator->value())));
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    verdict::common::critical("failed iterating slots");
  }
  return entries;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  require_database(database);
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedStateKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    verdict::common::critical("failed to load committed state");
  }

  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<std::tuple<uint64_t, hash32_t>>(
      make_bytes_view(committed_raw));
  if (!decoded.has_value()) {
    verdict::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  require_database(database);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  stage_committed_state(batch, state);
  write_batch(*database, batch);
}

void storage<rocksdb_storage_tag>::commit(const std::vector<slot_entry_t>& slots,
                                          const committed_state& state) const {
  require_database(database);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  stage_slots(batch, slots);
  stage_committed_state(batch, state);
  write_batch(*database, batch);
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>{};

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    verdict::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace verdict::storage
