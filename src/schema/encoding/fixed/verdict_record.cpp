#include <verdict/schema/encoding/fixed/verdict_record.hpp>
#include <verdict/schema/program_error.hpp>

#include <algorithm>
#include <fmt/format.h>

using namespace verdict::schema;

namespace verdict::schema::encoding::fixed {

void write(const verdict_record_t& record, std::span<uint8_t> slot_data) {
  if (slot_data.size() != kVerdictRecordSize) {
    throw program_error{
        error_code::slot_too_small,
        fmt::format("record slot holds {} bytes, expected {}",
                    slot_data.size(), kVerdictRecordSize)};
  }
  slot_data[kRecordBumpOffset] = record.bump;
  std::ranges::copy(record.subject_hash,
                    slot_data.begin() + kRecordSubjectHashOffset);
  std::ranges::copy(record.payload, slot_data.begin() + kRecordPayloadOffset);
  slot_data[kRecordDiscriminatorOffset] = record.discriminator;
  std::ranges::copy(record.authority,
                    slot_data.begin() + kRecordAuthorityOffset);
}

bytes_t encode(const verdict_record_t& record) {
  auto out = bytes_t(kVerdictRecordSize, 0);
  write(record, std::span<uint8_t>{out.data(), out.size()});
  return out;
}

std::optional<verdict_record_t> try_read(const bytes_view_t& slot_data) {
  if (slot_data.size() != kVerdictRecordSize) {
    return std::nullopt;
  }
  auto record = verdict_record_t{};
  record.bump = slot_data[kRecordBumpOffset];
  std::copy_n(slot_data.begin() + kRecordSubjectHashOffset,
              record.subject_hash.size(), record.subject_hash.begin());
  std::copy_n(slot_data.begin() + kRecordPayloadOffset, record.payload.size(),
              record.payload.begin());
  record.discriminator = slot_data[kRecordDiscriminatorOffset];
  std::copy_n(slot_data.begin() + kRecordAuthorityOffset,
              record.authority.size(), record.authority.begin());
  return record;
}

verdict_record_t read(const bytes_view_t& slot_data) {
  auto record = try_read(slot_data);
  if (!record) {
    throw program_error{
        error_code::slot_too_small,
        fmt::format("record slot holds {} bytes, expected {}",
                    slot_data.size(), kVerdictRecordSize)};
  }
  return *record;
}

}  // namespace verdict::schema::encoding::fixed
