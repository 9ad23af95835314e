#include <gtest/gtest.h>
#include <verdict/crypto/sha256.hpp>
#include <verdict/schema/encoding/fixed/verdict_record.hpp>
#include <verdict/schema/encoding/scale/verdict_entry.hpp>
#include <verdict/schema/program_error.hpp>
#include <verdict/schema/verdict_entry.hpp>
#include <verdict/schema/verdict_record.hpp>
#include <verdict/testing/common.hpp>

#include <algorithm>
#include <random>
#include <span>
#include <string_view>
#include <vector>

namespace {

verdict::schema::verdict_record_t make_record() {
  return verdict::schema::verdict_record_t{
      .bump = 0xfe,
      .subject_hash = verdict::testing::make_hash(0x20),
      .payload = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07},
      .discriminator = 0x09,
      .authority = verdict::testing::make_hash(0x80)};
}

verdict::schema::store_verdict_args_t make_args() {
  return verdict::schema::store_verdict_args_t{
      .token_address = "TOKEN123",
      .chain = "solana",
      .score = 870,
      .grade = "A-",
      .agent_count = 5,
      .tier = "gold",
      .scan_hash = verdict::testing::make_hash(0x33)};
}

}  // namespace

TEST(verdict_record, encode_places_fields_at_fixed_offsets) {
  auto record = make_record();
  auto bytes = verdict::schema::encoding::fixed::encode(record);

  ASSERT_EQ(bytes.size(), 73u);
  EXPECT_EQ(bytes[0], 0xfe);
  EXPECT_TRUE(std::equal(record.subject_hash.begin(), record.subject_hash.end(),
                         bytes.begin() + 1));
  EXPECT_TRUE(std::equal(record.payload.begin(), record.payload.end(),
                         bytes.begin() + 33));
  EXPECT_EQ(bytes[40], 0x09);
  EXPECT_TRUE(std::equal(record.authority.begin(), record.authority.end(),
                         bytes.begin() + 41));
}

TEST(verdict_record, read_reproduces_every_field) {
  auto record = make_record();
  auto bytes = verdict::schema::encoding::fixed::encode(record);
  auto decoded = verdict::schema::encoding::fixed::read(bytes);
  EXPECT_EQ(decoded, record);
}

TEST(verdict_record, random_records_round_trip_at_fixed_offsets) {
  auto engine = std::mt19937_64{0x73};
  auto fill = [&](auto& bytes) {
    for (auto& byte : bytes) {
      byte = static_cast<uint8_t>(engine());
    }
  };

  auto records = std::vector<verdict::schema::verdict_record_t>{};
  auto saturated = verdict::schema::verdict_record_t{};
  saturated.bump = 0xff;
  saturated.subject_hash.fill(0xff);
  saturated.payload.fill(0xff);
  saturated.discriminator = 0xff;
  saturated.authority.fill(0xff);
  records.push_back(saturated);
  records.push_back(verdict::schema::verdict_record_t{});

  constexpr auto kSamples = 4096;
  for (auto i = 0; i < kSamples; ++i) {
    auto record = verdict::schema::verdict_record_t{};
    record.bump = static_cast<uint8_t>(engine());
    fill(record.subject_hash);
    fill(record.payload);
    record.discriminator = static_cast<uint8_t>(engine());
    fill(record.authority);
    records.push_back(record);
  }
  records[2].bump = 0x00;
  records[3].bump = 0xff;

  for (const auto& record : records) {
    auto bytes = verdict::schema::encoding::fixed::encode(record);
    ASSERT_EQ(bytes.size(), verdict::schema::kVerdictRecordSize);
    EXPECT_EQ(verdict::schema::encoding::fixed::read(bytes), record);
    EXPECT_EQ(bytes[verdict::schema::kRecordBumpOffset], record.bump);
    EXPECT_TRUE(std::equal(
        record.subject_hash.begin(), record.subject_hash.end(),
        bytes.begin() + verdict::schema::kRecordSubjectHashOffset));
    EXPECT_TRUE(std::equal(record.payload.begin(), record.payload.end(),
                           bytes.begin() +
                               verdict::schema::kRecordPayloadOffset));
    EXPECT_EQ(bytes[verdict::schema::kRecordDiscriminatorOffset],
              record.discriminator);
    EXPECT_TRUE(std::equal(record.authority.begin(), record.authority.end(),
                           bytes.begin() +
                               verdict::schema::kRecordAuthorityOffset));
  }

  auto all_ones = verdict::schema::bytes_t(verdict::schema::kVerdictRecordSize,
                                           0xff);
  EXPECT_EQ(verdict::schema::encoding::fixed::read(all_ones), saturated);
}

TEST(verdict_record, write_rejects_slots_of_the_wrong_size) {
  auto record = make_record();
  for (const auto size : {0u, 40u, 72u, 74u}) {
    auto slot = verdict::schema::bytes_t(size, 0xAA);
    try {
      verdict::schema::encoding::fixed::write(
          record, std::span<uint8_t>{slot.data(), slot.size()});
      FAIL() << "expected slot_too_small for " << size << " bytes";
    } catch (const verdict::schema::program_error& error) {
      EXPECT_EQ(error.code(), verdict::schema::error_code::slot_too_small);
    }
    EXPECT_TRUE(std::ranges::all_of(slot, [](auto b) { return b == 0xAA; }));
  }
}

TEST(verdict_record, try_read_rejects_short_buffers) {
  auto bytes = verdict::schema::bytes_t(72, 0);
  EXPECT_FALSE(verdict::schema::encoding::fixed::try_read(bytes).has_value());
  EXPECT_THROW(verdict::schema::encoding::fixed::read(bytes),
               verdict::schema::program_error);
}

TEST(verdict_entry, type_tags_are_sha256_prefixes) {
  auto instruction =
      verdict::crypto::sha256(std::string_view{"global:store_verdict"});
  auto account = verdict::crypto::sha256(std::string_view{"account:Verdict"});
  EXPECT_TRUE(std::equal(verdict::schema::kStoreVerdictInstructionTag.begin(),
                         verdict::schema::kStoreVerdictInstructionTag.end(),
                         instruction.begin()));
  EXPECT_TRUE(std::equal(verdict::schema::kVerdictEntryTag.begin(),
                         verdict::schema::kVerdictEntryTag.end(),
                         account.begin()));
}

TEST(verdict_entry, instruction_data_is_tagged_and_decodable) {
  auto args = make_args();
  auto data = verdict::schema::encoding::scale::encode_store_verdict(args);
  ASSERT_GT(data.size(), 8u);
  EXPECT_TRUE(std::equal(verdict::schema::kStoreVerdictInstructionTag.begin(),
                         verdict::schema::kStoreVerdictInstructionTag.end(),
                         data.begin()));

  auto decoded = verdict::schema::encoding::scale::try_decode_store_verdict(
      verdict::schema::make_bytes_view(data));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, args);
}

TEST(verdict_entry, wrong_tag_or_truncated_body_is_rejected) {
  auto data = verdict::schema::encoding::scale::encode_store_verdict(make_args());
  auto wrong_tag = data;
  wrong_tag[0] ^= 0xff;
  EXPECT_FALSE(verdict::schema::encoding::scale::try_decode_store_verdict(
                   verdict::schema::make_bytes_view(wrong_tag))
                   .has_value());

  auto truncated = verdict::schema::bytes_t{data.begin(), data.begin() + 12};
  EXPECT_FALSE(verdict::schema::encoding::scale::try_decode_store_verdict(
                   verdict::schema::make_bytes_view(truncated))
                   .has_value());

  // A stored entry is not an instruction.
  auto entry = verdict::schema::encoding::scale::encode_verdict_entry(
      verdict::schema::verdict_entry_t{});
  EXPECT_FALSE(verdict::schema::encoding::scale::try_decode_store_verdict(
                   verdict::schema::make_bytes_view(entry))
                   .has_value());
}
