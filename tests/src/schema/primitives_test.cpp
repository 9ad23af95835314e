#include <gtest/gtest.h>
#include <verdict/schema/error_code.hpp>
#include <verdict/schema/primitives.hpp>
#include <verdict/schema/program_error.hpp>
#include <verdict/schema/sysvars.hpp>

#include <string>
#include <string_view>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = verdict::schema::bytes_t(32, 0xAB);
  auto hash = verdict::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = verdict::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length) {
  EXPECT_FALSE(verdict::schema::try_make_hash32("0x0102").has_value());
  EXPECT_FALSE(verdict::schema::try_make_hash32("zz").has_value());
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = verdict::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = verdict::schema::to_hex(payload);
  EXPECT_EQ(encoded, "010203feff");
  EXPECT_EQ(verdict::schema::from_hex(encoded), payload);
  EXPECT_FALSE(verdict::schema::try_from_hex("abc").has_value());
}

TEST(primitives, base58_matches_ledger_identities) {
  auto loader = verdict::schema::make_hash32(std::string_view{
      "02a8f6914e88a1b0e210153ef763ae2b00c2b93d16c124d2c0537a1004800000"});
  EXPECT_EQ(verdict::schema::to_base58(loader),
            "BPFLoaderUpgradeab1e11111111111111111111111");

  auto zero = verdict::schema::make_zero_hash();
  EXPECT_EQ(verdict::schema::to_base58(zero),
            "11111111111111111111111111111111");
}

TEST(primitives, try_parse_pubkey_accepts_base58_and_hex) {
  auto from_base58 = verdict::schema::try_parse_pubkey(
      "3i6GVUgshmbymqrsvxWQMX98yKzqLxNRUHEhtwRBZ35p");
  auto from_hex = verdict::schema::try_parse_pubkey(
      "0x283e247d5da5bbab91fef8f0858e58c11b55fafb5ca1084450c0e0f23140e4ff");
  ASSERT_TRUE(from_base58.has_value());
  ASSERT_TRUE(from_hex.has_value());
  EXPECT_EQ(*from_base58, *from_hex);

  EXPECT_FALSE(verdict::schema::try_parse_pubkey("0OIl").has_value());
  EXPECT_FALSE(verdict::schema::try_parse_pubkey("2").has_value());
}

TEST(primitives, error_names_and_codes_are_stable) {
  using verdict::schema::error_code;
  EXPECT_EQ(verdict::schema::error_name(error_code::slot_already_exists),
            "slot_already_exists");
  EXPECT_EQ(verdict::schema::to_code(error_code::malformed_input), 10u);
  EXPECT_EQ(verdict::schema::to_code(error_code::slot_too_small), 16u);

  auto error = verdict::schema::program_error{error_code::address_mismatch,
                                              "expected A, got B"};
  EXPECT_EQ(error.code(), error_code::address_mismatch);
  EXPECT_EQ(std::string{error.what()}, "address_mismatch: expected A, got B");
}

TEST(primitives, rent_minimum_balance_covers_overhead) {
  auto rent = verdict::schema::rent_t{};
  EXPECT_EQ(rent.minimum_balance(73), 1'398'960u);
  EXPECT_EQ(rent.minimum_balance(0), 890'880u);
}
