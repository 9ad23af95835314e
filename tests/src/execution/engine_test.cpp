#include <gtest/gtest.h>
#include <verdict/execution/engine.hpp>
#include <verdict/execution/invoke_context.hpp>
#include <verdict/schema/encoding/scale/encoder.hpp>
#include <verdict/schema/program_error.hpp>
#include <verdict/testing/common.hpp>
#include <verdict/testing/engine_fixture.hpp>

#include <functional>
#include <limits>
#include <memory>
#include <utility>

namespace {

using verdict::schema::error_code;
using verdict::testing::memory_engine_t;

/// Program whose behaviour is supplied by the test.
class scripted_program final : public verdict::execution::program {
 public:
  using body_t = std::function<void(verdict::execution::invoke_context&,
                                    const verdict::schema::bytes_view_t&)>;

  explicit scripted_program(body_t body) : body_{std::move(body)} {}

  void process(verdict::execution::invoke_context& context,
               const verdict::schema::bytes_view_t& data) override {
    body_(context, data);
  }

 private:
  body_t body_;
};

verdict::schema::pubkey_t scripted_id() {
  return verdict::testing::make_hash(0xc0);
}

class engine_test : public ::testing::Test {
 protected:
  engine_test()
      : engine_{verdict::storage::make_storage<
            verdict::storage::memory_storage_tag>("")},
        caller_{verdict::testing::make_signer(0x21)},
        other_{verdict::testing::make_signer(0x22)} {
    engine_.credit(caller_.public_key, 1'000'000);
    engine_.credit(other_.public_key, 500);
  }

  void install(scripted_program::body_t body) {
    engine_.register_program(scripted_id(),
                             std::make_shared<scripted_program>(std::move(body)));
  }

  verdict::schema::instruction_t make_instruction(
      std::vector<verdict::schema::account_meta_t> accounts) {
    auto instruction = verdict::schema::instruction_t{};
    instruction.program_id = scripted_id();
    instruction.accounts = std::move(accounts);
    return instruction;
  }

  verdict::schema::account_meta_t meta(const verdict::crypto::keypair_t& key,
                                       const bool signer,
                                       const bool writable) {
    return verdict::schema::account_meta_t{
        .key = key.public_key, .is_signer = signer, .is_writable = writable};
  }

  memory_engine_t engine_;
  verdict::crypto::keypair_t caller_;
  verdict::crypto::keypair_t other_;
};

}  // namespace

TEST_F(engine_test, credit_updates_balance_height_and_root) {
  auto before = engine_.info();
  engine_.credit(caller_.public_key, 25);
  auto after = engine_.info();
  EXPECT_EQ(engine_.get_slot(caller_.public_key).lamports, 1'000'025u);
  EXPECT_EQ(after.height, before.height + 1);
  EXPECT_NE(after.state_root, before.state_root);
  EXPECT_EQ(engine_.state_root(), after.state_root);
}

TEST_F(engine_test, credit_overflow_is_rejected_without_committing) {
  auto before = engine_.info();
  try {
    engine_.credit(caller_.public_key,
                   std::numeric_limits<verdict::schema::lamports_t>::max());
    FAIL() << "expected overflow";
  } catch (const verdict::schema::program_error& error) {
    EXPECT_EQ(error.code(), error_code::malformed_input);
  }
  EXPECT_EQ(engine_.get_slot(caller_.public_key).lamports, 1'000'000u);
  EXPECT_EQ(engine_.info().height, before.height);
  EXPECT_EQ(engine_.state_root(), before.state_root);

  auto fresh = verdict::testing::make_hash(0x78);
  engine_.credit(fresh, std::numeric_limits<verdict::schema::lamports_t>::max());
  EXPECT_EQ(engine_.get_slot(fresh).lamports,
            std::numeric_limits<verdict::schema::lamports_t>::max());
}

TEST(engine_commit, checkpoint_is_stored_with_the_slots_it_covers) {
  auto storage =
      verdict::storage::make_storage<verdict::storage::memory_storage_tag>("");
  auto engine = memory_engine_t{storage};
  engine.credit(verdict::testing::make_hash(0x41), 10);
  engine.credit(verdict::testing::make_hash(0x40), 20);

  auto stored = storage.load_committed_state();
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->height, engine.info().height);
  EXPECT_EQ(stored->state_root, engine.state_root());

  auto reopened = memory_engine_t{storage};
  EXPECT_EQ(reopened.state_root(), engine.state_root());
  EXPECT_EQ(reopened.get_slot(verdict::testing::make_hash(0x40)).lamports, 20u);
}

TEST_F(engine_test, missing_slot_reads_as_default) {
  auto slot = engine_.get_slot(verdict::testing::make_hash(0x77));
  EXPECT_TRUE(verdict::schema::is_vacant(slot));
}

TEST_F(engine_test, rejects_unsupported_version_and_empty_messages) {
  install([](auto&, const auto&) {});
  auto message = verdict::schema::message_t{};
  message.version = 2;
  message.instructions.push_back(make_instruction({}));
  auto result = engine_.process_transaction(
      verdict::testing::make_signed_transaction(message, {caller_}));
  EXPECT_EQ(result.code,
            verdict::schema::to_code(error_code::unsupported_transaction_version));

  auto empty = engine_.process_transaction(verdict::testing::make_signed_transaction(
      verdict::schema::message_t{}, {caller_}));
  EXPECT_EQ(empty.code, verdict::schema::to_code(error_code::invalid_transaction));
}

TEST_F(engine_test, raw_transactions_must_decode) {
  auto garbage = verdict::schema::bytes_t{0xff, 0x01};
  auto result =
      engine_.process_transaction(verdict::schema::make_bytes_view(garbage));
  EXPECT_EQ(result.code, verdict::schema::to_code(error_code::invalid_transaction));
  EXPECT_EQ(result.log, "invalid_transaction");

  install([](auto& context, const auto&) { context.log("ran"); });
  auto tx = verdict::testing::make_signed_transaction(
      make_instruction({meta(caller_, true, true)}), {caller_});
  auto encoded = verdict::schema::encoding::scale_encoder_t{}.encode(tx);
  auto decoded =
      engine_.process_transaction(verdict::schema::make_bytes_view(encoded));
  EXPECT_EQ(decoded.code, 0u);
  ASSERT_EQ(decoded.logs.size(), 1u);
  EXPECT_EQ(decoded.logs[0], "ran");
}

TEST_F(engine_test, unknown_program_is_rejected) {
  auto result = engine_.process_transaction(verdict::testing::make_signed_transaction(
      make_instruction({meta(caller_, true, true)}), {caller_}));
  EXPECT_EQ(result.code, verdict::schema::to_code(error_code::unknown_program));
}

TEST_F(engine_test, tampered_signature_fails_the_whole_transaction) {
  auto ran = false;
  install([&](auto&, const auto&) { ran = true; });
  auto tx = verdict::testing::make_signed_transaction(
      make_instruction({meta(caller_, true, true)}), {caller_});
  tx.signatures[0].signature[0] ^= 0x01;
  auto result = engine_.process_transaction(tx);
  EXPECT_EQ(result.code,
            verdict::schema::to_code(error_code::signature_verification_failed));
  EXPECT_FALSE(ran);
}

TEST_F(engine_test, empty_signature_verifier_keeps_checking_signatures) {
  install([](auto&, const auto&) {});
  engine_.set_signature_verifier({});

  auto tx = verdict::testing::make_signed_transaction(
      make_instruction({meta(caller_, true, true)}), {caller_});
  EXPECT_EQ(engine_.process_transaction(tx).code, 0u);

  tx.signatures[0].signature[0] ^= 0x01;
  EXPECT_EQ(engine_.process_transaction(tx).code,
            verdict::schema::to_code(error_code::signature_verification_failed));
}

TEST_F(engine_test, signer_flag_without_signature_is_not_a_signer) {
  auto observed = true;
  install([&](auto& context, const auto&) {
    observed = context.is_signer(other_.public_key);
  });
  auto result = engine_.process_transaction(verdict::testing::make_signed_transaction(
      make_instruction({meta(caller_, true, true), meta(other_, true, true)}),
      {caller_}));
  EXPECT_EQ(result.code, 0u);
  EXPECT_FALSE(observed);
}

TEST_F(engine_test, minting_lamports_is_unbalanced) {
  install([&](auto& context, const auto&) {
    context.mutable_slot(caller_.public_key).lamports += 1;
  });
  auto root = engine_.state_root();
  auto result = engine_.process_transaction(verdict::testing::make_signed_transaction(
      make_instruction({meta(caller_, true, true)}), {caller_}));
  EXPECT_EQ(result.code,
            verdict::schema::to_code(error_code::unbalanced_transaction));
  EXPECT_EQ(engine_.state_root(), root);
}

TEST_F(engine_test, foreign_slot_changes_are_rejected) {
  // The caller's slot is owned by the system program, not the script.
  install([&](auto& context, const auto&) {
    context.mutable_slot(caller_.public_key).data = {0x01};
  });
  auto result = engine_.process_transaction(verdict::testing::make_signed_transaction(
      make_instruction({meta(caller_, true, true)}), {caller_}));
  EXPECT_EQ(result.code,
            verdict::schema::to_code(error_code::external_slot_modified));

  // Debiting a foreign slot is rejected even when the total balances out.
  install([&](auto& context, const auto&) {
    context.mutable_slot(caller_.public_key).lamports -= 10;
    context.mutable_slot(other_.public_key).lamports += 10;
  });
  result = engine_.process_transaction(verdict::testing::make_signed_transaction(
      make_instruction({meta(caller_, true, true), meta(other_, false, true)}),
      {caller_}));
  EXPECT_EQ(result.code,
            verdict::schema::to_code(error_code::external_slot_modified));
  EXPECT_EQ(engine_.get_slot(caller_.public_key).lamports, 1'000'000u);
}

TEST_F(engine_test, read_only_slots_cannot_change) {
  install([&](auto& context, const auto&) {
    auto target = verdict::testing::make_hash(0x55);
    context.create_slot(
        verdict::execution::system_program::create_slot_request_t{
            .funder = caller_.public_key,
            .target = target,
            .lamports = 10,
            .space = 0,
            .owner = scripted_id()},
        {});
  });
  auto target = verdict::schema::account_meta_t{
      .key = verdict::testing::make_hash(0x55),
      .is_signer = false,
      .is_writable = true};
  auto result = engine_.process_transaction(verdict::testing::make_signed_transaction(
      make_instruction({meta(caller_, true, false), target}), {caller_}));
  EXPECT_EQ(result.code, verdict::schema::to_code(error_code::malformed_input));
}

TEST_F(engine_test, failure_discards_every_instruction_of_the_transaction) {
  auto created = verdict::testing::make_signer(0x30);
  install([&](auto& context, const auto& data) {
    if (data.empty()) {
      context.create_slot(
          verdict::execution::system_program::create_slot_request_t{
              .funder = caller_.public_key,
              .target = created.public_key,
              .lamports = 1000,
              .space = 4,
              .owner = scripted_id()},
          {});
      return;
    }
    throw verdict::schema::program_error{error_code::malformed_input, "boom"};
  });

  auto first = make_instruction(
      {meta(caller_, true, true), meta(created, true, true)});
  auto second = first;
  second.data = {0x01};
  auto message = verdict::schema::message_t{};
  message.instructions = {first, second};

  auto root = engine_.state_root();
  auto result = engine_.process_transaction(
      verdict::testing::make_signed_transaction(message, {caller_, created}));
  EXPECT_EQ(result.code, verdict::schema::to_code(error_code::malformed_input));
  EXPECT_TRUE(result.created_slots.empty());
  EXPECT_TRUE(verdict::schema::is_vacant(engine_.get_slot(created.public_key)));
  EXPECT_EQ(engine_.get_slot(caller_.public_key).lamports, 1'000'000u);
  EXPECT_EQ(engine_.state_root(), root);

  // The first instruction alone commits.
  auto single = engine_.process_transaction(
      verdict::testing::make_signed_transaction(first, {caller_, created}));
  EXPECT_EQ(single.code, 0u);
  ASSERT_EQ(single.created_slots.size(), 1u);
  EXPECT_EQ(single.created_slots[0], created.public_key);
  EXPECT_EQ(engine_.get_slot(created.public_key).data.size(), 4u);
  EXPECT_EQ(engine_.get_slot(caller_.public_key).lamports, 999'000u);
}

TEST_F(engine_test, sysvars_are_read_at_execution_time) {
  auto seen = verdict::schema::lamports_t{};
  auto seen_time = verdict::schema::unix_timestamp_t{};
  install([&](auto& context, const auto&) {
    seen = context.rent().lamports_per_byte_year;
    seen_time = context.clock().unix_timestamp;
  });
  auto run = [&] {
    return engine_.process_transaction(verdict::testing::make_signed_transaction(
        make_instruction({meta(caller_, true, true)}), {caller_}));
  };

  run();
  EXPECT_EQ(seen, 3480u);

  engine_.set_rent(verdict::schema::rent_t{.lamports_per_byte_year = 10,
                                           .exemption_threshold = 1.0});
  engine_.set_clock(
      verdict::schema::clock_sysvar_t{.slot = 9, .unix_timestamp = 1234});
  run();
  EXPECT_EQ(seen, 10u);
  EXPECT_EQ(seen_time, 1234);
}

TEST(engine_relaxed_crypto, accepts_unverified_signatures) {
  auto engine = memory_engine_t{
      verdict::storage::make_storage<verdict::storage::memory_storage_tag>(""),
      verdict::execution::engine_config{.require_strict_crypto = false}};
  auto observed = false;
  engine.register_program(
      scripted_id(), std::make_shared<scripted_program>(
                         [&](auto& context, const auto&) {
                           observed = context.is_signer(
                               verdict::testing::make_hash(0x01));
                         }));
  auto tx = verdict::schema::transaction_t{};
  auto instruction = verdict::schema::instruction_t{};
  instruction.program_id = scripted_id();
  instruction.accounts = {verdict::schema::account_meta_t{
      .key = verdict::testing::make_hash(0x01),
      .is_signer = true,
      .is_writable = false}};
  tx.message.instructions.push_back(instruction);
  tx.signatures.push_back(verdict::schema::signature_entry_t{
      .signer = verdict::testing::make_hash(0x01)});
  EXPECT_EQ(engine.process_transaction(tx).code, 0u);
  EXPECT_TRUE(observed);
}

TEST(engine_persistence, rocksdb_engine_resumes_from_committed_state) {
  auto path = verdict::testing::make_db_path("verdict_engine_resume");
  auto key = verdict::testing::make_hash(0x61);
  auto root = verdict::schema::hash32_t{};
  {
    auto engine = verdict::execution::engine<verdict::storage::rocksdb_storage_tag>{
        verdict::storage::make_storage<verdict::storage::rocksdb_storage_tag>(
            path)};
    engine.credit(key, 77);
    root = engine.state_root();
  }
  {
    auto engine = verdict::execution::engine<verdict::storage::rocksdb_storage_tag>{
        verdict::storage::make_storage<verdict::storage::rocksdb_storage_tag>(
            path)};
    EXPECT_EQ(engine.state_root(), root);
    EXPECT_EQ(engine.info().height, 1u);
    EXPECT_EQ(engine.get_slot(key).lamports, 77u);
  }
  verdict::testing::remove_path(path);
}
