#include <gtest/gtest.h>
#include <stakehist/sysvar/record_decoder.hpp>
#include <stakehist/testing/common.hpp>

#include <csignal>
#include <vector>

using stakehist::sysvar::record_status;
using stakehist::sysvar::stake_history_record;

namespace {

stake_history_record make_record(const uint64_t epoch) {
  return stake_history_record{
      .epoch = epoch, .entry = stakehist::testing::unique_entry_for_epoch(epoch)};
}

}  // namespace

TEST(record_decoder, fields_are_little_endian_in_declared_order) {
  auto raw = stakehist::schema::from_hex(
      "0100000000000000"
      "0200000000000000"
      "0300000000000000"
      "0400000000000000");
  auto record = stakehist::sysvar::try_parse_record(raw);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->epoch, 1u);
  EXPECT_EQ(record->entry.effective, 2u);
  EXPECT_EQ(record->entry.activating, 3u);
  EXPECT_EQ(record->entry.deactivating, 4u);
}

TEST(record_decoder, test_encoder_matches_account_layout) {
  auto raw = stakehist::testing::encode_record(stake_history_record{
      .epoch = 0x0102030405060708,
      .entry = {.effective = 1, .activating = 2, .deactivating = 3}});
  ASSERT_EQ(raw.size(), 32u);
  EXPECT_EQ(stakehist::schema::to_hex(raw),
            "0807060504030201"
            "0100000000000000"
            "0200000000000000"
            "0300000000000000");
}

TEST(record_decoder, decode_returns_entry_for_expected_epoch) {
  auto raw = stakehist::testing::encode_record(make_record(998));
  EXPECT_EQ(stakehist::sysvar::verify_record(raw, 998), record_status::ok);
  EXPECT_EQ(stakehist::sysvar::decode_record(raw, 998),
            stakehist::testing::unique_entry_for_epoch(998));
}

TEST(record_decoder, decode_handles_maximum_values) {
  auto record = stake_history_record{
      .epoch = UINT64_MAX,
      .entry = {.effective = UINT64_MAX,
                .activating = UINT64_MAX,
                .deactivating = UINT64_MAX}};
  auto raw = stakehist::testing::encode_record(record);
  EXPECT_EQ(stakehist::sysvar::decode_record(raw, UINT64_MAX), record.entry);
}

TEST(record_decoder, verify_reports_wrong_epoch) {
  auto raw = stakehist::testing::encode_record(make_record(5));
  EXPECT_EQ(stakehist::sysvar::verify_record(raw, 6),
            record_status::epoch_mismatch);
  EXPECT_EQ(stakehist::sysvar::to_string(record_status::epoch_mismatch),
            "epoch_mismatch");
}

TEST(record_decoder, verify_reports_wrong_size) {
  auto raw = stakehist::testing::encode_record(make_record(5));
  raw.pop_back();
  EXPECT_EQ(stakehist::sysvar::verify_record(raw, 5),
            record_status::size_mismatch);
  EXPECT_FALSE(stakehist::sysvar::try_parse_record(raw).has_value());

  auto longer = stakehist::testing::encode_record(make_record(5));
  longer.push_back(0);
  EXPECT_EQ(stakehist::sysvar::verify_record(longer, 5),
            record_status::size_mismatch);
}

TEST(record_decoder, record_count_matches_serialized_account) {
  auto records = stakehist::testing::make_history(600);
  auto account = stakehist::testing::serialize_history(records);
  EXPECT_EQ(stakehist::sysvar::try_parse_record_count(account), 512u);

  auto empty = stakehist::testing::serialize_history({});
  EXPECT_EQ(stakehist::sysvar::try_parse_record_count(empty), 0u);
}

TEST(record_decoder, record_count_rejects_inconsistent_accounts) {
  auto records = stakehist::testing::make_history(10);
  auto account = stakehist::testing::serialize_history(records);

  auto truncated = account;
  truncated.pop_back();
  EXPECT_FALSE(stakehist::sysvar::try_parse_record_count(truncated).has_value());

  auto padded = account;
  padded.resize(padded.size() + 32);
  EXPECT_FALSE(stakehist::sysvar::try_parse_record_count(padded).has_value());

  auto no_prefix = stakehist::schema::bytes_t{0x01, 0x00};
  EXPECT_FALSE(stakehist::sysvar::try_parse_record_count(no_prefix).has_value());

  // 513 records claimed and present is still beyond the window.
  auto oversized = stakehist::testing::serialize_history(
      std::vector<stake_history_record>(513, make_record(1)));
  EXPECT_FALSE(stakehist::sysvar::try_parse_record_count(oversized).has_value());
}

TEST(record_decoder_death, epoch_mismatch_is_fatal) {
  auto raw = stakehist::testing::encode_record(make_record(7));
  EXPECT_EXIT(stakehist::sysvar::decode_record(raw, 8),
              ::testing::KilledBySignal(SIGTERM), "");
}

TEST(record_decoder_death, truncated_record_is_fatal) {
  auto raw = stakehist::testing::encode_record(make_record(7));
  raw.resize(16);
  EXPECT_EXIT(stakehist::sysvar::decode_record(raw, 7),
              ::testing::KilledBySignal(SIGTERM), "");
}
