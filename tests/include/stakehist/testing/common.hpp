#pragma once

#include <stakehist/schema/encoding/scale/encoder.hpp>
#include <stakehist/schema/primitives.hpp>
#include <stakehist/schema/stake_history_entry.hpp>
#include <stakehist/sysvar/layout.hpp>
#include <stakehist/sysvar/record_decoder.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

namespace stakehist::testing {

using encoder_t = stakehist::schema::encoding::encoder<
    stakehist::schema::encoding::scale_encoder_tag>;

inline stakehist::schema::stake_history_entry unique_entry_for_epoch(
    const uint64_t epoch) {
  return stakehist::schema::stake_history_entry{
      .effective = epoch * 5, .activating = epoch * 2, .deactivating = epoch * 3};
}

inline stakehist::schema::bytes_t encode_record(
    const stakehist::sysvar::stake_history_record& record) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{record.epoch, record.entry.effective,
                                   record.entry.activating,
                                   record.entry.deactivating});
}

/// Serialize records as the sysvar account lays them out: a u64 count
/// followed by the records in the given order.
inline stakehist::schema::bytes_t serialize_history(
    const std::vector<stakehist::sysvar::stake_history_record>& records) {
  auto encoder = encoder_t{};
  auto out = encoder.encode(static_cast<uint64_t>(records.size()));
  for (const auto& record : records) {
    auto encoded = encode_record(record);
    out.insert(std::end(out), std::begin(encoded), std::end(encoded));
  }
  return out;
}

/// Records for every epoch in [0, current_epoch) that is still inside the
/// retention window, newest first, each holding unique_entry_for_epoch.
inline std::vector<stakehist::sysvar::stake_history_record> make_history(
    const uint64_t current_epoch) {
  auto records = std::vector<stakehist::sysvar::stake_history_record>{};
  auto oldest = stakehist::sysvar::saturating_sub(current_epoch,
                                                  stakehist::sysvar::kMaxEntries);
  for (auto epoch = current_epoch; epoch > oldest; --epoch) {
    records.push_back(stakehist::sysvar::stake_history_record{
        .epoch = epoch - 1, .entry = unique_entry_for_epoch(epoch - 1)});
  }
  return records;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace stakehist::testing
