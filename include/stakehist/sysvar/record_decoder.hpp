#pragma once

#include <stakehist/schema/primitives.hpp>
#include <stakehist/schema/stake_history_entry.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace stakehist::sysvar {

/// One decoded record: the epoch it claims plus its entry.
struct stake_history_record final {
  stakehist::schema::epoch_t epoch{};
  stakehist::schema::stake_history_entry entry;

  friend bool operator==(const stake_history_record&,
                         const stake_history_record&) = default;
};

enum class record_status : uint32_t {
  ok = 0,
  size_mismatch = 1,
  epoch_mismatch = 2,
};

std::string_view to_string(record_status status);

/// Parse a raw record, or std::nullopt when `raw` is not exactly one record.
std::optional<stake_history_record> try_parse_record(
    const stakehist::schema::bytes_view_t& raw);

/// Check `raw` is one record holding `expected_epoch`.
record_status verify_record(const stakehist::schema::bytes_view_t& raw,
                            stakehist::schema::epoch_t expected_epoch);

/// Number of records in a whole serialized account, or std::nullopt when the
/// count prefix is missing, exceeds the retention window, or disagrees with
/// the data length.
std::optional<uint64_t> try_parse_record_count(
    const stakehist::schema::bytes_view_t& account);

/// Decode the entry for `expected_epoch` from a record read at the offset
/// computed for that epoch.
///
/// A record holding any other epoch means the history skipped an epoch or the
/// account layout changed. That is not a lookup miss: it is reported through
/// stakehist::common::critical and never returns.
stakehist::schema::stake_history_entry decode_record(
    const stakehist::schema::bytes_view_t& raw,
    stakehist::schema::epoch_t expected_epoch);

}  // namespace stakehist::sysvar
