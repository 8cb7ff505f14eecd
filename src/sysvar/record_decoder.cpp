#include <spdlog/spdlog.h>
#include <stakehist/common/critical.hpp>
#include <stakehist/schema/encoding/scale/encoder.hpp>
#include <stakehist/schema/enum_string.hpp>
#include <stakehist/sysvar/layout.hpp>
#include <stakehist/sysvar/record_decoder.hpp>

#include <array>
#include <tuple>
#include <utility>

namespace stakehist::sysvar {

namespace {

using encoder_t = stakehist::schema::encoding::encoder<
    stakehist::schema::encoding::scale_encoder_tag>;

// Fixed-width SCALE integers are little-endian, so four u64 fields are
// exactly one record.
using record_fields_t = std::tuple<uint64_t, uint64_t, uint64_t, uint64_t>;

constexpr auto kRecordStatusNames =
    std::array<std::pair<std::string_view, record_status>, 3>{{
        {"ok", record_status::ok},
        {"size_mismatch", record_status::size_mismatch},
        {"epoch_mismatch", record_status::epoch_mismatch},
    }};

}  // namespace

std::string_view to_string(const record_status status) {
  return stakehist::schema::to_string(status, kRecordStatusNames)
      .value_or("unknown");
}

std::optional<stake_history_record> try_parse_record(
    const stakehist::schema::bytes_view_t& raw) {
  if (raw.size() != kRecordSize) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<record_fields_t>(raw);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  auto [epoch, effective, activating, deactivating] = decoded.value();
  return stake_history_record{
      .epoch = epoch,
      .entry = stakehist::schema::stake_history_entry{
          .effective = effective,
          .activating = activating,
          .deactivating = deactivating}};
}

record_status verify_record(const stakehist::schema::bytes_view_t& raw,
                            const stakehist::schema::epoch_t expected_epoch) {
  auto record = try_parse_record(raw);
  if (!record) {
    return record_status::size_mismatch;
  }
  if (record->epoch != expected_epoch) {
    return record_status::epoch_mismatch;
  }
  return record_status::ok;
}

std::optional<uint64_t> try_parse_record_count(
    const stakehist::schema::bytes_view_t& account) {
  if (account.size() < kCountPrefixSize) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto count = encoder.try_decode<uint64_t>(account.first(kCountPrefixSize));
  if (!count.has_value() || count.value() > kMaxEntries) {
    return std::nullopt;
  }
  auto expected_size = record_offset(count.value());
  if (!expected_size || *expected_size != account.size()) {
    return std::nullopt;
  }
  return count.value();
}

stakehist::schema::stake_history_entry decode_record(
    const stakehist::schema::bytes_view_t& raw,
    const stakehist::schema::epoch_t expected_epoch) {
  auto record = try_parse_record(raw);
  if (!record) {
    spdlog::error("Stake history record has {} bytes, expected {}",
                  raw.size(), kRecordSize);
    stakehist::common::critical("malformed stake history record");
  }
  if (record->epoch != expected_epoch) {
    spdlog::error("Stake history record holds epoch {}, expected epoch {}",
                  record->epoch, expected_epoch);
    stakehist::common::critical(
        "stake history skipped an epoch or its layout changed");
  }
  return record->entry;
}

}  // namespace stakehist::sysvar
