#pragma once

#include <spdlog/spdlog.h>
#include <stakehist/schema/primitives.hpp>
#include <stakehist/schema/read_error_code.hpp>
#include <stakehist/schema/stake_history_entry.hpp>
#include <stakehist/storage/storage.hpp>
#include <stakehist/sysvar/layout.hpp>
#include <stakehist/sysvar/offset_calculator.hpp>
#include <stakehist/sysvar/record_decoder.hpp>
#include <stakehist/sysvar/sysvar_id.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace stakehist::sysvar {

/// Everything a single lookup found out. `entry` is set exactly when `range`
/// is range_status::available and `read` is read_error_code::ok.
struct lookup_result final {
  range_status range{range_status::available};
  stakehist::schema::read_error_code read{stakehist::schema::read_error_code::ok};
  std::optional<stakehist::schema::stake_history_entry> entry;
};

/// Name of the step that stopped the lookup: the range status when the epoch
/// has no record, otherwise the read outcome.
inline std::string_view to_string(const lookup_result& result) {
  if (result.range != range_status::available) {
    return to_string(result.range);
  }
  return stakehist::schema::to_string(result.read);
}

/// Random access to single stake history entries without loading the whole
/// sysvar account.
///
/// Lookups resolve relative to the epoch the accessor was built with. The
/// accessor holds no mutable state, so concurrent lookups are safe whenever
/// the storage backend's `read` is. There is no default construction: the
/// real current epoch is always required.
template <typename Library>
class stake_history_sysvar final {
 public:
  stake_history_sysvar(stakehist::schema::epoch_t current_epoch,
                       const stakehist::storage::storage<Library>& storage)
      : current_epoch_{current_epoch}, storage_{storage} {}

  stake_history_sysvar(stakehist::schema::epoch_t current_epoch,
                       stakehist::storage::storage<Library>&& storage) = delete;

  stakehist::schema::epoch_t current_epoch() const { return current_epoch_; }

  /// Why `target_epoch` does or does not have a record.
  range_status status(stakehist::schema::epoch_t target_epoch) const {
    return classify_range(current_epoch_, target_epoch);
  }

  /// Entry for `target_epoch`, or std::nullopt when there is no history for
  /// it or the account cannot be read here.
  ///
  /// Aged out epochs should be treated as fully activated or deactivated.
  /// A record that holds the wrong epoch is fatal, see decode_record.
  std::optional<stakehist::schema::stake_history_entry> get_entry(
      stakehist::schema::epoch_t target_epoch) const {
    return lookup(target_epoch).entry;
  }

  /// Like get_entry, but also reports why no entry was produced.
  lookup_result lookup(stakehist::schema::epoch_t target_epoch) const;

 private:
  stakehist::schema::epoch_t current_epoch_;
  const stakehist::storage::storage<Library>& storage_;
};

template <typename Library>
lookup_result stake_history_sysvar<Library>::lookup(
    const stakehist::schema::epoch_t target_epoch) const {
  auto result = lookup_result{};
  auto range = compute_range(current_epoch_, target_epoch);
  if (!range) {
    result.range = status(target_epoch);
    spdlog::debug("No stake history for epoch {} at epoch {}: {}",
                  target_epoch, current_epoch_, to_string(result.range));
    return result;
  }

  auto buffer = std::array<uint8_t, kRecordSize>{};
  result.read = storage_.read(buffer, id(), range->offset, range->length);
  if (result.read != stakehist::schema::read_error_code::ok) {
    spdlog::debug("Stake history read at offset {} failed: {}", range->offset,
                  stakehist::schema::to_string(result.read));
    return result;
  }

  result.entry =
      decode_record(stakehist::schema::bytes_view_t{buffer}, target_epoch);
  return result;
}

}  // namespace stakehist::sysvar
