#pragma once

#include <stakehist/schema/primitives.hpp>
#include <stakehist/sysvar/layout.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace stakehist::sysvar {

/// Why a target epoch does or does not map to a record.
enum class range_status : uint32_t {
  available = 0,
  /// Current epoch is zero; nothing has been recorded yet.
  no_history = 1,
  /// Older than the retention window; presume fully activated/deactivated.
  aged_out = 2,
  /// Target is the current epoch or a future one. Caller misuse.
  not_yet_recorded = 3,
  offset_overflow = 4,
};

std::string_view to_string(range_status status);

/// Classify a lookup of `target_epoch` relative to `current_epoch`.
range_status classify_range(stakehist::schema::epoch_t current_epoch,
                            stakehist::schema::epoch_t target_epoch);

/// Byte range of the record for `target_epoch`, or std::nullopt when no
/// record can exist for it. Every status other than `available` maps to
/// std::nullopt; use classify_range to tell them apart.
std::optional<byte_range> compute_range(
    stakehist::schema::epoch_t current_epoch,
    stakehist::schema::epoch_t target_epoch);

}  // namespace stakehist::sysvar
