#pragma once

#include <stakehist/schema/primitives.hpp>

#include <cstdint>
#include <limits>
#include <optional>

// Serialized layout of the stake history sysvar account:
//
//   offset          size  field
//   0               8     record count (u64 LE)
//   8 + 32*i        8     record[i].epoch (u64 LE)
//   16 + 32*i       8     record[i].effective (u64 LE)
//   24 + 32*i       8     record[i].activating (u64 LE)
//   32 + 32*i       8     record[i].deactivating (u64 LE)
//
// Records are ordered newest first and record i holds epoch (newest - i).
namespace stakehist::sysvar {

/// Retention window. Warmup and cooldown never need more epochs than this.
inline constexpr uint64_t kMaxEntries = 512;
inline constexpr uint64_t kCountPrefixSize = sizeof(uint64_t);
inline constexpr uint64_t kEpochFieldSize = sizeof(stakehist::schema::epoch_t);
inline constexpr uint64_t kAmountFieldSize = sizeof(uint64_t);
inline constexpr uint64_t kRecordSize = kEpochFieldSize + (3 * kAmountFieldSize);

static_assert(kRecordSize == 32);

/// Upper bound on the serialized account size.
constexpr uint64_t total_size() {
  return kCountPrefixSize + (kMaxEntries * kRecordSize);
}

/// Byte range of one record inside the account data.
struct byte_range final {
  uint64_t offset{};
  uint64_t length{kRecordSize};

  friend bool operator==(const byte_range&, const byte_range&) = default;
};

constexpr std::optional<uint64_t> checked_add(const uint64_t lhs,
                                              const uint64_t rhs) {
  if (lhs > std::numeric_limits<uint64_t>::max() - rhs) {
    return std::nullopt;
  }
  return lhs + rhs;
}

constexpr std::optional<uint64_t> checked_mul(const uint64_t lhs,
                                              const uint64_t rhs) {
  if (lhs != 0 && rhs > std::numeric_limits<uint64_t>::max() / lhs) {
    return std::nullopt;
  }
  return lhs * rhs;
}

constexpr std::optional<uint64_t> checked_sub(const uint64_t lhs,
                                              const uint64_t rhs) {
  if (rhs > lhs) {
    return std::nullopt;
  }
  return lhs - rhs;
}

constexpr uint64_t saturating_sub(const uint64_t lhs, const uint64_t rhs) {
  return rhs > lhs ? 0 : lhs - rhs;
}

/// Offset of the record `epoch_delta` positions behind the newest one.
constexpr std::optional<uint64_t> record_offset(const uint64_t epoch_delta) {
  auto scaled = checked_mul(epoch_delta, kRecordSize);
  if (!scaled) {
    return std::nullopt;
  }
  return checked_add(*scaled, kCountPrefixSize);
}

}  // namespace stakehist::sysvar
