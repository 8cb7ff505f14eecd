#pragma once

#include <cstdint>

// Schema type: stake history entry.
// Aggregate stake state for one historical epoch. The three amounts are opaque
// payload; no relation between them is enforced.
namespace stakehist::schema {

struct stake_history_entry final {
  uint64_t effective{};
  uint64_t activating{};
  uint64_t deactivating{};

  friend bool operator==(const stake_history_entry&,
                         const stake_history_entry&) = default;
};

}  // namespace stakehist::schema
