#pragma once

#include <stakehist/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

namespace stakehist::sysvar {

inline constexpr auto kStakeHistoryIdBase58 =
    std::string_view{"SysvarStakeHistory1111111111111111111111111"};

/// Raw bytes of kStakeHistoryIdBase58.
inline constexpr auto kStakeHistoryId = stakehist::schema::pubkey_t{
    0x06, 0xa7, 0xd5, 0x17, 0x19, 0x35, 0x84, 0xd0, 0xfe, 0xed, 0x9b,
    0xb3, 0x43, 0x1d, 0x13, 0x20, 0x6b, 0xe5, 0x44, 0x28, 0x1b, 0x57,
    0xb8, 0x56, 0x6c, 0xc5, 0x37, 0x5f, 0xf4, 0x00, 0x00, 0x00};

/// Account address of the stake history sysvar.
constexpr const stakehist::schema::pubkey_t& id() {
  return kStakeHistoryId;
}

bool check_id(const stakehist::schema::pubkey_t& key);

/// Largest serialized size of the sysvar account.
uint64_t size_of();

}  // namespace stakehist::sysvar
