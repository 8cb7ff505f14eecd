#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stakehist::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using mutable_bytes_view_t = std::span<uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using pubkey_t = hash32_t;
using epoch_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

/// Bitcoin-alphabet base58, as used for account addresses.
std::string to_base58(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base58(std::string_view encoded);
bytes_t from_base58(std::string_view encoded);

/// Parse a 32-byte public key from base58 text.
std::optional<pubkey_t> try_make_pubkey(std::string_view encoded);
pubkey_t make_pubkey(std::string_view encoded);

}  // namespace stakehist::schema
