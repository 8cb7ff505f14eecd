#include <stakehist/common/critical.hpp>
#include <stakehist/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace stakehist::schema {

namespace {

constexpr auto kBase58Alphabet = std::string_view{
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<uint8_t> base58_digit(const char c) {
  auto position = kBase58Alphabet.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    stakehist::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base58(const bytes_view_t& bytes) {
  auto leading_zeros = static_cast<std::size_t>(std::distance(
      std::begin(bytes),
      std::find_if(std::begin(bytes), std::end(bytes),
                   [](const uint8_t byte) { return byte != 0; })));

  // log(256) / log(58) rounded up.
  auto digits = std::vector<uint8_t>(
      ((bytes.size() - leading_zeros) * 138 / 100) + 1, 0);
  for (auto i = leading_zeros; i < bytes.size(); ++i) {
    auto carry = static_cast<uint32_t>(bytes[i]);
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
      carry += 256u * *it;
      *it = static_cast<uint8_t>(carry % 58u);
      carry /= 58u;
    }
  }

  auto first = std::find_if(std::begin(digits), std::end(digits),
                            [](const uint8_t digit) { return digit != 0; });
  auto out = std::string(leading_zeros, kBase58Alphabet[0]);
  out.reserve(leading_zeros +
              static_cast<std::size_t>(std::distance(first, std::end(digits))));
  for (auto it = first; it != std::end(digits); ++it) {
    out.push_back(kBase58Alphabet[*it]);
  }
  return out;
}

std::optional<bytes_t> try_from_base58(const std::string_view encoded) {
  auto leading_ones = encoded.find_first_not_of(kBase58Alphabet[0]);
  if (leading_ones == std::string_view::npos) {
    return bytes_t(encoded.size(), 0);
  }

  // log(58) / log(256) rounded up.
  auto value = bytes_t(((encoded.size() - leading_ones) * 733 / 1000) + 1, 0);
  for (auto i = leading_ones; i < encoded.size(); ++i) {
    auto digit = base58_digit(encoded[i]);
    if (!digit) {
      return std::nullopt;
    }
    auto carry = static_cast<uint32_t>(*digit);
    for (auto it = value.rbegin(); it != value.rend(); ++it) {
      carry += 58u * *it;
      *it = static_cast<uint8_t>(carry & 0xFFu);
      carry >>= 8u;
    }
    if (carry != 0) {
      return std::nullopt;
    }
  }

  auto first = std::find_if(std::begin(value), std::end(value),
                            [](const uint8_t byte) { return byte != 0; });
  auto decoded = bytes_t(leading_ones, 0);
  decoded.insert(std::end(decoded), first, std::end(value));
  return decoded;
}

bytes_t from_base58(const std::string_view encoded) {
  auto decoded = try_from_base58(encoded);
  if (!decoded.has_value()) {
    stakehist::common::critical("invalid base58 input");
  }
  return *decoded;
}

std::optional<pubkey_t> try_make_pubkey(const std::string_view encoded) {
  auto decoded = try_from_base58(encoded);
  if (!decoded || decoded->size() != pubkey_t{}.size()) {
    return std::nullopt;
  }
  auto key = pubkey_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(key));
  return key;
}

pubkey_t make_pubkey(const std::string_view encoded) {
  auto key = try_make_pubkey(encoded);
  if (!key.has_value()) {
    stakehist::common::critical("make_pubkey expected a 32 byte base58 key");
  }
  return *key;
}

}  // namespace stakehist::schema
