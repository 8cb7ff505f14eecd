#pragma once
#include <stakehist/schema/primitives.hpp>
#include <stakehist/schema/read_error_code.hpp>
#include <algorithm>
#include <cstdint>
#include <iterator>
#include <string_view>

namespace stakehist::storage {

namespace detail {

/// Copy `length` bytes of `data` starting at `offset` into `out`.
inline stakehist::schema::read_error_code copy_range(
    stakehist::schema::mutable_bytes_view_t out,
    const stakehist::schema::bytes_view_t& data,
    uint64_t offset,
    uint64_t length) {
  if (out.size() < length) {
    return stakehist::schema::read_error_code::out_of_bounds;
  }
  if (offset > data.size() || length > data.size() - offset) {
    return stakehist::schema::read_error_code::out_of_bounds;
  }
  auto first = std::next(std::begin(data), static_cast<std::ptrdiff_t>(offset));
  std::copy_n(first, length, std::begin(out));
  return stakehist::schema::read_error_code::ok;
}

}  // namespace detail

/// Account data store holding external resources such as sysvars.
template <typename Library>
struct storage {
  /// Fill `out` with `length` bytes of account `id` starting at `offset`.
  ///
  /// Returns read_error_code::ok on success. A range that runs past the end
  /// of the stored data, or an `out` shorter than `length`, is
  /// read_error_code::out_of_bounds.
  stakehist::schema::read_error_code read(
      stakehist::schema::mutable_bytes_view_t out,
      const stakehist::schema::pubkey_t& id,
      uint64_t offset,
      uint64_t length) const;

  /// Replace the data of account `id`.
  void store(const stakehist::schema::pubkey_t& id,
             const stakehist::schema::bytes_view_t& data);
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace stakehist::storage
