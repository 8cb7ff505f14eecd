#pragma once
#include <stakehist/storage/storage.hpp>

namespace stakehist::storage {

/// Host that cannot expose raw account reads. Every read reports
/// read_error_code::unsupported instead of emulating one.
struct unsupported_storage_tag {};

template <>
struct storage<unsupported_storage_tag> final {
  stakehist::schema::read_error_code read(
      stakehist::schema::mutable_bytes_view_t,
      const stakehist::schema::pubkey_t&,
      uint64_t,
      uint64_t) const {
    return stakehist::schema::read_error_code::unsupported;
  }
};

}  // namespace stakehist::storage
