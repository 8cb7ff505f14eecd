#pragma once
#include <stakehist/storage/storage.hpp>
#include <map>

namespace stakehist::storage {

struct memory_storage_tag {};

/// In-process account map. Reads are safe to run concurrently once the
/// accounts are loaded; `store` is not.
template <>
struct storage<memory_storage_tag> final {
  std::map<stakehist::schema::pubkey_t, stakehist::schema::bytes_t> accounts;

  stakehist::schema::read_error_code read(
      stakehist::schema::mutable_bytes_view_t out,
      const stakehist::schema::pubkey_t& id,
      uint64_t offset,
      uint64_t length) const;

  void store(const stakehist::schema::pubkey_t& id,
             const stakehist::schema::bytes_view_t& data);
};

}  // namespace stakehist::storage
