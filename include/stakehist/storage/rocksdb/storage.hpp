#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <stakehist/common/critical.hpp>
#include <stakehist/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace stakehist::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const stakehist::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

/// Accounts keyed by their raw 32 byte address.
template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  stakehist::schema::read_error_code read(
      stakehist::schema::mutable_bytes_view_t out,
      const stakehist::schema::pubkey_t& id,
      uint64_t offset,
      uint64_t length) const;

  void store(const stakehist::schema::pubkey_t& id,
             const stakehist::schema::bytes_view_t& data) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline stakehist::schema::read_error_code storage<rocksdb_storage_tag>::read(
    stakehist::schema::mutable_bytes_view_t out,
    const stakehist::schema::pubkey_t& id,
    uint64_t offset,
    uint64_t length) const {
  if (!database) {
    stakehist::common::critical("RocksDB database is not initialized");
  }
  auto value = ROCKSDB_NAMESPACE::PinnableSlice{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              database->DefaultColumnFamily(),
                              detail::to_slice(id), &value);
  if (status.IsNotFound()) {
    return stakehist::schema::read_error_code::not_found;
  }
  if (!status.ok()) {
    spdlog::error("Failed to read account from RocksDB: {}", status.ToString());
    return stakehist::schema::read_error_code::backend_failure;
  }
  return detail::copy_range(
      out,
      stakehist::schema::bytes_view_t{
          reinterpret_cast<const uint8_t*>(value.data()), value.size()},
      offset, length);
}

inline void storage<rocksdb_storage_tag>::store(
    const stakehist::schema::pubkey_t& id,
    const stakehist::schema::bytes_view_t& data) const {
  if (!database) {
    stakehist::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(id), detail::to_slice(data));
  if (!status.ok()) {
    spdlog::error("Failed to put account into RocksDB: {}", status.ToString());
    stakehist::common::critical("Failed to put account into RocksDB");
  }
}

}  // namespace stakehist::storage
