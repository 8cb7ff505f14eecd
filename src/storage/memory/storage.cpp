#include <stakehist/storage/memory/storage.hpp>

namespace stakehist::storage {

stakehist::schema::read_error_code storage<memory_storage_tag>::read(
    stakehist::schema::mutable_bytes_view_t out,
    const stakehist::schema::pubkey_t& id,
    uint64_t offset,
    uint64_t length) const {
  auto it = accounts.find(id);
  if (it == std::end(accounts)) {
    return stakehist::schema::read_error_code::not_found;
  }
  return detail::copy_range(out, stakehist::schema::make_bytes_view(it->second),
                            offset, length);
}

void storage<memory_storage_tag>::store(
    const stakehist::schema::pubkey_t& id,
    const stakehist::schema::bytes_view_t& data) {
  accounts.insert_or_assign(id, stakehist::schema::make_bytes(data));
}

}  // namespace stakehist::storage
