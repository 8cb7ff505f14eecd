#include <stakehist/sysvar/layout.hpp>
#include <stakehist/sysvar/sysvar_id.hpp>

namespace stakehist::sysvar {

bool check_id(const stakehist::schema::pubkey_t& key) {
  return key == id();
}

uint64_t size_of() {
  return total_size();
}

}  // namespace stakehist::sysvar
