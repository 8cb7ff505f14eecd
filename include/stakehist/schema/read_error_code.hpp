#pragma once

#include <cstdint>
#include <string_view>

// Schema type: read error code.
// Outcome of a raw byte-range read against an external account resource.
namespace stakehist::schema {

enum class read_error_code : uint32_t {
  ok = 0,
  unsupported = 1,
  not_found = 2,
  out_of_bounds = 3,
  backend_failure = 4,
};

std::string_view to_string(read_error_code code);

}  // namespace stakehist::schema
