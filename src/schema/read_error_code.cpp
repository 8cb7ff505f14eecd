#include <stakehist/schema/enum_string.hpp>
#include <stakehist/schema/read_error_code.hpp>

namespace stakehist::schema {

namespace {

constexpr auto kReadErrorCodeNames =
    std::array<std::pair<std::string_view, read_error_code>, 5>{{
        {"ok", read_error_code::ok},
        {"unsupported", read_error_code::unsupported},
        {"not_found", read_error_code::not_found},
        {"out_of_bounds", read_error_code::out_of_bounds},
        {"backend_failure", read_error_code::backend_failure},
    }};

}  // namespace

std::string_view to_string(const read_error_code code) {
  return stakehist::schema::to_string(code, kReadErrorCodeNames)
      .value_or("unknown");
}

}  // namespace stakehist::schema
