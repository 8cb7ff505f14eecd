#include <stakehist/schema/enum_string.hpp>
#include <stakehist/sysvar/offset_calculator.hpp>

#include <array>
#include <utility>
#include <variant>

namespace stakehist::sysvar {

namespace {

constexpr auto kRangeStatusNames =
    std::array<std::pair<std::string_view, range_status>, 5>{{
        {"available", range_status::available},
        {"no_history", range_status::no_history},
        {"aged_out", range_status::aged_out},
        {"not_yet_recorded", range_status::not_yet_recorded},
        {"offset_overflow", range_status::offset_overflow},
    }};

using resolution_t = std::variant<range_status, byte_range>;

resolution_t resolve(const stakehist::schema::epoch_t current_epoch,
                     const stakehist::schema::epoch_t target_epoch) {
  auto newest_recorded_epoch = checked_sub(current_epoch, 1);
  if (!newest_recorded_epoch) {
    return range_status::no_history;
  }
  auto oldest_recorded_epoch = saturating_sub(current_epoch, kMaxEntries);

  if (target_epoch < oldest_recorded_epoch) {
    return range_status::aged_out;
  }

  // Zero when the target is the newest recorded epoch.
  auto epoch_delta = checked_sub(*newest_recorded_epoch, target_epoch);
  if (!epoch_delta) {
    return range_status::not_yet_recorded;
  }

  auto offset = record_offset(*epoch_delta);
  if (!offset) {
    return range_status::offset_overflow;
  }
  return byte_range{.offset = *offset, .length = kRecordSize};
}

}  // namespace

std::string_view to_string(const range_status status) {
  return stakehist::schema::to_string(status, kRangeStatusNames)
      .value_or("unknown");
}

range_status classify_range(const stakehist::schema::epoch_t current_epoch,
                            const stakehist::schema::epoch_t target_epoch) {
  auto resolution = resolve(current_epoch, target_epoch);
  if (auto* status = std::get_if<range_status>(&resolution)) {
    return *status;
  }
  return range_status::available;
}

std::optional<byte_range> compute_range(
    const stakehist::schema::epoch_t current_epoch,
    const stakehist::schema::epoch_t target_epoch) {
  auto resolution = resolve(current_epoch, target_epoch);
  if (auto* range = std::get_if<byte_range>(&resolution)) {
    return *range;
  }
  return std::nullopt;
}

}  // namespace stakehist::sysvar
