#include "rawid/raw_id.hpp"

#include <cstdint>
#include <format>

#include <spdlog/spdlog.h>

#include "rawid/internal_error.hpp"

namespace rawid {

namespace detail {

void ThrowOutOfRange(const char* context, uint64_t value) {
  spdlog::error(
      "{}: rejected id {} (reserved range starts at {})", context, value,
      RawId::kMax);
  ThrowInternalError(
      context, std::format(
                   "value {} is out of range (must be < {})", value,
                   RawId::kMax));
}

}  // namespace detail

auto OptionalRawId::Value() const -> RawId {
  if (!HasValue()) {
    ThrowInternalError("OptionalRawId::Value", "no id present");
  }
  return RawId(repr_);
}

}  // namespace rawid
