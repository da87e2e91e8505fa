#pragma once

#include <cassert>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "rawid/config.hpp"

namespace rawid {

namespace detail {

// Logs the rejected value and throws InternalError. Out of line so that the
// inline construction paths stay small.
[[noreturn]] void ThrowOutOfRange(const char* context, uint64_t value);

}  // namespace detail

class OptionalRawId;

// Opaque 32-bit key into a table of interned values. Usually wrapped in an
// InternKey<Tag> rather than passed around bare.
//
// The displayed value is always < kMax. Internally it is stored shifted by
// one, so the all-zero word is never a live RawId; OptionalRawId uses that
// word for "no id" and stays 4 bytes wide.
//
// Values from kMax up to UINT32_MAX are reserved. kMax may grow in later
// versions; callers must not attach meaning to the reserved band.
class RawId {
 public:
  static constexpr uint32_t kMax = 0xFFFF'FF00;

  // Throws InternalError if value >= kMax.
  static auto FromU32(uint32_t value) -> RawId {
    if (value >= kMax) {
      detail::ThrowOutOfRange("RawId::FromU32", value);
    }
    return RawId(value + 1);
  }

  // Throws InternalError if value >= kMax. The bound is compared at full
  // width, so large values are rejected rather than truncated.
  static auto FromUsize(std::size_t value) -> RawId {
    if (value >= static_cast<std::size_t>(kMax)) {
      detail::ThrowOutOfRange("RawId::FromUsize", value);
    }
    return RawId(static_cast<uint32_t>(value) + 1);
  }

  // Caller guarantees value < kMax. Only asserted in debug builds unless
  // RAWID_ALWAYS_CHECK is set.
  static auto FromU32Unchecked(uint32_t value) -> RawId {
    if constexpr (config::kAlwaysCheck) {
      return FromU32(value);
    } else {
      assert(value < kMax && "RawId::FromU32Unchecked: value out of range");
      return RawId(value + 1);
    }
  }

  static auto TryFromU32(uint32_t value) -> std::optional<RawId> {
    if (value >= kMax) {
      return std::nullopt;
    }
    return RawId(value + 1);
  }

  static auto TryFromUsize(std::size_t value) -> std::optional<RawId> {
    if (value >= static_cast<std::size_t>(kMax)) {
      return std::nullopt;
    }
    return RawId(static_cast<uint32_t>(value) + 1);
  }

  [[nodiscard]] auto AsU32() const -> uint32_t {
    return value_ - 1;
  }

  [[nodiscard]] auto AsUsize() const -> std::size_t {
    return static_cast<std::size_t>(AsU32());
  }

  explicit operator uint32_t() const {
    return AsU32();
  }

  [[nodiscard]] auto ToString() const -> std::string {
    return fmt::format("{}", AsU32());
  }

  auto operator==(const RawId&) const -> bool = default;
  auto operator<=>(const RawId&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, RawId id) -> H {
    return H::combine(std::move(h), id.AsU32());
  }

 private:
  friend class OptionalRawId;

  explicit RawId(uint32_t stored) : value_(stored) {
  }

  // Displayed value + 1, never zero.
  uint32_t value_;
};

inline auto operator<<(std::ostream& os, RawId id) -> std::ostream& {
  return os << id.AsU32();
}

// A RawId or nothing, in the same 4 bytes. Absent is stored as the zero
// word and orders before every present id.
class OptionalRawId {
 public:
  OptionalRawId() = default;
  // NOLINTNEXTLINE(google-explicit-constructor)
  OptionalRawId(RawId id) : repr_(id.value_) {
  }

  static auto None() -> OptionalRawId {
    return OptionalRawId();
  }

  [[nodiscard]] auto HasValue() const -> bool {
    return repr_ != 0;
  }

  explicit operator bool() const {
    return HasValue();
  }

  // Throws InternalError when empty.
  [[nodiscard]] auto Value() const -> RawId;

  [[nodiscard]] auto ValueOr(RawId fallback) const -> RawId {
    return HasValue() ? RawId(repr_) : fallback;
  }

  [[nodiscard]] auto ToString() const -> std::string {
    return HasValue() ? RawId(repr_).ToString() : std::string("None");
  }

  auto operator==(const OptionalRawId&) const -> bool = default;
  auto operator<=>(const OptionalRawId&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, OptionalRawId id) -> H {
    return H::combine(std::move(h), id.repr_);
  }

 private:
  uint32_t repr_ = 0;
};

static_assert(sizeof(RawId) == sizeof(uint32_t));
static_assert(sizeof(OptionalRawId) == sizeof(RawId));

inline auto operator<<(std::ostream& os, OptionalRawId id) -> std::ostream& {
  return os << id.ToString();
}

}  // namespace rawid

namespace std {
template <>
struct hash<rawid::RawId> {
  auto operator()(rawid::RawId id) const -> std::size_t {
    return std::hash<uint32_t>{}(id.AsU32());
  }
};

template <>
struct hash<rawid::OptionalRawId> {
  auto operator()(rawid::OptionalRawId id) const -> std::size_t {
    if (!id) {
      return 0;
    }
    return std::hash<rawid::RawId>{}(id.Value());
  }
};
}  // namespace std

template <>
struct fmt::formatter<rawid::RawId> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(rawid::RawId id, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", id.AsU32());
  }
};

template <>
struct fmt::formatter<rawid::OptionalRawId> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(rawid::OptionalRawId id, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", id.ToString());
  }
};
