#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "rawid/raw_id.hpp"

namespace rawid {

// Typed key for one interning table. Tag is any (usually empty) struct
// naming the table, so keys of different tables cannot be mixed up:
//
//   struct SymbolTag {};
//   using SymbolKey = InternKey<SymbolTag>;
template <typename Tag>
class InternKey {
 public:
  using TagType = Tag;

  static auto FromRawId(RawId id) -> InternKey {
    return InternKey(id);
  }

  static auto FromU32(uint32_t value) -> InternKey {
    return InternKey(RawId::FromU32(value));
  }

  static auto FromUsize(std::size_t value) -> InternKey {
    return InternKey(RawId::FromUsize(value));
  }

  [[nodiscard]] auto AsRawId() const -> RawId {
    return id_;
  }

  [[nodiscard]] auto AsU32() const -> uint32_t {
    return id_.AsU32();
  }

  [[nodiscard]] auto AsUsize() const -> std::size_t {
    return id_.AsUsize();
  }

  [[nodiscard]] auto ToString() const -> std::string {
    return id_.ToString();
  }

  auto operator==(const InternKey&) const -> bool = default;
  auto operator<=>(const InternKey&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, InternKey key) -> H {
    return H::combine(std::move(h), key.id_);
  }

 private:
  explicit InternKey(RawId id) : id_(id) {
  }

  RawId id_;
};

template <typename Tag>
auto operator<<(std::ostream& os, InternKey<Tag> key) -> std::ostream& {
  return os << key.AsRawId();
}

}  // namespace rawid

namespace std {
template <typename Tag>
struct hash<rawid::InternKey<Tag>> {
  auto operator()(rawid::InternKey<Tag> key) const -> std::size_t {
    return std::hash<rawid::RawId>{}(key.AsRawId());
  }
};
}  // namespace std

template <typename Tag>
struct fmt::formatter<rawid::InternKey<Tag>> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(rawid::InternKey<Tag> key, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", key.AsRawId());
  }
};
