#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <functional>
#include <limits>

namespace dopt {

struct Uid {
public:
  static constexpr std::uint64_t NullId{
      std::numeric_limits<std::uint64_t>::max()};

  explicit constexpr Uid() : m_id(NullId) {}
  explicit constexpr Uid(std::uint64_t id) : m_id(id) {}

  constexpr explicit operator std::uint64_t() const { return m_id; }

  constexpr explicit operator bool() const { return m_id != NullId; }

  constexpr std::uint64_t operator*() const { return m_id; }

  friend bool operator==(const Uid &lhs, const Uid &rhs) {
    return lhs.m_id == rhs.m_id;
  }

  friend bool operator!=(const Uid &lhs, const Uid &rhs) {
    return lhs.m_id != rhs.m_id;
  }

  friend bool operator<(const Uid &lhs, const Uid &rhs) {
    return lhs.m_id < rhs.m_id;
  }

private:
  std::uint64_t m_id;
};

} // namespace dopt

template <> struct std::hash<dopt::Uid> {
  std::size_t operator()(const dopt::Uid &uid) const noexcept {
    return std::hash<std::uint64_t>{}(*uid);
  }
};

template <> struct fmt::formatter<dopt::Uid> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const dopt::Uid &uid, FormatContext &ctx) const {
    if (!uid) {
      return fmt::format_to(ctx.out(), "<null>");
    }
    return fmt::format_to(ctx.out(), "<{}>", *uid);
  }
};
