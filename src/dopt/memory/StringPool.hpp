#pragma once

#include <cstdint>
#include <deque>
#include <fmt/format.h>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dopt::memory {

struct Symbol {
public:
  explicit constexpr Symbol(std::uint32_t id) : m_id(id) {}

  constexpr std::uint32_t operator*() const { return m_id; }

  friend bool operator==(const Symbol &lhs, const Symbol &rhs) {
    return lhs.m_id == rhs.m_id;
  }

  friend bool operator!=(const Symbol &lhs, const Symbol &rhs) {
    return lhs.m_id != rhs.m_id;
  }

private:
  std::uint32_t m_id;
};

// Interns strings once; every Symbol handed out stays valid for the
// lifetime of the pool.
class StringPool {
public:
  StringPool() = default;
  StringPool(const StringPool &) = delete;
  StringPool &operator=(const StringPool &) = delete;
  StringPool(StringPool &&) = default;
  StringPool &operator=(StringPool &&) = default;

  Symbol intern(std::string_view str);

  std::optional<Symbol> find(std::string_view str) const;

  std::string_view str(Symbol sym) const { return m_strings.at(*sym); }

  std::size_t size() const noexcept { return m_strings.size(); }

private:
  std::deque<std::string> m_strings;
  std::unordered_map<std::string_view, std::uint32_t> m_index;
};

} // namespace dopt::memory

template <> struct fmt::formatter<dopt::memory::Symbol> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const dopt::memory::Symbol &sym, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "#{}", *sym);
  }
};
