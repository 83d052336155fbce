#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dopt::lex {

class Literal {
public:
  explicit Literal(std::string_view value) : m_value(value) {}

  std::string_view view() const noexcept { return m_value; }

  std::optional<bool> parse_bool() const noexcept;
  std::optional<std::int64_t> parse_signed() const noexcept;
  std::optional<std::uint64_t> parse_unsigned() const noexcept;
  std::optional<double> parse_float() const noexcept;

private:
  std::string_view m_value;
};

} // namespace dopt::lex
