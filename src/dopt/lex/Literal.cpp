#include "dopt/lex/Literal.hpp"
#include <charconv>

namespace dopt::lex {

std::optional<bool> Literal::parse_bool() const noexcept {
  auto sv = view();
  if (sv == "true" || sv == "1" || sv == "yes") {
    return true;
  }
  if (sv == "false" || sv == "0" || sv == "no") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::int64_t> Literal::parse_signed() const noexcept {
  auto sv = view();
  if (!sv.empty() && sv[0] == '+') {
    sv.remove_prefix(1);
  }
  if (sv.empty()) {
    return std::nullopt;
  }

  std::int64_t tmp{};
  auto res = std::from_chars(sv.data(), sv.data() + sv.size(), tmp);
  if (res.ec != std::errc{} || res.ptr != sv.data() + sv.size()) {
    return std::nullopt;
  }
  return tmp;
}

std::optional<std::uint64_t> Literal::parse_unsigned() const noexcept {
  auto sv = view();
  if (!sv.empty() && sv[0] == '+') {
    sv.remove_prefix(1);
  }
  if (sv.empty() || sv[0] == '-') {
    return std::nullopt;
  }

  std::uint64_t tmp{};
  auto res = std::from_chars(sv.data(), sv.data() + sv.size(), tmp);
  if (res.ec != std::errc{} || res.ptr != sv.data() + sv.size()) {
    return std::nullopt;
  }
  return tmp;
}

std::optional<double> Literal::parse_float() const noexcept {
  auto sv = view();
  if (!sv.empty() && sv[0] == '+') {
    sv.remove_prefix(1);
  }
  if (sv.empty()) {
    return std::nullopt;
  }

  double tmp{};
  auto res = std::from_chars(sv.data(), sv.data() + sv.size(), tmp);
  if (res.ec != std::errc{} || res.ptr != sv.data() + sv.size()) {
    return std::nullopt;
  }
  return tmp;
}

} // namespace dopt::lex
