#include "dopt/opt/Index.hpp"
#include "dopt/diag/Error.hpp"
#include "dopt/lex/Literal.hpp"
#include <algorithm>
#include <fmt/ranges.h>

namespace dopt {

static std::size_t parse_position(std::string_view whole,
                                  std::string_view num) {
  auto value = lex::Literal{num}.parse_unsigned();
  if (!value || (num.front() == '+' || num.front() == '-')) {
    throw Error::invalid_index(whole,
                               fmt::format("`{}` is not a position", num));
  }
  return static_cast<std::size_t>(*value);
}

static std::vector<std::size_t> parse_list(std::string_view whole,
                                           std::string_view body) {
  if (body.size() < 2 || body.front() != '[' || body.back() != ']') {
    throw Error::invalid_index(whole, "expected a list like [1,2]");
  }
  body = body.substr(1, body.size() - 2);
  std::vector<std::size_t> list;
  while (!body.empty()) {
    auto comma = body.find(',');
    std::string_view item = body.substr(0, comma);
    while (!item.empty() && item.front() == ' ') {
      item.remove_prefix(1);
    }
    while (!item.empty() && item.back() == ' ') {
      item.remove_suffix(1);
    }
    if (item.empty()) {
      throw Error::invalid_index(whole, "empty list item");
    }
    list.push_back(parse_position(whole, item));
    if (comma == std::string_view::npos) {
      break;
    }
    body.remove_prefix(comma + 1);
  }
  if (list.empty()) {
    throw Error::invalid_index(whole, "empty list");
  }
  return list;
}

Index Index::parse(std::string_view str) {
  if (str.empty()) {
    throw Error::invalid_index(str, "empty index");
  }
  if (str == "*") {
    return anywhere();
  }
  if (auto dots = str.find(".."); dots != std::string_view::npos) {
    std::string_view lhs = str.substr(0, dots);
    std::string_view rhs = str.substr(dots + 2);
    std::optional<std::size_t> start;
    std::optional<std::size_t> end;
    if (!lhs.empty()) {
      start = parse_position(str, lhs);
    }
    if (!rhs.empty()) {
      end = parse_position(str, rhs);
    }
    if (start && end && *start >= *end) {
      throw Error::invalid_index(str, "range is empty");
    }
    return range(start, end);
  }
  if (str.front() == '[') {
    return list(parse_list(str, str));
  }
  if (str.front() == '+' && str.size() > 1 && str[1] == '[') {
    return list(parse_list(str, str.substr(1)));
  }
  if (str.front() == '-' && str.size() > 1 && str[1] == '[') {
    return except(parse_list(str, str.substr(1)));
  }
  if (str.front() == '-') {
    std::size_t n = parse_position(str, str.substr(1));
    if (n == 0) {
      throw Error::invalid_index(str, "backward index starts at 1");
    }
    return backward(n);
  }
  if (str.front() == '+') {
    return forward(parse_position(str, str.substr(1)));
  }
  return forward(parse_position(str, str));
}

bool Index::calc(std::size_t idx, std::size_t total) const {
  switch (kind()) {
  case Kind::Forward:
    return std::get<Forward>(m_repr).n == idx;
  case Kind::Backward: {
    std::size_t n = std::get<Backward>(m_repr).n;
    return n <= total && total - n == idx && idx > 0;
  }
  case Kind::List: {
    const auto &list = std::get<List>(m_repr).list;
    return std::find(list.begin(), list.end(), idx) != list.end();
  }
  case Kind::Except: {
    const auto &list = std::get<Except>(m_repr).list;
    return idx > 0 && idx < total &&
           std::find(list.begin(), list.end(), idx) == list.end();
  }
  case Kind::Range: {
    const auto &r = std::get<Range>(m_repr);
    return idx >= r.start.value_or(1) && (!r.end || idx < *r.end);
  }
  case Kind::AnyWhere:
    return true;
  case Kind::Null:
    return false;
  }
  return false;
}

std::string Index::to_string() const {
  switch (kind()) {
  case Kind::Forward:
    return fmt::format("{}", std::get<Forward>(m_repr).n);
  case Kind::Backward:
    return fmt::format("-{}", std::get<Backward>(m_repr).n);
  case Kind::List:
    return fmt::format("[{}]", fmt::join(std::get<List>(m_repr).list, ","));
  case Kind::Except:
    return fmt::format("-[{}]",
                       fmt::join(std::get<Except>(m_repr).list, ","));
  case Kind::Range: {
    const auto &r = std::get<Range>(m_repr);
    return fmt::format("{}..{}", r.start ? fmt::format("{}", *r.start) : "",
                       r.end ? fmt::format("{}", *r.end) : "");
  }
  case Kind::AnyWhere:
    return "*";
  case Kind::Null:
    return "";
  }
  return "";
}

} // namespace dopt
