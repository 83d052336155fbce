#pragma once

#include <cstddef>
#include <fmt/format.h>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dopt {

// Position constraint of a non-option argument. Index 0 is the program
// name, so user visible positions start at 1.
class Index {
public:
  enum class Kind {
    Forward,
    Backward,
    List,
    Except,
    Range,
    AnyWhere,
    Null,
  };

private:
  struct Forward {
    std::size_t n;
  };
  struct Backward {
    std::size_t n;
  };
  struct List {
    std::vector<std::size_t> list;
  };
  struct Except {
    std::vector<std::size_t> list;
  };
  struct Range {
    std::optional<std::size_t> start;
    std::optional<std::size_t> end;
  };
  struct AnyWhere {};
  struct Null {};

  using Repr =
      std::variant<Forward, Backward, List, Except, Range, AnyWhere, Null>;

  explicit Index(Repr repr) : m_repr(std::move(repr)) {}

public:
  Index() : m_repr(Null{}) {}

  static Index forward(std::size_t n) { return Index{Forward{n}}; }
  static Index backward(std::size_t n) { return Index{Backward{n}}; }
  static Index list(std::vector<std::size_t> list) {
    return Index{List{std::move(list)}};
  }
  static Index except(std::vector<std::size_t> list) {
    return Index{Except{std::move(list)}};
  }
  static Index range(std::optional<std::size_t> start,
                     std::optional<std::size_t> end) {
    return Index{Range{start, end}};
  }
  static Index anywhere() { return Index{AnyWhere{}}; }
  static Index null() { return Index{Null{}}; }

  // Parses the textual form: "1", "+1", "-1", "[1,2]", "+[1,2]",
  // "-[1,2]", "1..5", "..5", "1..", "*".
  static Index parse(std::string_view str);

  Kind kind() const noexcept {
    return static_cast<Kind>(m_repr.index());
  }

  bool is_null() const noexcept { return kind() == Kind::Null; }

  // Returns true if position `idx` of `total` non-option arguments
  // satisfies the constraint.
  bool calc(std::size_t idx, std::size_t total) const;

  std::string to_string() const;

  friend bool operator==(const Index &lhs, const Index &rhs) {
    return lhs.to_string() == rhs.to_string();
  }

private:
  Repr m_repr;
};

} // namespace dopt

template <> struct fmt::formatter<dopt::Index> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const dopt::Index &index, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", index.to_string());
  }
};
