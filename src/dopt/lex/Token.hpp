#pragma once

#include <fmt/format.h>
#include <optional>
#include <string>

namespace dopt::lex {

struct Token {
  std::optional<std::string> prefix;
  std::optional<std::string> name;
  std::optional<std::string> value;
  bool disabled = false;

  // A token takes part in option matching only with prefix and name.
  bool is_option() const noexcept {
    return prefix.has_value() && name.has_value();
  }
};

} // namespace dopt::lex

template <> struct fmt::formatter<dopt::lex::Token> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const dopt::lex::Token &tok, FormatContext &ctx) const {
    auto out = fmt::format_to(ctx.out(), "Token{{");
    if (tok.prefix) {
      out = fmt::format_to(out, "prefix=\"{}\"", *tok.prefix);
    } else {
      out = fmt::format_to(out, "prefix=none");
    }
    if (tok.disabled) {
      out = fmt::format_to(out, ", disabled");
    }
    if (tok.name) {
      out = fmt::format_to(out, ", name=\"{}\"", *tok.name);
    }
    if (tok.value) {
      out = fmt::format_to(out, ", value=\"{}\"", *tok.value);
    }
    return fmt::format_to(out, "}}");
  }
};
