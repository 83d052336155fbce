#pragma once

#include <fmt/format.h>
#include <string_view>

namespace dopt {

enum class Style {
  EqualWithValue,
  Argument,
  Boolean,
  Flag,
  EmbeddedValue,
  EmbeddedValuePlus,
  CombinedOption,
  Pos,
  Cmd,
  Main,
};

// Styles matched against non-option arguments.
constexpr bool is_noa_style(Style style) noexcept {
  return style == Style::Pos || style == Style::Cmd || style == Style::Main;
}

// Styles whose value is the activation state rather than a parsed string.
constexpr bool is_boolean_style(Style style) noexcept {
  return style == Style::Boolean || style == Style::CombinedOption;
}

// The style an option must support to be bound through a token of the
// given catalog style. Every way of carrying a value in the token binds
// as Argument.
constexpr Style binding_style(Style style) noexcept {
  switch (style) {
  case Style::EqualWithValue:
  case Style::EmbeddedValue:
  case Style::EmbeddedValuePlus:
    return Style::Argument;
  default:
    return style;
  }
}

constexpr std::string_view style_name(Style style) noexcept {
  switch (style) {
  case Style::EqualWithValue:
    return "EqualWithValue";
  case Style::Argument:
    return "Argument";
  case Style::Boolean:
    return "Boolean";
  case Style::Flag:
    return "Flag";
  case Style::EmbeddedValue:
    return "EmbeddedValue";
  case Style::EmbeddedValuePlus:
    return "EmbeddedValuePlus";
  case Style::CombinedOption:
    return "CombinedOption";
  case Style::Pos:
    return "Pos";
  case Style::Cmd:
    return "Cmd";
  case Style::Main:
    return "Main";
  }
  return "?";
}

} // namespace dopt

template <> struct fmt::formatter<dopt::Style> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(dopt::Style style, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(dopt::style_name(style),
                                                    ctx);
  }
};
