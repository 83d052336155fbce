#include "dopt/policy/guess.hpp"
#include "dopt/set/OptSet.hpp"

namespace dopt::policy {

namespace {

// Length of the UTF-8 sequence starting with `lead`.
std::size_t utf8_len(char lead) {
  auto c = static_cast<unsigned char>(lead);
  if (c < 0x80) {
    return 1;
  }
  if ((c >> 5) == 0x6) {
    return 2;
  }
  if ((c >> 4) == 0xE) {
    return 3;
  }
  if ((c >> 3) == 0x1E) {
    return 4;
  }
  return 1;
}

// Byte offsets at which each character of `str` starts.
std::vector<std::size_t> char_starts(std::string_view str) {
  std::vector<std::size_t> starts;
  for (std::size_t i = 0; i < str.size(); i += utf8_len(str[i])) {
    starts.push_back(i);
  }
  return starts;
}

struct Namer {
  const OptSet &set;
  const lex::Token &tok;

  std::optional<memory::Symbol> prefix() const {
    return set.pool().find(*tok.prefix);
  }
  std::optional<memory::Symbol> sym(std::string_view name) const {
    return set.pool().find(name);
  }
  std::string hint(std::string_view name) const {
    return *tok.prefix + std::string(name);
  }

  OptMatch single(Style style, std::string_view name,
                  std::optional<std::string> arg, bool consume) const {
    return OptMatch(style, prefix(), sym(name), std::move(arg), tok.disabled,
                    consume, hint(name));
  }
};

} // namespace

std::optional<OptProcess> guess_opt(Style style, const lex::Token &tok,
                                    std::optional<std::string_view> next,
                                    const OptSet &set) {
  if (!tok.is_option()) {
    return std::nullopt;
  }
  Namer namer{set, tok};
  const std::string &name = *tok.name;

  switch (style) {
  case Style::EqualWithValue: {
    if (!tok.value) {
      return std::nullopt;
    }
    OptProcess proc(OptProcess::Mode::Single, style, false);
    proc.add_match(namer.single(style, name, tok.value, false));
    return proc;
  }
  case Style::Argument: {
    if (tok.value) {
      return std::nullopt;
    }
    // without a following token the match reports the missing value
    std::optional<std::string> arg;
    if (next) {
      arg = std::string(*next);
    }
    OptProcess proc(OptProcess::Mode::Single, style, next.has_value());
    proc.add_match(namer.single(style, name, std::move(arg), true));
    return proc;
  }
  case Style::Boolean:
  case Style::Flag: {
    if (tok.value) {
      return std::nullopt;
    }
    OptProcess proc(OptProcess::Mode::Single, style, false);
    proc.add_match(namer.single(style, name, std::nullopt, false));
    return proc;
  }
  case Style::EmbeddedValue: {
    if (tok.value) {
      return std::nullopt;
    }
    auto starts = char_starts(name);
    if (starts.size() < 2) {
      return std::nullopt;
    }
    std::string_view view = name;
    OptProcess proc(OptProcess::Mode::Single, style, false);
    proc.add_match(namer.single(style, view.substr(0, starts[1]),
                                std::string(view.substr(starts[1])), false));
    return proc;
  }
  case Style::EmbeddedValuePlus: {
    if (tok.value) {
      return std::nullopt;
    }
    auto starts = char_starts(name);
    if (starts.size() < 3) {
      return std::nullopt;
    }
    std::string_view view = name;
    OptProcess proc(OptProcess::Mode::Any, style, false);
    for (std::size_t i = 2; i < starts.size(); ++i) {
      proc.add_match(namer.single(style, view.substr(0, starts[i]),
                                  std::string(view.substr(starts[i])),
                                  false));
    }
    return proc;
  }
  case Style::CombinedOption: {
    if (tok.value) {
      return std::nullopt;
    }
    auto starts = char_starts(name);
    if (starts.size() < 2) {
      return std::nullopt;
    }
    std::string_view view = name;
    OptProcess proc(OptProcess::Mode::All, style, false);
    for (std::size_t i = 0; i < starts.size(); ++i) {
      std::size_t end = i + 1 < starts.size() ? starts[i + 1] : view.size();
      proc.add_match(namer.single(
          style, view.substr(starts[i], end - starts[i]), std::nullopt, false));
    }
    return proc;
  }
  case Style::Pos:
  case Style::Cmd:
  case Style::Main:
    break;
  }
  return std::nullopt;
}

NoaProcess guess_noa(Style style, const std::string &raw, std::size_t idx,
                     std::size_t total, const OptSet &set) {
  return NoaProcess(
      NoaMatch(style, set.pool().find(raw), raw, idx, total));
}

} // namespace dopt::policy
