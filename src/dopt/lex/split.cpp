#include "dopt/lex/split.hpp"

namespace dopt::lex {

const std::string *longest_prefix(std::string_view raw,
                                  std::span<const std::string> prefixes) {
  const std::string *best = nullptr;
  for (const std::string &prefix : prefixes) {
    if (!raw.starts_with(prefix)) {
      continue;
    }
    if (best == nullptr || prefix.size() > best->size()) {
      best = &prefix;
    }
  }
  return best;
}

Token split(std::string_view raw, std::span<const std::string> prefixes) {
  Token tok;
  const std::string *prefix = longest_prefix(raw, prefixes);
  if (prefix == nullptr) {
    return tok;
  }
  tok.prefix = *prefix;

  std::string_view rest = raw.substr(prefix->size());
  if (!rest.empty() && rest.front() == DEACTIVATE_MARKER) {
    tok.disabled = true;
    rest.remove_prefix(1);
  }

  std::string_view name = rest;
  auto eq = rest.find('=');
  if (eq != std::string_view::npos) {
    name = rest.substr(0, eq);
    tok.value = std::string(rest.substr(eq + 1));
  }
  if (!name.empty()) {
    tok.name = std::string(name);
  }
  return tok;
}

} // namespace dopt::lex
