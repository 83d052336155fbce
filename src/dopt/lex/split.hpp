#pragma once

#include "dopt/lex/Token.hpp"
#include <span>
#include <string>
#include <string_view>

namespace dopt::lex {

inline constexpr char DEACTIVATE_MARKER = '/';

// Splits one raw argument. `prefixes` may be given in any order, the
// longest matching prefix wins.
Token split(std::string_view raw, std::span<const std::string> prefixes);

// Returns the longest member of `prefixes` that `raw` starts with.
const std::string *longest_prefix(std::string_view raw,
                                  std::span<const std::string> prefixes);

} // namespace dopt::lex
