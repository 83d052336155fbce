#include "dopt/memory/StringPool.hpp"

namespace dopt::memory {

Symbol StringPool::intern(std::string_view str) {
  auto it = m_index.find(str);
  if (it != m_index.end()) {
    return Symbol{it->second};
  }
  auto id = static_cast<std::uint32_t>(m_strings.size());
  const std::string &stored = m_strings.emplace_back(str);
  m_index.emplace(std::string_view{stored}, id);
  return Symbol{id};
}

std::optional<Symbol> StringPool::find(std::string_view str) const {
  auto it = m_index.find(str);
  if (it == m_index.end()) {
    return std::nullopt;
  }
  return Symbol{it->second};
}

} // namespace dopt::memory
