#pragma once

#include "dopt/opt/Style.hpp"
#include <algorithm>
#include <vector>

namespace dopt {

// Ordered list of the option styles tried for every prefixed token.
class StyleCatalog {
public:
  StyleCatalog()
      : m_styles{Style::EqualWithValue, Style::Argument, Style::Boolean,
                 Style::EmbeddedValue} {}

  explicit StyleCatalog(std::vector<Style> styles)
      : m_styles(std::move(styles)) {}

  // Appends `style` unless it is already enabled.
  StyleCatalog &push(Style style) {
    if (!contains(style)) {
      m_styles.push_back(style);
    }
    return *this;
  }

  StyleCatalog &insert(std::size_t pos, Style style) {
    remove(style);
    pos = std::min(pos, m_styles.size());
    m_styles.insert(m_styles.begin() + static_cast<std::ptrdiff_t>(pos),
                    style);
    return *this;
  }

  StyleCatalog &remove(Style style) {
    m_styles.erase(std::remove(m_styles.begin(), m_styles.end(), style),
                   m_styles.end());
    return *this;
  }

  bool contains(Style style) const {
    return std::find(m_styles.begin(), m_styles.end(), style) !=
           m_styles.end();
  }

  std::size_t size() const noexcept { return m_styles.size(); }
  auto begin() const noexcept { return m_styles.begin(); }
  auto end() const noexcept { return m_styles.end(); }

private:
  std::vector<Style> m_styles;
};

} // namespace dopt
